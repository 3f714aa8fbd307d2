#ifndef __WT_RELAY_MESSAGES__
#define __WT_RELAY_MESSAGES__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace wt {
/**
 * @brief A client message that could not be decoded.  The code is sent back
 * to the client in an `error` message.
 */
class MessageError : public std::runtime_error {
 public:
  MessageError(const string &_code, const string &message)
      : std::runtime_error(message), code(_code) {}

  const string &getCode() const { return code; }

 protected:
  string code;
};

/**
 * @brief Decodes a terminal channel message.
 * @throws MessageError INVALID_MESSAGE for malformed JSON or fields,
 * UNKNOWN_MESSAGE_TYPE for a tag outside the terminal protocol.
 */
TerminalClientMessage decodeTerminalMessage(const string &text);

/** @brief Decodes a collaboration channel message, see
 * decodeTerminalMessage. */
CollabClientMessage decodeCollabMessage(const string &text);

string encodeConnectionEstablished(const string &sessionId);
string encodeScrollback(const vector<string> &lines);
/** @brief `session:status` with whichever of pid / exitCode is known. */
string encodeStatus(SessionStatus status, optional<int> pid,
                    optional<int> exitCode);
string encodeOutput(const string &data, int64_t timestampMs);
/** @brief Process level failure, sent as `session:error`. */
string encodeSessionError(const string &code, const string &message);
/** @brief Protocol level failure, sent as `error`. */
string encodeError(const string &code, const string &message);
string encodePong();
string encodePresence(const json &collaborators);
/**
 * @brief Builds a relayed `collab:chat`, `collab:cursor` or `collab:typing`
 * message stamped with the sender's user id.
 */
string encodeCollabRelay(const CollabClientMessage &message,
                         const string &userId);
}  // namespace wt

#endif  // __WT_RELAY_MESSAGES__
