#ifndef __WT_SESSION_ERROR__
#define __WT_SESSION_ERROR__

#include "Headers.hpp"

namespace wt {
enum class SessionErrorCode {
  ALREADY_RUNNING,
  NOT_FOUND,
  EXECUTABLE_NOT_FOUND,
  INVALID_WORK_DIR,
  SPAWN_FAILED,
};

/**
 * @brief Error raised by SessionManager operations that the caller must
 * handle.  Benign races (resize or signal after exit) never raise.
 */
class SessionError : public std::runtime_error {
 public:
  SessionError(SessionErrorCode _code, const string &message)
      : std::runtime_error(message), code(_code) {}

  SessionErrorCode getCode() const { return code; }

  /** @brief True for failures to bring up the process at all. */
  bool isSpawnFailure() const {
    return code == SessionErrorCode::EXECUTABLE_NOT_FOUND ||
           code == SessionErrorCode::INVALID_WORK_DIR ||
           code == SessionErrorCode::SPAWN_FAILED;
  }

 protected:
  SessionErrorCode code;
};
}  // namespace wt

#endif  // __WT_SESSION_ERROR__
