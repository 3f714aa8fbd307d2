#include "RelayMessages.hpp"

#include "SessionKey.hpp"

namespace wt {
namespace {
json parseEnvelope(const string &text, string *type) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error &) {
    throw MessageError("INVALID_MESSAGE", "Invalid message format");
  }
  if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
    throw MessageError("INVALID_MESSAGE", "Message has no type");
  }
  *type = j["type"].get<string>();
  return j;
}

const json &requireField(const json &j, const char *name) {
  auto it = j.find(name);
  if (it == j.end()) {
    throw MessageError("INVALID_MESSAGE",
                       string("Missing field ") + name);
  }
  return *it;
}

int requirePositiveInt(const json &j, const char *name) {
  const json &value = requireField(j, name);
  if (!value.is_number_integer() || value.get<int64_t>() <= 0 ||
      value.get<int64_t>() > MAX_TERMINAL_DIMENSION) {
    throw MessageError("INVALID_MESSAGE",
                       string("Field ") + name + " must be a positive integer");
  }
  return value.get<int>();
}

string optionalString(const json &j, const char *name) {
  auto it = j.find(name);
  if (it == j.end() || !it->is_string()) {
    return "";
  }
  return it->get<string>();
}

string encode(const json &j) { return dumpJson(j); }
}  // namespace

TerminalClientMessage decodeTerminalMessage(const string &text) {
  string type;
  json j = parseEnvelope(text, &type);
  TerminalClientMessage message;
  if (type == "terminal:input") {
    const json &data = requireField(j, "data");
    if (!data.is_string()) {
      throw MessageError("INVALID_MESSAGE", "Field data must be a string");
    }
    message.mutable_input()->set_data(data.get<string>());
  } else if (type == "terminal:resize") {
    message.mutable_resize()->set_cols(requirePositiveInt(j, "cols"));
    message.mutable_resize()->set_rows(requirePositiveInt(j, "rows"));
  } else if (type == "terminal:signal") {
    const json &signal = requireField(j, "signal");
    auto parsed = signal.is_string()
                      ? parseTerminalSignal(signal.get<string>())
                      : nullopt;
    if (!parsed) {
      throw MessageError("INVALID_MESSAGE", "Unknown signal");
    }
    message.mutable_signal_request()->set_signal_kind(*parsed);
  } else if (type == "ping") {
    message.mutable_ping();
  } else {
    throw MessageError("UNKNOWN_MESSAGE_TYPE",
                       "Unknown message type: " + type);
  }
  return message;
}

CollabClientMessage decodeCollabMessage(const string &text) {
  string type;
  json j = parseEnvelope(text, &type);
  CollabClientMessage message;
  if (type == "collab:join") {
    message.mutable_join()->set_user_name(optionalString(j, "userName"));
    message.mutable_join()->set_user_color(optionalString(j, "userColor"));
  } else if (type == "collab:chat") {
    message.mutable_chat()->set_message_json(
        encode(requireField(j, "message")));
  } else if (type == "collab:cursor") {
    message.mutable_cursor()->set_cursor_json(
        encode(requireField(j, "cursor")));
  } else if (type == "collab:typing") {
    const json &isTyping = requireField(j, "isTyping");
    if (!isTyping.is_boolean()) {
      throw MessageError("INVALID_MESSAGE",
                         "Field isTyping must be a boolean");
    }
    message.mutable_typing()->set_is_typing(isTyping.get<bool>());
  } else if (type == "collab:heartbeat") {
    message.mutable_heartbeat();
  } else if (type == "ping") {
    message.mutable_ping();
  } else {
    throw MessageError("UNKNOWN_MESSAGE_TYPE",
                       "Unknown message type: " + type);
  }
  return message;
}

string encodeConnectionEstablished(const string &sessionId) {
  return encode({{"type", "connection:established"}, {"sessionId", sessionId}});
}

string encodeScrollback(const vector<string> &lines) {
  return encode({{"type", "terminal:scrollback"}, {"data", lines}});
}

string encodeStatus(SessionStatus status, optional<int> pid,
                    optional<int> exitCode) {
  json j = {{"type", "session:status"}, {"status", sessionStatusName(status)}};
  if (pid) {
    j["pid"] = *pid;
  }
  if (exitCode) {
    j["exitCode"] = *exitCode;
  }
  return encode(j);
}

string encodeOutput(const string &data, int64_t timestampMs) {
  return encode(
      {{"type", "terminal:output"}, {"data", data}, {"timestamp", timestampMs}});
}

string encodeSessionError(const string &code, const string &message) {
  return encode(
      {{"type", "session:error"}, {"code", code}, {"message", message}});
}

string encodeError(const string &code, const string &message) {
  return encode({{"type", "error"}, {"code", code}, {"message", message}});
}

string encodePong() { return encode({{"type", "pong"}}); }

string encodePresence(const json &collaborators) {
  return encode(
      {{"type", "collab:presence"}, {"collaborators", collaborators}});
}

string encodeCollabRelay(const CollabClientMessage &message,
                         const string &userId) {
  json j;
  switch (message.payload_case()) {
    case CollabClientMessage::kChat:
      j["type"] = "collab:chat";
      j["message"] = json::parse(message.chat().message_json());
      break;
    case CollabClientMessage::kCursor:
      j["type"] = "collab:cursor";
      j["cursor"] = json::parse(message.cursor().cursor_json());
      break;
    case CollabClientMessage::kTyping:
      j["type"] = "collab:typing";
      j["isTyping"] = message.typing().is_typing();
      break;
    default:
      STFATAL << "Message is not relayed: " << int(message.payload_case());
  }
  j["userId"] = userId;
  return encode(j);
}
}  // namespace wt
