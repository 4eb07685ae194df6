#include "protocol.hpp"
#include "workspace.hpp"

const std::string eom_token = "<|EOM|>";
const std::string malformed_message =
  "Error: ProtocolError: Invalid message format. Expected 'session_id|code'.";

Decoded decode_request(const std::string& message) {
  Decoded ret;
  size_t pos = message.find(delimiter);
  if (pos == std::string::npos) {
    ret.error = malformed_message;
    return ret;
  }
  std::string session_id = message.substr(0, pos);
  if (!valid_session_id(session_id)) {
    std::string shown = session_id.size() > 64 ? session_id.substr(0, 64) + "..." : session_id;
    ret.error = format_error("ProtocolError", "invalid session id '" + shown + "'");
    return ret;
  }
  ret.request = Request {session_id, message.substr(pos + 1)};
  return ret;
}

std::ostream& operator<<(std::ostream& os, const ResponseFormat& format) {
  switch (format) {
  case ResponseFormat::text:
    return os << "text";
  case ResponseFormat::json:
    return os << "json";
  }
  return os;
}

std::string render(const ExecutionResult& result, ResponseFormat format) {
  if (format == ResponseFormat::json) {
    // submitted code may print invalid utf-8.
    return result.to_json().dump(-1, ' ', false, json::error_handler_t::replace);
  }
  return result.text();
}

std::optional<std::string> FrameBuffer::next() {
  size_t pos = unprocessed.find(eom_token);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  std::string ret = unprocessed.substr(0, pos);
  unprocessed.erase(0, pos + eom_token.size());
  return ret;
}
