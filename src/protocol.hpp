#pragma once
#include <optional>
#include <string>

#include "result.hpp"

constexpr char delimiter = '|';

extern const std::string eom_token;
extern const std::string malformed_message;

struct Request {
  std::string session_id;
  std::string code;
};

// either a request, or the protocol error to send back instead.
struct Decoded {
  std::optional<Request> request;
  std::string error;
};

// "session_id|code". only the first delimiter split, code may contain more of them.
Decoded decode_request(const std::string& message);

inline std::string encode_response(const std::string& body) {
  return body + eom_token;
}

enum class ResponseFormat { text, json };

std::ostream& operator<<(std::ostream& os, const ResponseFormat& format);

std::string render(const ExecutionResult& result, ResponseFormat format);

// bytes received on a connection that do not yet form a complete message.
struct FrameBuffer {
  std::string unprocessed;
  void accept(const char* data, size_t n) {
    unprocessed.append(data, n);
  }
  // pop the next message terminated by eom_token, without the token.
  std::optional<std::string> next();
  // everything buffered, for a peer that does not send eom_token.
  std::string take() {
    std::string ret;
    ret.swap(unprocessed);
    return ret;
  }
  bool empty() const {
    return unprocessed.empty();
  }
  size_t size() const {
    return unprocessed.size();
  }
};
