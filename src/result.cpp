#include "result.hpp"

#include <algorithm>
#include <cctype>

const std::string success_message = "Success: Code executed with no output.";
const std::string timeout_message = "Error: Execution timed out";

std::string to_string(FaultKind kind) {
  switch (kind) {
  case FaultKind::None:
    return "None";
  case FaultKind::ProtocolError:
    return "ProtocolError";
  case FaultKind::ExecutionFault:
    return "ExecutionFault";
  case FaultKind::ResourceExceeded:
    return "ResourceExceeded";
  case FaultKind::Timeout:
    return "Timeout";
  case FaultKind::CapabilityDenied:
    return "CapabilityDenied";
  case FaultKind::InternalError:
    return "InternalError";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& os, const FaultKind& kind) {
  return os << to_string(kind);
}

std::string format_error(const std::string& kind, const std::string& detail) {
  return "Error: " + kind + ": " + detail;
}

std::string ExecutionResult::text() const {
  if (!success) {
    return error;
  }
  std::string ret = output + errors;
  bool blank = std::all_of(ret.begin(), ret.end(), [](unsigned char c) { return std::isspace(c); });
  return blank ? success_message : ret;
}

json ExecutionResult::to_json() const {
  json j;
  j["success"] = success;
  j["kind"] = to_string(kind);
  j["output"] = success ? text() : output + errors;
  j["error"] = error;
  j["artifacts"] = artifacts;
  j["duration_ms"] = duration.count();
  return j;
}
