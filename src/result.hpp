#pragma once
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "util.hpp"

enum class FaultKind { None, ProtocolError, ExecutionFault, ResourceExceeded, Timeout, CapabilityDenied, InternalError };

std::string to_string(FaultKind kind);

std::ostream& operator<<(std::ostream& os, const FaultKind& kind);

// thrown by host code when submitted code reach for something it may not use,
// e.g. a path outside of its workspace.
struct CapabilityDenied : std::runtime_error {
  using std::runtime_error::runtime_error;
};

extern const std::string success_message;
extern const std::string timeout_message;

// "Error: <kind>: <detail>"
std::string format_error(const std::string& kind, const std::string& detail);

struct ExecutionResult {
  bool success = false;
  FaultKind kind = FaultKind::None;
  std::string output;
  // console.error and console.warn. appended after output on the wire.
  std::string errors;
  // the formatted "Error: ..." line when !success.
  std::string error;
  std::vector<std::string> artifacts;
  milliseconds duration{0};

  static ExecutionResult failure(FaultKind kind, const std::string& error) {
    ExecutionResult r;
    r.kind = kind;
    r.error = error;
    return r;
  }

  // the response body in text mode.
  std::string text() const;
  json to_json() const;
};
