#pragma once
#include <filesystem>
#include <string>

#include "config.hpp"
#include "result.hpp"
#include "session.hpp"

// run submitted code inside the persistent context of a session.
struct Executor {
  v8::Platform* platform;
  Limits limits;
  // append the completion value of a snippet to its output, like a repl.
  bool echo_result = false;
  Executor(v8::Platform* platform, const Limits& limits, bool echo_result = false) :
    platform(platform), limits(limits), echo_result(echo_result) { }
  // the caller hold the session lock. workdir is the session workspace and must exist.
  // nothing escape as an exception: every failure is reported in the result.
  ExecutionResult run(SessionNode& session, const SessionNode::Lock& l, const std::filesystem::path& workdir, const std::string& code);
private:
  // over_budget is set when the session state alone no longer fit in the memory limit.
  ExecutionResult run_in_context(SessionNode& session, const SessionNode::Lock& l, const std::filesystem::path& workdir, const std::string& code, bool& over_budget);
};
