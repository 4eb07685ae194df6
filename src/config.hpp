#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include "protocol.hpp"
#include "util.hpp"

// bounds on one execution.
struct Limits {
  milliseconds timeout{30000};
  milliseconds cpu_limit{30000};
  size_t memory_limit = 512 * bytes_in_mb;
  // bytes print and console may capture, stdout and stderr together.
  size_t output_limit = 16 * bytes_in_mb;
};

struct ConfigError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct Config {
  std::string host = "0.0.0.0";
  int port = 9999;
  std::string workspace_root = "workspaces";
  Limits limits;
  // how long a peer that does not send eom_token stay silent before its bytes count as a message.
  // 0 require eom_token.
  milliseconds legacy_idle{250};
  size_t max_request_bytes = 16 * bytes_in_mb;
  ResponseFormat response_format = ResponseFormat::text;
  bool echo_result = false;
  // 0 means sessions never expire.
  seconds session_idle_ttl{0};
  std::string audit_log;
  bool help = false;
  std::string help_text;
  json to_json() const;
};

// overwrite the fields named in j. key are the snake_case option names.
void apply_json(Config& config, const json& j);

void validate(const Config& config);

// defaults, then the --config file, then the remaining command line options.
// throw ConfigError on anything malformed.
Config parse_config(int argc, const char* const argv[]);
