#include "config.hpp"

#include <cxxopts.hpp>
#include <limits>
#include <set>

namespace {

ResponseFormat parse_response_format(const std::string& str) {
  if (str == "text") {
    return ResponseFormat::text;
  } else if (str == "json") {
    return ResponseFormat::json;
  } else {
    throw ConfigError("unknown response-format: " + str + " (expected text or json)");
  }
}

template<typename T>
T positive(const std::string& name, T value) {
  if (value <= 0) {
    throw ConfigError(name + " must be positive, got " + std::to_string(value));
  }
  return value;
}

template<typename T>
T non_negative(const std::string& name, T value) {
  if (value < 0) {
    throw ConfigError(name + " must not be negative, got " + std::to_string(value));
  }
  return value;
}

// a positive size given in MiB, as bytes.
size_t megabytes(const std::string& name, int64_t value) {
  positive(name, value);
  if (static_cast<uint64_t>(value) > std::numeric_limits<size_t>::max() / bytes_in_mb) {
    throw ConfigError(name + " is too large, got " + std::to_string(value));
  }
  return static_cast<size_t>(value) * bytes_in_mb;
}

const std::set<std::string> config_keys = {
  "host", "port", "workspace_root", "timeout_ms", "cpu_limit_ms", "memory_limit_mb", "max_output_mb",
  "legacy_idle_ms", "max_request_mb", "response_format", "echo_result",
  "session_idle_ttl_s", "audit_log",
};

} // namespace

json Config::to_json() const {
  json j;
  j["host"] = host;
  j["port"] = port;
  j["workspace_root"] = workspace_root;
  j["timeout_ms"] = limits.timeout.count();
  j["cpu_limit_ms"] = limits.cpu_limit.count();
  j["memory_limit_mb"] = limits.memory_limit / bytes_in_mb;
  j["max_output_mb"] = limits.output_limit / bytes_in_mb;
  j["legacy_idle_ms"] = legacy_idle.count();
  j["max_request_mb"] = max_request_bytes / bytes_in_mb;
  std::stringstream ss;
  ss << response_format;
  j["response_format"] = ss.str();
  j["echo_result"] = echo_result;
  j["session_idle_ttl_s"] = session_idle_ttl.count();
  j["audit_log"] = audit_log;
  return j;
}

void apply_json(Config& config, const json& j) {
  if (!j.is_object()) {
    throw ConfigError("configuration file must hold a json object");
  }
  for (const auto& item : j.items()) {
    if (config_keys.count(item.key()) == 0) {
      throw ConfigError("unknown configuration key: " + item.key());
    }
  }
  try {
    if (j.contains("host")) {
      config.host = j.at("host").get<std::string>();
    }
    if (j.contains("port")) {
      config.port = j.at("port").get<int>();
    }
    if (j.contains("workspace_root")) {
      config.workspace_root = j.at("workspace_root").get<std::string>();
    }
    if (j.contains("timeout_ms")) {
      config.limits.timeout = milliseconds(positive("timeout_ms", j.at("timeout_ms").get<int64_t>()));
    }
    if (j.contains("cpu_limit_ms")) {
      config.limits.cpu_limit = milliseconds(positive("cpu_limit_ms", j.at("cpu_limit_ms").get<int64_t>()));
    }
    if (j.contains("memory_limit_mb")) {
      config.limits.memory_limit = megabytes("memory_limit_mb", j.at("memory_limit_mb").get<int64_t>());
    }
    if (j.contains("max_output_mb")) {
      config.limits.output_limit = megabytes("max_output_mb", j.at("max_output_mb").get<int64_t>());
    }
    if (j.contains("legacy_idle_ms")) {
      config.legacy_idle = milliseconds(non_negative("legacy_idle_ms", j.at("legacy_idle_ms").get<int64_t>()));
    }
    if (j.contains("max_request_mb")) {
      config.max_request_bytes = megabytes("max_request_mb", j.at("max_request_mb").get<int64_t>());
    }
    if (j.contains("response_format")) {
      config.response_format = parse_response_format(j.at("response_format").get<std::string>());
    }
    if (j.contains("echo_result")) {
      config.echo_result = j.at("echo_result").get<bool>();
    }
    if (j.contains("session_idle_ttl_s")) {
      config.session_idle_ttl = seconds(non_negative("session_idle_ttl_s", j.at("session_idle_ttl_s").get<int64_t>()));
    }
    if (j.contains("audit_log")) {
      config.audit_log = j.at("audit_log").get<std::string>();
    }
  } catch (const json::exception& e) {
    throw ConfigError(std::string("bad configuration value: ") + e.what());
  }
}

void validate(const Config& config) {
  if (config.port < 0 || config.port > 65535) {
    throw ConfigError("port must be in 0..65535, got " + std::to_string(config.port));
  }
  if (config.host.empty()) {
    throw ConfigError("host must not be empty");
  }
  if (config.workspace_root.empty()) {
    throw ConfigError("workspace-root must not be empty");
  }
}

Config parse_config(int argc, const char* const argv[]) {
  cxxopts::Options options("sessiond", "Stateful remote code execution server");
  options.add_options()
    ("host", "address to listen on", cxxopts::value<std::string>());
  options.add_options()
    ("port", "port to listen on, 0 pick any free port", cxxopts::value<int>());
  options.add_options()
    ("workspace-root", "directory holding one workspace per session", cxxopts::value<std::string>());
  options.add_options()
    ("timeout-ms", "wall-clock limit of a submission", cxxopts::value<int64_t>());
  options.add_options()
    ("cpu-limit-ms", "cpu time limit of a submission", cxxopts::value<int64_t>());
  options.add_options()
    ("memory-limit-mb", "memory limit of a session", cxxopts::value<int64_t>());
  options.add_options()
    ("max-output-mb", "output a submission may print", cxxopts::value<int64_t>());
  options.add_options()
    ("legacy-idle-ms", "treat buffered bytes as a message after this much silence, 0 require <|EOM|>", cxxopts::value<int64_t>());
  options.add_options()
    ("max-request-mb", "largest accepted message", cxxopts::value<int64_t>());
  options.add_options()
    ("response-format", "text or json", cxxopts::value<std::string>());
  options.add_options()
    ("echo-result", "append the completion value of a submission to its output", cxxopts::value<bool>());
  options.add_options()
    ("session-idle-ttl-s", "drop sessions idle for this long, 0 keep them forever", cxxopts::value<int64_t>());
  options.add_options()
    ("audit-log", "append json records of every event to this file", cxxopts::value<std::string>());
  options.add_options()
    ("config", "json file with the same options in snake_case", cxxopts::value<std::string>());
  options.add_options()
    ("help", "print this message");

  Config config;
  try {
    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      config.help = true;
      config.help_text = options.help();
      return config;
    }
    if (result.count("config")) {
      std::string path = result["config"].as<std::string>();
      json j;
      try {
        j = json::parse(read_file(path));
      } catch (const json::exception& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
      }
      apply_json(config, j);
    }
    // command line override the file.
    json overrides;
    if (result.count("host")) {
      overrides["host"] = result["host"].as<std::string>();
    }
    if (result.count("port")) {
      overrides["port"] = result["port"].as<int>();
    }
    if (result.count("workspace-root")) {
      overrides["workspace_root"] = result["workspace-root"].as<std::string>();
    }
    if (result.count("timeout-ms")) {
      overrides["timeout_ms"] = result["timeout-ms"].as<int64_t>();
    }
    if (result.count("cpu-limit-ms")) {
      overrides["cpu_limit_ms"] = result["cpu-limit-ms"].as<int64_t>();
    }
    if (result.count("memory-limit-mb")) {
      overrides["memory_limit_mb"] = result["memory-limit-mb"].as<int64_t>();
    }
    if (result.count("max-output-mb")) {
      overrides["max_output_mb"] = result["max-output-mb"].as<int64_t>();
    }
    if (result.count("legacy-idle-ms")) {
      overrides["legacy_idle_ms"] = result["legacy-idle-ms"].as<int64_t>();
    }
    if (result.count("max-request-mb")) {
      overrides["max_request_mb"] = result["max-request-mb"].as<int64_t>();
    }
    if (result.count("response-format")) {
      overrides["response_format"] = result["response-format"].as<std::string>();
    }
    if (result.count("echo-result")) {
      overrides["echo_result"] = result["echo-result"].as<bool>();
    }
    if (result.count("session-idle-ttl-s")) {
      overrides["session_idle_ttl_s"] = result["session-idle-ttl-s"].as<int64_t>();
    }
    if (result.count("audit-log")) {
      overrides["audit_log"] = result["audit-log"].as<std::string>();
    }
    if (!overrides.is_null()) {
      apply_json(config, overrides);
    }
  } catch (const ConfigError&) {
    throw;
  } catch (const std::exception& e) {
    // cxxopts parse errors and unreadable files.
    throw ConfigError(e.what());
  }
  validate(config);
  return config;
}
