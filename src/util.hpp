#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

using time_point = std::chrono::steady_clock::time_point;
using std::chrono::steady_clock;
using std::chrono::duration_cast;
using milliseconds = std::chrono::milliseconds;
using seconds = std::chrono::seconds;

constexpr size_t bytes_in_mb = 1048576;

std::string get_time();

std::string pad_string(const std::string& str, char pad, size_t length);

// split on newline. return the complete lines, and the leftover.
std::pair<std::vector<std::string>, std::string> split_string(const std::string& str);

// "  1 | first line\n  2 | second line\n", as written to the log before a submission runs.
std::string number_lines(const std::string& code);

// one line on stdout, prefixed by the time. concurrent workers never interleave.
void log_line(const std::string& str);

void log_error(const std::string& str);

// everything passed to log_json is appended to this file, one object per line.
// an empty path turn the audit log off.
void set_audit_log(const std::string& path);

void log_json(const json& j, const std::string& type);

inline std::string read_file(const std::filesystem::path& path) {
  std::ifstream t(path, std::ios::binary);
  if (!t) {
    throw std::runtime_error("cannot open " + path.string());
  }
  return std::string((std::istreambuf_iterator<char>(t)),
                     std::istreambuf_iterator<char>());
}
