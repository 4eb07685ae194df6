#include "util.hpp"

#include <cassert>
#include <ctime>
#include <fstream>

namespace {

std::mutex log_mutex;
std::ofstream audit_log;

} // namespace

std::string pad_string(const std::string& str, char pad, size_t length) {
  if (length <= str.length()) {
    return str;
  }
  return std::string(length - str.length(), pad) + str;
}

std::string get_time() {
  std::time_t t = std::time(nullptr);
  std::tm tm;
  localtime_r(&t, &tm);
  return
    pad_string(std::to_string(1900+tm.tm_year), '0', 4) + "-" +
    pad_string(std::to_string(1+tm.tm_mon), '0', 2) + "-" +
    pad_string(std::to_string(tm.tm_mday), '0', 2) + " " +
    pad_string(std::to_string(tm.tm_hour), '0', 2) + ":" +
    pad_string(std::to_string(tm.tm_min), '0', 2) + ":" +
    pad_string(std::to_string(tm.tm_sec), '0', 2);
}

std::pair<std::vector<std::string>, std::string> split_string(const std::string& str) {
  std::vector<std::string> strings;
  std::string::size_type pos = 0;
  std::string::size_type prev = 0;
  while ((pos = str.find('\n', prev)) != std::string::npos) {
    std::string substr = str.substr(prev, pos - prev);
    strings.push_back(substr);
    prev = pos + 1;
  }
  return {strings, str.substr(prev)};
}

std::string number_lines(const std::string& code) {
  auto p = split_string(code);
  std::vector<std::string> lines = p.first;
  if (!p.second.empty() || lines.empty()) {
    lines.push_back(p.second);
  }
  std::string ret;
  for (size_t i = 0; i < lines.size(); ++i) {
    ret += pad_string(std::to_string(i + 1), ' ', 3) + " | " + lines[i] + "\n";
  }
  return ret;
}

void log_line(const std::string& str) {
  std::lock_guard<std::mutex> guard(log_mutex);
  std::cout << "[" << get_time() << "] " << str << std::endl;
}

void log_error(const std::string& str) {
  std::lock_guard<std::mutex> guard(log_mutex);
  std::cout << "[" << get_time() << "] error: " << str << std::endl;
}

void set_audit_log(const std::string& path) {
  std::lock_guard<std::mutex> guard(log_mutex);
  if (audit_log.is_open()) {
    audit_log.close();
  }
  if (!path.empty()) {
    audit_log.open(path, std::ios::app);
    if (!audit_log) {
      throw std::runtime_error("cannot open audit log " + path);
    }
  }
}

void log_json(const json& j, const std::string& type) {
  json output;
  output["version"] = "2024-1-1";
  output["time"] = get_time();
  output["type"] = type;
  output["data"] = j;
  std::lock_guard<std::mutex> guard(log_mutex);
  if (audit_log.is_open()) {
    audit_log << output.dump(-1, ' ', false, json::error_handler_t::replace) << std::endl;
  }
}
