#pragma once
#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include "v8_util.hpp"

// what the host functions of one session see. output buffers are reset before every submission.
struct HostEnv {
  std::filesystem::path workdir;
  std::string out;
  std::string err;
  // out and err together never grow past this.
  size_t output_limit = 0;
  // set once a write was refused. the execution is terminated at that point.
  bool output_exceeded = false;
  void reset(const std::filesystem::path& workdir, size_t output_limit) {
    this->workdir = workdir;
    this->output_limit = output_limit;
    out.clear();
    err.clear();
    output_exceeded = false;
  }
  // append text to out or err. false, and nothing appended, when it would pass output_limit.
  bool write(std::string& stream, const std::string& text) {
    if (output_exceeded || text.size() > output_limit - std::min(output_limit, out.size() + err.size())) {
      output_exceeded = true;
      return false;
    }
    stream += text;
    return true;
  }
};

// global functions that throw CapabilityDenied when called.
extern const std::vector<std::string> denied_globals;
// modules require() refuse with CapabilityDenied.
extern const std::vector<std::string> denied_modules;

// the global object of a session: print, console, fs, require and the denied entry points.
// env must outlive every context made from the template.
v8::Local<v8::ObjectTemplate> make_global_template(v8::Isolate* isolate, HostEnv* env);

// throw a js Error whose name is kind, e.g. CapabilityDenied.
void throw_error(v8::Isolate* isolate, const std::string& kind, const std::string& message);

// how print and console show a value: strings raw, objects as json when possible.
std::string display(v8::Isolate* isolate, v8::Local<v8::Context> context, v8::Local<v8::Value> value);
