#pragma once
#include <v8.h>
#include <libplatform/libplatform.h>
#include <cerrno>
#include <memory>
#include <string>

inline v8::Local<v8::String> fromString(v8::Isolate* isolate, const std::string& str) {
  return v8::String::NewFromUtf8(isolate, str.data(), v8::NewStringType::kNormal, static_cast<int>(str.size())).ToLocalChecked();
}

inline std::string toString(v8::Isolate* isolate, v8::Local<v8::Value> value) {
  v8::String::Utf8Value str(isolate, value);
  if (*str == nullptr) {
    return "";
  }
  return std::string(*str, str.length());
}

// read a string property off an object, empty when it is missing or cannot be read.
inline std::string get_string_property(v8::Isolate* isolate, v8::Local<v8::Context> context, v8::Local<v8::Object> obj, const char* name) {
  v8::Local<v8::Value> value;
  if (!obj->Get(context, fromString(isolate, name)).ToLocal(&value) || value->IsUndefined()) {
    return "";
  }
  return toString(isolate, value);
}

struct V8RAII {
  std::unique_ptr<v8::Platform> platform;
  V8RAII(const std::string& exec_location) {
    v8::V8::InitializeICUDefaultLocation(exec_location.c_str());
    v8::V8::InitializeExternalStartupData(exec_location.c_str());
    platform = v8::platform::NewDefaultPlatform();
    v8::V8::InitializePlatform(platform.get());
    v8::V8::Initialize();
    // todo: weird, errno is nonzero when executed to here.
    errno = 0;
  }
  ~V8RAII() {
    v8::V8::Dispose();
    v8::V8::DisposePlatform();
  }
};
