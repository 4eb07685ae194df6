#include "capability.hpp"
#include "result.hpp"
#include "workspace.hpp"

#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

const std::vector<std::string> denied_globals = {
  "spawn", "exec", "execSync", "system", "fork", "socket", "connect", "fetch", "XMLHttpRequest", "WebSocket",
};

const std::vector<std::string> denied_modules = {
  "child_process", "net", "http", "https", "dgram", "tls", "cluster", "worker_threads",
};

void throw_error(v8::Isolate* isolate, const std::string& kind, const std::string& message) {
  v8::Local<v8::Value> error = v8::Exception::Error(fromString(isolate, message));
  if (kind != "Error") {
    v8::Local<v8::Context> context = isolate->GetCurrentContext();
    error.As<v8::Object>()->Set(context, fromString(isolate, "name"), fromString(isolate, kind)).FromMaybe(false);
  }
  isolate->ThrowException(error);
}

std::string display(v8::Isolate* isolate, v8::Local<v8::Context> context, v8::Local<v8::Value> value) {
  if (value->IsString()) {
    return toString(isolate, value);
  }
  if (value->IsSymbol()) {
    v8::Local<v8::Value> description = value.As<v8::Symbol>()->Description(isolate);
    return "Symbol(" + (description->IsUndefined() ? std::string() : toString(isolate, description)) + ")";
  }
  v8::TryCatch try_catch(isolate);
  v8::Local<v8::String> str;
  bool plain = value->IsArray();
  if (!plain && value->IsObject() && !value->IsFunction()) {
    // "[object Object]" is all ToString give for plain objects.
    plain = value->ToString(context).ToLocal(&str) && toString(isolate, str) == "[object Object]";
  }
  if (plain && v8::JSON::Stringify(context, value).ToLocal(&str)) {
    return toString(isolate, str);
  }
  if (try_catch.HasTerminated()) {
    try_catch.ReThrow();
    return "";
  }
  if (value->ToString(context).ToLocal(&str)) {
    return toString(isolate, str);
  }
  if (try_catch.HasTerminated()) {
    try_catch.ReThrow();
  }
  return "";
}

namespace {

HostEnv& env_of(const v8::FunctionCallbackInfo<v8::Value>& args) {
  return *static_cast<HostEnv*>(args.Data().As<v8::External>()->Value());
}

// run f, turning c++ exceptions into js exceptions. none may unwind through v8 frames.
template<typename F>
void guarded(const v8::FunctionCallbackInfo<v8::Value>& args, const F& f) {
  v8::Isolate* isolate = args.GetIsolate();
  try {
    f();
  } catch (const CapabilityDenied& e) {
    throw_error(isolate, "CapabilityDenied", e.what());
  } catch (const std::exception& e) {
    throw_error(isolate, "Error", e.what());
  }
}

// print the arguments separated by spaces. past the output limit the execution is terminated.
void write_output(const v8::FunctionCallbackInfo<v8::Value>& args, std::string HostEnv::*stream) {
  HostEnv& env = env_of(args);
  v8::Isolate* isolate = args.GetIsolate();
  v8::Local<v8::Context> context = isolate->GetCurrentContext();
  std::string line;
  for (int i = 0; i < args.Length() && line.size() <= env.output_limit; ++i) {
    if (i != 0) {
      line += " ";
    }
    line += display(isolate, context, args[i]);
    if (isolate->IsExecutionTerminating()) {
      return;
    }
  }
  if (!env.write(env.*stream, line + "\n")) {
    isolate->TerminateExecution();
  }
}

void Print(const v8::FunctionCallbackInfo<v8::Value>& args) {
  write_output(args, &HostEnv::out);
}

void PrintError(const v8::FunctionCallbackInfo<v8::Value>& args) {
  write_output(args, &HostEnv::err);
}

std::string path_arg(const v8::FunctionCallbackInfo<v8::Value>& args, int i) {
  if (args.Length() <= i || !args[i]->IsString()) {
    throw std::runtime_error("path must be a string");
  }
  return toString(args.GetIsolate(), args[i]);
}

std::string data_arg(const v8::FunctionCallbackInfo<v8::Value>& args, int i) {
  if (args.Length() <= i) {
    throw std::runtime_error("data is missing");
  }
  if (args[i]->IsArrayBufferView()) {
    v8::Local<v8::ArrayBufferView> view = args[i].As<v8::ArrayBufferView>();
    std::string ret(view->ByteLength(), '\0');
    view->CopyContents(ret.data(), ret.size());
    return ret;
  }
  if (args[i]->IsArrayBuffer()) {
    v8::Local<v8::ArrayBuffer> buffer = args[i].As<v8::ArrayBuffer>();
    return std::string(static_cast<const char*>(buffer->Data()), buffer->ByteLength());
  }
  v8::Isolate* isolate = args.GetIsolate();
  return display(isolate, isolate->GetCurrentContext(), args[i]);
}

void write(const fs::path& path, const std::string& data, std::ios::openmode mode) {
  std::ofstream f(path, std::ios::binary | mode);
  if (!f) {
    throw std::runtime_error("cannot open " + path.filename().string() + " for writing");
  }
  f << data;
  if (!f) {
    throw std::runtime_error("cannot write " + path.filename().string());
  }
}

void ReadFile(const v8::FunctionCallbackInfo<v8::Value>& args) {
  guarded(args, [&]() {
    v8::Isolate* isolate = args.GetIsolate();
    fs::path path = resolve(env_of(args).workdir, path_arg(args, 0));
    if (!fs::is_regular_file(path)) {
      throw std::runtime_error("ENOENT: no such file '" + path_arg(args, 0) + "'");
    }
    std::string content = read_file(path);
    v8::Local<v8::String> str;
    if (!v8::String::NewFromUtf8(isolate, content.data(), v8::NewStringType::kNormal, static_cast<int>(content.size())).ToLocal(&str)) {
      throw std::runtime_error("file is too large to read as a string");
    }
    args.GetReturnValue().Set(str);
  });
}

void WriteFile(const v8::FunctionCallbackInfo<v8::Value>& args) {
  guarded(args, [&]() {
    fs::path path = resolve(env_of(args).workdir, path_arg(args, 0));
    write(path, data_arg(args, 1), std::ios::trunc);
  });
}

void AppendFile(const v8::FunctionCallbackInfo<v8::Value>& args) {
  guarded(args, [&]() {
    fs::path path = resolve(env_of(args).workdir, path_arg(args, 0));
    write(path, data_arg(args, 1), std::ios::app);
  });
}

void Exists(const v8::FunctionCallbackInfo<v8::Value>& args) {
  guarded(args, [&]() {
    fs::path path = resolve(env_of(args).workdir, path_arg(args, 0));
    std::error_code ec;
    args.GetReturnValue().Set(fs::exists(path, ec));
  });
}

void ListFiles(const v8::FunctionCallbackInfo<v8::Value>& args) {
  guarded(args, [&]() {
    v8::Isolate* isolate = args.GetIsolate();
    v8::Local<v8::Context> context = isolate->GetCurrentContext();
    std::string relative = args.Length() > 0 && !args[0]->IsUndefined() ? path_arg(args, 0) : ".";
    fs::path dir = resolve(env_of(args).workdir, relative);
    if (!fs::is_directory(dir)) {
      throw std::runtime_error("ENOENT: no such directory '" + relative + "'");
    }
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
      names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    v8::Local<v8::Array> array = v8::Array::New(isolate, static_cast<int>(names.size()));
    for (size_t i = 0; i < names.size(); ++i) {
      if (array->Set(context, static_cast<uint32_t>(i), fromString(isolate, names[i])).IsNothing()) {
        return;
      }
    }
    args.GetReturnValue().Set(array);
  });
}

void Mkdir(const v8::FunctionCallbackInfo<v8::Value>& args) {
  guarded(args, [&]() {
    fs::create_directories(resolve(env_of(args).workdir, path_arg(args, 0)));
  });
}

void Remove(const v8::FunctionCallbackInfo<v8::Value>& args) {
  guarded(args, [&]() {
    const fs::path& workdir = env_of(args).workdir;
    fs::path path = resolve(workdir, path_arg(args, 0));
    if (path.lexically_relative(fs::absolute(workdir).lexically_normal()) == ".") {
      throw CapabilityDenied("removing the workspace itself is disabled for security");
    }
    fs::remove_all(path);
  });
}

void Denied(const v8::FunctionCallbackInfo<v8::Value>& args) {
  v8::Isolate* isolate = args.GetIsolate();
  throw_error(isolate, "CapabilityDenied", toString(isolate, args.Data()) + " is disabled for security");
}

void Require(const v8::FunctionCallbackInfo<v8::Value>& args) {
  v8::Isolate* isolate = args.GetIsolate();
  v8::Local<v8::Context> context = isolate->GetCurrentContext();
  std::string name = args.Length() > 0 ? toString(isolate, args[0]) : "";
  std::string bare = name.rfind("node:", 0) == 0 ? name.substr(5) : name;
  if (bare == "fs") {
    v8::Local<v8::Value> module;
    if (context->Global()->Get(context, fromString(isolate, "fs")).ToLocal(&module)) {
      args.GetReturnValue().Set(module);
    }
  } else if (std::find(denied_modules.begin(), denied_modules.end(), bare) != denied_modules.end()) {
    throw_error(isolate, "CapabilityDenied", bare + " is disabled for security");
  } else {
    throw_error(isolate, "Error", "Cannot find module '" + name + "'");
  }
}

} // namespace

v8::Local<v8::ObjectTemplate> make_global_template(v8::Isolate* isolate, HostEnv* env) {
  v8::Local<v8::External> data = v8::External::New(isolate, env);
  v8::Local<v8::ObjectTemplate> global = v8::ObjectTemplate::New(isolate);
  global->Set(isolate, "print", v8::FunctionTemplate::New(isolate, Print, data));
  {
    v8::Local<v8::ObjectTemplate> console = v8::ObjectTemplate::New(isolate);
    for (const char* name : {"log", "info", "debug"}) {
      console->Set(isolate, name, v8::FunctionTemplate::New(isolate, Print, data));
    }
    for (const char* name : {"error", "warn"}) {
      console->Set(isolate, name, v8::FunctionTemplate::New(isolate, PrintError, data));
    }
    global->Set(isolate, "console", console);
  }
  {
    struct HostFunction {
      const char* name;
      v8::FunctionCallback callback;
    };
    std::vector<HostFunction> functions = {
      {"readFile", ReadFile}, {"readFileSync", ReadFile},
      {"writeFile", WriteFile}, {"writeFileSync", WriteFile},
      {"appendFile", AppendFile}, {"appendFileSync", AppendFile},
      {"exists", Exists}, {"existsSync", Exists},
      {"listFiles", ListFiles}, {"readdirSync", ListFiles},
      {"mkdir", Mkdir}, {"mkdirSync", Mkdir},
      {"remove", Remove}, {"unlinkSync", Remove}, {"rmSync", Remove},
    };
    v8::Local<v8::ObjectTemplate> fs_template = v8::ObjectTemplate::New(isolate);
    for (const auto& f : functions) {
      fs_template->Set(isolate, f.name, v8::FunctionTemplate::New(isolate, f.callback, data));
    }
    global->Set(isolate, "fs", fs_template);
  }
  global->Set(isolate, "require", v8::FunctionTemplate::New(isolate, Require, data));
  for (const std::string& name : denied_globals) {
    global->Set(isolate, name.c_str(), v8::FunctionTemplate::New(isolate, Denied, fromString(isolate, name)));
  }
  return global;
}
