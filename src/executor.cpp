#include "executor.hpp"
#include "watchdog.hpp"
#include "workspace.hpp"

namespace {

bool compile_and_run(v8::Isolate* isolate, v8::Local<v8::Context> context, const std::string& code, const std::string& name, v8::Local<v8::Value>* completion) {
  v8::ScriptOrigin origin(isolate, fromString(isolate, name));
  v8::Local<v8::Script> script;
  if (!v8::Script::Compile(context, fromString(isolate, code), &origin).ToLocal(&script)) {
    return false;
  }
  return script->Run(context).ToLocal(completion);
}

// turn what submitted code threw into a result. the kind is the name of the error, e.g. TypeError.
ExecutionResult classify(v8::Isolate* isolate, v8::Local<v8::Context> context, v8::Local<v8::Value> exception) {
  v8::TryCatch try_catch(isolate);
  std::string name, message;
  if (exception->IsObject()) {
    v8::Local<v8::Object> obj = exception.As<v8::Object>();
    name = get_string_property(isolate, context, obj, "name");
    message = get_string_property(isolate, context, obj, "message");
  }
  if (name.empty()) {
    return ExecutionResult::failure(FaultKind::ExecutionFault, format_error("Exception", display(isolate, context, exception)));
  }
  FaultKind kind = name == "CapabilityDenied" ? FaultKind::CapabilityDenied : FaultKind::ExecutionFault;
  return ExecutionResult::failure(kind, format_error(name, message));
}

} // namespace

ExecutionResult Executor::run(SessionNode& session, const SessionNode::Lock& l, const std::filesystem::path& workdir, const std::string& code) {
  time_point begin = steady_clock::now();
  ExecutionResult r;
  try {
    session.start(limits, l);
    bool over_budget = false;
    r = run_in_context(session, l, workdir, code, over_budget);
    if (over_budget) {
      session.discard(l);
      r.error = format_error("ResourceExceeded", "memory limit of " + std::to_string(limits.memory_limit) + " bytes exceeded, session state was reset");
      log_line("session " + session.id + " kept more than its memory limit alive, state reset");
    }
  } catch (const std::exception& e) {
    r = ExecutionResult::failure(FaultKind::InternalError, format_error("InternalError", e.what()));
  }
  ++session.executions;
  r.duration = duration_cast<milliseconds>(steady_clock::now() - begin);
  return r;
}

ExecutionResult Executor::run_in_context(SessionNode& session, const SessionNode::Lock& l, const std::filesystem::path& workdir, const std::string& code, bool& over_budget) {
  if (session.context.IsEmpty()) {
    throw std::runtime_error("session " + session.id + " has no usable context");
  }
  v8::Isolate* isolate = session.isolate;
  v8::Locker locker(isolate);
  v8::Isolate::Scope isolate_scope(isolate);
  v8::HandleScope handle_scope(isolate);
  v8::Local<v8::Context> context = session.context.Get(isolate);
  v8::Context::Scope context_scope(context);

  session.env.reset(workdir, limits.output_limit);
  session.heap_exceeded = false;
  session.allocator->exceeded = false;
  Snapshot before = snapshot(workdir);

  ExecutionResult r;
  v8::TryCatch try_catch(isolate);
  bool ok;
  Watchdog::Verdict verdict;
  {
    Watchdog watchdog(isolate, limits.timeout, limits.cpu_limit);
    v8::Local<v8::Value> completion;
    ok = compile_and_run(isolate, context, code, session.id + "#" + std::to_string(session.executions + 1), &completion);
    if (ok) {
      // promise jobs run under the same limits.
      isolate->PerformMicrotaskCheckpoint();
      ok = !try_catch.HasCaught() && !isolate->IsExecutionTerminating();
    }
    if (ok && echo_result && !completion->IsUndefined()) {
      std::string shown = display(isolate, context, completion);
      ok = !try_catch.HasCaught() && !isolate->IsExecutionTerminating() && session.env.write(session.env.out, shown + "\n");
    }
    verdict = watchdog.stop();
  }

  bool terminated = try_catch.HasTerminated() || isolate->IsExecutionTerminating();
  if (terminated || verdict != Watchdog::Verdict::none || session.heap_exceeded || session.env.output_exceeded) {
    isolate->CancelTerminateExecution();
  }
  if (session.heap_exceeded) {
    isolate->LowMemoryNotification();
    // v8 will not lower the limit below the live heap plus a quarter. past that, the state itself is the hog.
    v8::HeapStatistics heap;
    isolate->GetHeapStatistics(&heap);
    over_budget = heap.used_heap_size() + heap.used_heap_size() / 4 > session.initial_heap_limit;
    if (!over_budget) {
      session.restore_heap_limit(l);
    }
    r = ExecutionResult::failure(FaultKind::ResourceExceeded, format_error("ResourceExceeded", "memory limit of " + std::to_string(limits.memory_limit) + " bytes exceeded"));
  } else if (session.env.output_exceeded) {
    r = ExecutionResult::failure(FaultKind::ResourceExceeded, format_error("ResourceExceeded", "output limit of " + std::to_string(limits.output_limit) + " bytes exceeded"));
  } else if (verdict == Watchdog::Verdict::cpu_exceeded) {
    r = ExecutionResult::failure(FaultKind::ResourceExceeded, format_error("ResourceExceeded", "CPU time limit of " + std::to_string(limits.cpu_limit.count()) + " ms exceeded"));
  } else if (verdict == Watchdog::Verdict::timeout) {
    r = ExecutionResult::failure(FaultKind::Timeout, timeout_message);
  } else if (terminated) {
    r = ExecutionResult::failure(FaultKind::InternalError, format_error("InternalError", "execution was terminated"));
  } else if (!ok && session.allocator->exceeded) {
    r = ExecutionResult::failure(FaultKind::ResourceExceeded, format_error("ResourceExceeded", "memory limit of " + std::to_string(limits.memory_limit) + " bytes exceeded"));
  } else if (!ok && try_catch.HasCaught()) {
    r = classify(isolate, context, try_catch.Exception());
  } else if (!ok) {
    r = ExecutionResult::failure(FaultKind::InternalError, format_error("InternalError", "execution failed without an exception"));
  } else {
    r.success = true;
    r.artifacts = artifacts(workdir, before);
  }
  r.output = session.env.out;
  r.errors = session.env.err;
  try_catch.Reset();
  while (v8::platform::PumpMessageLoop(platform, isolate)) { }
  return r;
}
