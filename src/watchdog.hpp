#pragma once
#include <condition_variable>
#include <mutex>
#include <thread>
#include <time.h>

#include "util.hpp"
#include "v8_util.hpp"

// watch one execution from a separate thread, and terminate it once it run past its
// wall-clock deadline or its thread use up its cpu budget.
// must be constructed on the thread that run the script.
struct Watchdog {
  enum class Verdict { none, timeout, cpu_exceeded };
  Watchdog(v8::Isolate* isolate, milliseconds timeout, milliseconds cpu_limit);
  Watchdog(const Watchdog&) = delete;
  ~Watchdog();
  // end the watch and tell whether it had to terminate the execution.
  Verdict stop();
  milliseconds cpu_time() const;
private:
  v8::Isolate* isolate;
  time_point deadline;
  milliseconds cpu_limit;
  clockid_t cpu_clock;
  milliseconds cpu_begin;
  std::mutex m;
  std::condition_variable cv;
  bool done = false;
  Verdict verdict = Verdict::none;
  std::thread monitor;
  void watch();
};
