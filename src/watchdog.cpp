#include "watchdog.hpp"

#include <cstring>
#include <pthread.h>
#include <stdexcept>

namespace {

constexpr milliseconds poll_interval(5);

milliseconds read_clock(clockid_t clock) {
  timespec ts;
  if (clock_gettime(clock, &ts) != 0) {
    return milliseconds(0);
  }
  return milliseconds(static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000);
}

} // namespace

Watchdog::Watchdog(v8::Isolate* isolate, milliseconds timeout, milliseconds cpu_limit) :
  isolate(isolate),
  deadline(steady_clock::now() + timeout),
  cpu_limit(cpu_limit) {
  int err = pthread_getcpuclockid(pthread_self(), &cpu_clock);
  if (err != 0) {
    throw std::runtime_error(std::string("pthread_getcpuclockid: ") + strerror(err));
  }
  cpu_begin = read_clock(cpu_clock);
  monitor = std::thread([this]() { watch(); });
}

Watchdog::~Watchdog() {
  stop();
}

milliseconds Watchdog::cpu_time() const {
  return read_clock(cpu_clock) - cpu_begin;
}

void Watchdog::watch() {
  std::unique_lock<std::mutex> l(m);
  while (!done) {
    if (verdict == Verdict::none) {
      if (steady_clock::now() >= deadline) {
        verdict = Verdict::timeout;
      } else if (cpu_time() >= cpu_limit) {
        verdict = Verdict::cpu_exceeded;
      }
    }
    // host code may swallow a termination, so keep terminating until stopped.
    if (verdict != Verdict::none) {
      isolate->TerminateExecution();
    }
    cv.wait_for(l, poll_interval, [this]() { return done; });
  }
}

Watchdog::Verdict Watchdog::stop() {
  {
    std::lock_guard<std::mutex> l(m);
    done = true;
  }
  cv.notify_one();
  if (monitor.joinable()) {
    monitor.join();
  }
  return verdict;
}
