#include "stats.hpp"

#include <cmath>

namespace acc = boost::accumulators;

void Stats::record(const ExecutionResult& r) {
  std::lock_guard<std::mutex> guard(m);
  durations(static_cast<double>(r.duration.count()));
  ++outcomes[r.kind];
}

size_t Stats::count() const {
  std::lock_guard<std::mutex> guard(m);
  return acc::count(durations);
}

json Stats::report() const {
  std::lock_guard<std::mutex> guard(m);
  json j;
  size_t n = acc::count(durations);
  j["executions"] = n;
  j["mean_ms"] = n == 0 ? 0.0 : acc::mean(durations);
  j["sd_ms"] = n == 0 ? 0.0 : std::sqrt(acc::variance(durations));
  j["max_ms"] = n == 0 ? 0.0 : acc::max(durations);
  json outcome = json::object();
  for (const auto& p : outcomes) {
    outcome[to_string(p.first)] = p.second;
  }
  j["outcomes"] = outcome;
  return j;
}
