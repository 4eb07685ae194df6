#pragma once
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <map>
#include <mutex>

#include "result.hpp"

// outcome counters and duration statistics over every execution the server ran.
struct Stats {
  using Durations =
    boost::accumulators::accumulator_set<
      double,
      boost::accumulators::stats<
        boost::accumulators::tag::count,
        boost::accumulators::tag::mean,
        boost::accumulators::tag::variance,
        boost::accumulators::tag::max>>;
  void record(const ExecutionResult& r);
  size_t count() const;
  json report() const;
private:
  mutable std::mutex m;
  Durations durations;
  std::map<FaultKind, size_t> outcomes;
};
