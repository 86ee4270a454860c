#include "batchtyper/core/thread_budget.hpp"
#include "batchtyper/core/errors.hpp"

#include <algorithm>
#include <thread>

namespace batchtyper::core {

ParallelPlan plan_parallel_batch(int thread_count, int task_count) {
  ParallelPlan out;
  if (task_count < 1) {
    return out;
  }
  const int threads = std::max(1, thread_count);
  out.per_task_threads = std::max(1, threads / task_count);
  out.pool_width = std::max(1, std::min(task_count, threads / 2));
  return out;
}

int fixed_thread_policy(int requested) {
  return std::max(1, requested);
}

int hardware_thread_policy(int requested) {
  const int clamped = std::max(1, requested);
  const unsigned hw = std::thread::hardware_concurrency();
  if (hw == 0) {
    return clamped;
  }
  return std::min(clamped, static_cast<int>(hw));
}

ThreadPolicy thread_policy_from_name(const std::string &name) {
  if (name == "fixed") {
    return fixed_thread_policy;
  }
  if (name == "hardware") {
    return hardware_thread_policy;
  }
  throw ConfigError("unknown thread policy '" + name + "'");
}

} // namespace batchtyper::core
