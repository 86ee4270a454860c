#pragma once

#include <functional>
#include <string>

namespace batchtyper::core {

struct ParallelPlan {
  int per_task_threads = 1;
  int pool_width = 1;
};

// per_task_threads = max(1, threads / tasks)
// pool_width       = max(1, min(tasks, threads / 2))
ParallelPlan plan_parallel_batch(int thread_count, int task_count);

// Maps the requested thread count to the budget the scheduler distributes.
using ThreadPolicy = std::function<int(int)>;

int fixed_thread_policy(int requested);
int hardware_thread_policy(int requested);

// "fixed" | "hardware"; throws ConfigError otherwise.
ThreadPolicy thread_policy_from_name(const std::string &name);

} // namespace batchtyper::core
