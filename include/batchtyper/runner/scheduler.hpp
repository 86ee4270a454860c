#pragma once

#include "batchtyper/core/thread_budget.hpp"
#include "batchtyper/core/types.hpp"
#include "batchtyper/runner/events.hpp"
#include "batchtyper/runner/run_state.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace batchtyper::runner {

struct Partition {
    std::vector<TaskSpec> parallel;
    std::optional<TaskSpec> exclusive;
    std::vector<TaskSpec> post;
    std::vector<TaskSpec> disabled;
};

// Throws ValidationError when more than one enabled task is exclusive.
Partition partition_tasks(const std::vector<TaskSpec>& tasks);

using TaskExecutor =
    std::function<TaskResult(const TaskSpec&, const InputSet&, const fs::path&, int)>;

/**
 * Runs the enabled tasks of one run.
 *
 * The parallel batch runs on a bounded pool of worker threads; results are
 * collected in completion order. The exclusive task then runs on the calling
 * thread with the full budget, followed by post tasks one at a time.
 * Cancellation stops new dispatches; running tasks are left to finish.
 */
class Scheduler {
public:
    Scheduler(RunState& state, TaskExecutor executor, EventEmitter* events = nullptr,
              core::ThreadPolicy policy = core::fixed_thread_policy);

    // Throws NoInputFiles for an empty input set; every other failure ends up
    // in the returned results.
    ResultSet run_all(const InputSet& inputs, const fs::path& output_root, int thread_count,
                      const std::vector<TaskSpec>& tasks);

    const std::vector<std::string>& completion_order() const { return completion_order_; }

private:
    RunState& state_;
    TaskExecutor executor_;
    EventEmitter* events_;
    core::ThreadPolicy policy_;
    std::vector<std::string> completion_order_;

    TaskResult execute(const TaskSpec& task, const InputSet& inputs, const fs::path& output_root,
                       int threads);
    void run_parallel_batch(const std::vector<TaskSpec>& tasks, const InputSet& inputs,
                            const fs::path& output_root, int budget, ResultSet& results);
    void run_sequential(const TaskSpec& task, const InputSet& inputs, const fs::path& output_root,
                        int budget, ResultSet& results);
    void record(ResultSet& results, TaskResult result);
    void record_skipped(ResultSet& results, const TaskSpec& task, const std::string& reason);
};

} // namespace batchtyper::runner
