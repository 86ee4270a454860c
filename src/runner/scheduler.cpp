#include "batchtyper/runner/scheduler.hpp"
#include "batchtyper/core/console.hpp"
#include "batchtyper/core/errors.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace batchtyper::runner {

using core::Console;

Partition partition_tasks(const std::vector<TaskSpec>& tasks) {
    Partition p;
    for (const auto& t : tasks) {
        if (!t.enabled) {
            p.disabled.push_back(t);
            continue;
        }
        switch (t.batch) {
            case TaskBatch::Parallel:
                p.parallel.push_back(t);
                break;
            case TaskBatch::Exclusive:
                if (p.exclusive) {
                    throw ValidationError("more than one exclusive task: " + p.exclusive->name +
                                          ", " + t.name);
                }
                p.exclusive = t;
                break;
            case TaskBatch::Post:
                p.post.push_back(t);
                break;
        }
    }
    return p;
}

Scheduler::Scheduler(RunState& state, TaskExecutor executor, EventEmitter* events,
                     core::ThreadPolicy policy)
    : state_(state), executor_(std::move(executor)), events_(events), policy_(std::move(policy)) {
    if (!policy_) {
        policy_ = core::fixed_thread_policy;
    }
}

TaskResult Scheduler::execute(const TaskSpec& task, const InputSet& inputs,
                              const fs::path& output_root, int threads) {
    if (events_) {
        events_->task_start(state_.run_id(), task.name, threads,
                            {{"batch", task_batch_to_string(task.batch)}});
    }

    TaskResult result;
    const auto started = Clock::now();
    try {
        result = executor_(task, inputs, output_root, threads);
    } catch (const std::exception& e) {
        Console::error("TASK " + task.name, e.what());
        result = TaskResult{};
        result.status = TaskStatus::Failed;
        result.error = e.what();
    } catch (...) {
        Console::error("TASK " + task.name, "unknown exception");
        result = TaskResult{};
        result.status = TaskStatus::Failed;
        result.error = "unknown exception";
    }
    result.task = task.name;
    result.threads = threads;
    if (result.started == Clock::time_point{}) result.started = started;
    if (result.finished == Clock::time_point{}) result.finished = Clock::now();

    if (events_) {
        nlohmann::json extra;
        extra["exit_code"] = result.exit_code;
        extra["duration_s"] =
            std::chrono::duration<double>(result.finished - result.started).count();
        if (!result.error.empty()) extra["error"] = result.error;
        if (!result.warnings.empty()) extra["warnings"] = result.warnings;
        if (result.output_dir) extra["output_dir"] = result.output_dir->string();
        events_->task_end(state_.run_id(), task.name, task_status_to_string(result.status),
                          extra);
    }
    return result;
}

void Scheduler::record(ResultSet& results, TaskResult result) {
    completion_order_.push_back(result.task);
    results[result.task] = std::move(result);
}

void Scheduler::record_skipped(ResultSet& results, const TaskSpec& task,
                               const std::string& reason) {
    TaskResult r;
    r.task = task.name;
    r.status = TaskStatus::Skipped;
    r.error = reason;
    results[task.name] = std::move(r);
    if (events_) {
        events_->task_skipped(state_.run_id(), task.name, reason);
    }
}

void Scheduler::run_parallel_batch(const std::vector<TaskSpec>& tasks, const InputSet& inputs,
                                   const fs::path& output_root, int budget, ResultSet& results) {
    if (tasks.empty()) return;

    const int n = static_cast<int>(tasks.size());
    const core::ParallelPlan plan = core::plan_parallel_batch(budget, n);
    Console::info("SCHED", "Running " + std::to_string(n) + " analyses in parallel (" +
                               std::to_string(plan.pool_width) + " worker(s), " +
                               std::to_string(plan.per_task_threads) + " thread(s) each)");

    CancellationToken& token = state_.cancellation();

    std::vector<std::optional<TaskResult>> slots(tasks.size());
    std::vector<bool> collected(tasks.size(), false);
    std::deque<size_t> done;
    std::mutex mtx;
    std::condition_variable cv;
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (;;) {
            if (token.cancelled()) break;
            const size_t idx = next.fetch_add(1);
            if (idx >= tasks.size()) break;

            state_.register_workspace(tasks[idx]);
            TaskResult r = execute(tasks[idx], inputs, output_root, plan.per_task_threads);

            std::lock_guard<std::mutex> lock(mtx);
            slots[idx] = std::move(r);
            done.push_back(idx);
            cv.notify_one();
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(plan.pool_width));
    for (int i = 0; i < plan.pool_width; ++i) {
        workers.emplace_back(worker);
    }

    size_t collected_count = 0;
    while (collected_count < tasks.size()) {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait_for(lock, std::chrono::milliseconds(100), [&] { return !done.empty(); });
        while (!done.empty()) {
            const size_t idx = done.front();
            done.pop_front();
            collected[idx] = true;
            ++collected_count;
            record(results, std::move(*slots[idx]));
        }
        lock.unlock();

        if (token.cancelled()) {
            Console::warning("SCHED", "Cancellation requested, no further analyses are started");
            break;
        }
    }

    for (auto& t : workers) {
        t.join();
    }

    // Tasks that finished after collection stopped keep their real outcome;
    // tasks that never started are skipped.
    for (size_t i = 0; i < tasks.size(); ++i) {
        if (collected[i]) continue;
        if (slots[i]) {
            record(results, std::move(*slots[i]));
        } else {
            record_skipped(results, tasks[i], "cancelled");
        }
    }
}

void Scheduler::run_sequential(const TaskSpec& task, const InputSet& inputs,
                               const fs::path& output_root, int budget, ResultSet& results) {
    if (state_.cancellation().cancelled()) {
        record_skipped(results, task, "cancelled");
        return;
    }
    Console::info("SCHED", "Running " + task.display_name() + " alone with " +
                               std::to_string(budget) + " thread(s)");
    state_.register_workspace(task);
    record(results, execute(task, inputs, output_root, budget));
}

ResultSet Scheduler::run_all(const InputSet& inputs, const fs::path& output_root,
                             int thread_count, const std::vector<TaskSpec>& tasks) {
    if (inputs.empty()) {
        throw NoInputFiles("empty input set");
    }

    Partition partition = partition_tasks(tasks);
    const int budget = std::max(1, policy_(thread_count));

    ResultSet results;
    completion_order_.clear();

    for (const auto& t : partition.disabled) {
        record_skipped(results, t, "disabled");
    }

    run_parallel_batch(partition.parallel, inputs, output_root, budget, results);

    if (partition.exclusive) {
        run_sequential(*partition.exclusive, inputs, output_root, budget, results);
    }

    for (const auto& t : partition.post) {
        run_sequential(t, inputs, output_root, budget, results);
    }

    return results;
}

} // namespace batchtyper::runner
