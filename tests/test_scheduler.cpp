#include "test_support.hpp"

#include "batchtyper/core/errors.hpp"
#include "batchtyper/runner/scheduler.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

using namespace batchtyper;
using batchtyper::runner::RunState;
using batchtyper::runner::Scheduler;

namespace {

TaskSpec make_task(const std::string& name, TaskBatch batch = TaskBatch::Parallel) {
    TaskSpec t;
    t.name = name;
    t.workspace = fs::path("/tmp/batchtyper_sched") / name;
    t.executable = "true";
    t.result_path = "out";
    t.batch = batch;
    return t;
}

TaskResult ok_result(const TaskSpec& t) {
    TaskResult r;
    r.task = t.name;
    r.status = TaskStatus::Success;
    r.exit_code = 0;
    return r;
}

InputSet one_input() {
    return {test::make_input("/data/a.fna")};
}

// Records start/end order of every executor call.
struct Journal {
    std::mutex mtx;
    std::vector<std::string> events;
    std::map<std::string, int> threads;
    std::map<std::string, std::thread::id> thread_ids;
    std::atomic<int> running{0};
    std::atomic<int> max_running{0};

    void start(const std::string& name, int t) {
        std::lock_guard<std::mutex> lock(mtx);
        events.push_back("start:" + name);
        threads[name] = t;
        thread_ids[name] = std::this_thread::get_id();
        int now = ++running;
        max_running = std::max(max_running.load(), now);
    }
    void end(const std::string& name) {
        std::lock_guard<std::mutex> lock(mtx);
        events.push_back("end:" + name);
        --running;
    }
    size_t index_of(const std::string& e) const {
        return static_cast<size_t>(std::find(events.begin(), events.end(), e) - events.begin());
    }
};

} // namespace

TEST_CASE("empty_input_set_is_rejected_before_any_task") {
    RunState state("run", {});
    bool called = false;
    Scheduler sched(state, [&](const TaskSpec& t, const InputSet&, const fs::path&, int) {
        called = true;
        return ok_result(t);
    });
    REQUIRE_THROWS_AS(sched.run_all({}, "/tmp/out", 4, {make_task("a")}), NoInputFiles);
    REQUIRE_FALSE(called);
}

TEST_CASE("two_tasks_four_threads_run_concurrently_with_two_threads_each") {
    RunState state("run", one_input());
    Journal journal;
    Scheduler sched(state, [&](const TaskSpec& t, const InputSet&, const fs::path&, int threads) {
        journal.start(t.name, threads);
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        journal.end(t.name);
        return ok_result(t);
    });

    ResultSet results = sched.run_all(one_input(), "/tmp/out", 4, {make_task("a"), make_task("b")});

    REQUIRE(results.size() == 2);
    REQUIRE(journal.threads["a"] == 2);
    REQUIRE(journal.threads["b"] == 2);
    REQUIRE(journal.max_running.load() == 2);
    REQUIRE(results["a"].threads == 2);
}

TEST_CASE("exclusive_task_runs_after_parallel_batch_on_calling_thread") {
    RunState state("run", one_input());
    Journal journal;
    Scheduler sched(state, [&](const TaskSpec& t, const InputSet&, const fs::path&, int threads) {
        journal.start(t.name, threads);
        std::this_thread::sleep_for(std::chrono::milliseconds(t.name == "slow" ? 200 : 20));
        journal.end(t.name);
        return ok_result(t);
    });

    std::vector<TaskSpec> tasks{make_task("heavy", TaskBatch::Exclusive), make_task("slow"),
                                make_task("fast"), make_task("report", TaskBatch::Post)};
    ResultSet results = sched.run_all(one_input(), "/tmp/out", 6, tasks);

    REQUIRE(results.size() == 4);
    REQUIRE(journal.index_of("start:heavy") > journal.index_of("end:slow"));
    REQUIRE(journal.index_of("start:heavy") > journal.index_of("end:fast"));
    REQUIRE(journal.index_of("start:report") > journal.index_of("end:heavy"));
    REQUIRE(journal.threads["heavy"] == 6);
    REQUIRE(journal.threads["report"] == 6);
    REQUIRE(journal.threads["slow"] == 3);
    REQUIRE(journal.thread_ids["heavy"] == std::this_thread::get_id());

    const auto& order = sched.completion_order();
    REQUIRE(order.size() == 4);
    REQUIRE(order[0] == "fast");
    REQUIRE(order[1] == "slow");
    REQUIRE(order[2] == "heavy");
    REQUIRE(order[3] == "report");
}

TEST_CASE("failing_task_does_not_block_the_others") {
    RunState state("run", one_input());
    Scheduler sched(state, [&](const TaskSpec& t, const InputSet&, const fs::path&, int) {
        if (t.name == "broken") {
            throw std::runtime_error("segfault in tool wrapper");
        }
        if (t.name == "failed") {
            TaskResult r = ok_result(t);
            r.status = TaskStatus::Failed;
            r.error = "expected output not found";
            return r;
        }
        return ok_result(t);
    });

    std::vector<TaskSpec> tasks{make_task("a"), make_task("broken"), make_task("failed"),
                                make_task("b"), make_task("excl", TaskBatch::Exclusive)};
    ResultSet results = sched.run_all(one_input(), "/tmp/out", 8, tasks);

    REQUIRE(results.size() == 5);
    REQUIRE(results["a"].status == TaskStatus::Success);
    REQUIRE(results["b"].status == TaskStatus::Success);
    REQUIRE(results["excl"].status == TaskStatus::Success);
    REQUIRE(results["broken"].status == TaskStatus::Failed);
    REQUIRE(results["broken"].error == "segfault in tool wrapper");
    REQUIRE(results["failed"].status == TaskStatus::Failed);
}

TEST_CASE("executor_throwing_a_non_standard_exception_fails_only_its_task") {
    RunState state("run", one_input());
    Scheduler sched(state, [&](const TaskSpec& t, const InputSet&, const fs::path&, int) {
        if (t.name == "odd") {
            throw 42;
        }
        return ok_result(t);
    });

    std::vector<TaskSpec> tasks{make_task("a"), make_task("odd"), make_task("b")};
    ResultSet results = sched.run_all(one_input(), "/tmp/out", 4, tasks);

    REQUIRE(results.size() == 3);
    REQUIRE(results["a"].status == TaskStatus::Success);
    REQUIRE(results["b"].status == TaskStatus::Success);
    REQUIRE(results["odd"].status == TaskStatus::Failed);
    REQUIRE(results["odd"].error == "unknown exception");
}

TEST_CASE("disabled_tasks_are_skipped") {
    RunState state("run", one_input());
    std::atomic<int> calls{0};
    Scheduler sched(state, [&](const TaskSpec& t, const InputSet&, const fs::path&, int) {
        ++calls;
        return ok_result(t);
    });

    TaskSpec off = make_task("off");
    off.enabled = false;
    ResultSet results = sched.run_all(one_input(), "/tmp/out", 2, {make_task("on"), off});

    REQUIRE(calls.load() == 1);
    REQUIRE(results["off"].status == TaskStatus::Skipped);
    REQUIRE(results["off"].error == "disabled");
    REQUIRE(state.workspaces().size() == 1);
    REQUIRE(state.workspaces()[0].name == "on");
}

TEST_CASE("cancelled_before_start_runs_nothing") {
    RunState state("run", one_input());
    state.cancellation().request_cancel(2);
    std::atomic<int> calls{0};
    Scheduler sched(state, [&](const TaskSpec& t, const InputSet&, const fs::path&, int) {
        ++calls;
        return ok_result(t);
    });

    ResultSet results = sched.run_all(one_input(), "/tmp/out", 4,
                                      {make_task("a"), make_task("b"),
                                       make_task("x", TaskBatch::Exclusive)});

    REQUIRE(calls.load() == 0);
    for (const auto& [name, r] : results) {
        REQUIRE(r.status == TaskStatus::Skipped);
        REQUIRE(r.error == "cancelled");
    }
    REQUIRE(state.workspaces().empty());
}

TEST_CASE("cancellation_during_batch_stops_further_dispatch") {
    RunState state("run", one_input());
    std::vector<std::string> ran;
    Scheduler sched(state, [&](const TaskSpec& t, const InputSet&, const fs::path&, int) {
        ran.push_back(t.name);
        if (t.name == "first") {
            state.cancellation().request_cancel(15);
        }
        return ok_result(t);
    });

    // Two threads give a pool width of one, so dispatch is sequential.
    ResultSet results = sched.run_all(one_input(), "/tmp/out", 2,
                                      {make_task("first"), make_task("second"),
                                       make_task("excl", TaskBatch::Exclusive)});

    REQUIRE(ran == std::vector<std::string>{"first"});
    REQUIRE(results["first"].status == TaskStatus::Success);
    REQUIRE(results["second"].status == TaskStatus::Skipped);
    REQUIRE(results["second"].error == "cancelled");
    REQUIRE(results["excl"].status == TaskStatus::Skipped);
    REQUIRE(state.workspaces().size() == 1);
}

TEST_CASE("thread_policy_is_applied_before_budgeting") {
    RunState state("run", one_input());
    std::map<std::string, int> seen;
    std::mutex mtx;
    Scheduler sched(
        state,
        [&](const TaskSpec& t, const InputSet&, const fs::path&, int threads) {
            std::lock_guard<std::mutex> lock(mtx);
            seen[t.name] = threads;
            return ok_result(t);
        },
        nullptr, [](int) { return 1; });

    sched.run_all(one_input(), "/tmp/out", 16,
                  {make_task("a"), make_task("b"), make_task("x", TaskBatch::Exclusive)});

    REQUIRE(seen["a"] == 1);
    REQUIRE(seen["b"] == 1);
    REQUIRE(seen["x"] == 1);
}

TEST_CASE("partition_rejects_two_exclusive_tasks") {
    REQUIRE_THROWS_AS(runner::partition_tasks({make_task("x", TaskBatch::Exclusive),
                                               make_task("y", TaskBatch::Exclusive)}),
                      ValidationError);

    TaskSpec disabled = make_task("y", TaskBatch::Exclusive);
    disabled.enabled = false;
    auto p = runner::partition_tasks({make_task("x", TaskBatch::Exclusive), disabled,
                                      make_task("a"), make_task("r", TaskBatch::Post)});
    REQUIRE(p.exclusive->name == "x");
    REQUIRE(p.parallel.size() == 1);
    REQUIRE(p.post.size() == 1);
    REQUIRE(p.disabled.size() == 1);
}
