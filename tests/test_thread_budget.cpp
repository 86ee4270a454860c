#include "batchtyper/core/errors.hpp"
#include "batchtyper/core/thread_budget.hpp"

#include <catch2/catch.hpp>

#include <thread>

using batchtyper::core::ParallelPlan;
using batchtyper::core::plan_parallel_batch;

TEST_CASE("plan_two_tasks_four_threads") {
  ParallelPlan p = plan_parallel_batch(4, 2);
  REQUIRE(p.per_task_threads == 2);
  REQUIRE(p.pool_width == 2);
}

TEST_CASE("plan_never_drops_below_one") {
  ParallelPlan p = plan_parallel_batch(2, 5);
  REQUIRE(p.per_task_threads == 1);
  REQUIRE(p.pool_width == 1);

  p = plan_parallel_batch(1, 3);
  REQUIRE(p.per_task_threads == 1);
  REQUIRE(p.pool_width == 1);

  p = plan_parallel_batch(0, 3);
  REQUIRE(p.per_task_threads == 1);
  REQUIRE(p.pool_width == 1);
}

TEST_CASE("plan_pool_width_is_half_the_threads_capped_by_tasks") {
  REQUIRE(plan_parallel_batch(8, 5).pool_width == 4);
  REQUIRE(plan_parallel_batch(8, 5).per_task_threads == 1);
  REQUIRE(plan_parallel_batch(16, 5).pool_width == 5);
  REQUIRE(plan_parallel_batch(16, 5).per_task_threads == 3);
}

TEST_CASE("thread_policies") {
  using namespace batchtyper::core;
  REQUIRE(fixed_thread_policy(0) == 1);
  REQUIRE(fixed_thread_policy(12) == 12);

  const int hw = hardware_thread_policy(1 << 20);
  REQUIRE(hw >= 1);
  if (std::thread::hardware_concurrency() > 0) {
    REQUIRE(hw == static_cast<int>(std::thread::hardware_concurrency()));
  }
  REQUIRE(hardware_thread_policy(1) == 1);

  REQUIRE(thread_policy_from_name("fixed")(3) == 3);
  REQUIRE_THROWS_AS(thread_policy_from_name("auto"), batchtyper::ConfigError);
}
