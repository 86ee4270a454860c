#include "test_support.hpp"

#include "batchtyper/core/errors.hpp"
#include "batchtyper/runner/workspace.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

using namespace batchtyper;
using batchtyper::runner::WorkspaceLease;
using batchtyper::runner::WorkspaceManager;

namespace {

WorkspaceManager make_manager() {
    return WorkspaceManager({"results", "mlst_results"},
                            {"*.txt", "*.log", "*.tmp", "temp_*", "*.html", "*.tsv"});
}

struct Fixture {
    test::TempDir dir;
    fs::path workspace;
    InputSet inputs;
    TaskSpec task;

    Fixture() {
        workspace = dir / "tool";
        fs::create_directories(workspace);
        test::write_script(workspace / "tool.sh", "exit 0");
        inputs = {test::make_input(test::write_file(dir / "in" / "a.fna")),
                  test::make_input(test::write_file(dir / "in" / "b.fna"))};
        task = test::script_task("demo", workspace, "out/summary");
        task.purge_dirs = {"scratch"};
    }
};

} // namespace

TEST_CASE("stage_copies_every_input") {
    Fixture f;
    auto mgr = make_manager();
    mgr.stage(f.task, f.inputs);

    REQUIRE(fs::is_regular_file(f.workspace / "a.fna"));
    REQUIRE(fs::is_regular_file(f.workspace / "b.fna"));
    REQUIRE_FALSE(fs::is_symlink(f.workspace / "a.fna"));
    REQUIRE(core::read_text(f.workspace / "a.fna") == core::read_text(f.inputs[0].path));
}

TEST_CASE("stage_overwrites_same_named_file") {
    Fixture f;
    test::write_file(f.workspace / "a.fna", "stale");
    make_manager().stage(f.task, f.inputs);
    REQUIRE(core::read_text(f.workspace / "a.fna") == ">seq\nACGT\n");
}

TEST_CASE("stage_into_missing_workspace_throws_stage_error") {
    Fixture f;
    f.task.workspace = f.dir / "missing";
    REQUIRE_THROWS_AS(make_manager().stage(f.task, f.inputs), StageError);
}

TEST_CASE("stage_is_skipped_when_task_does_not_stage_inputs") {
    Fixture f;
    f.task.stage_inputs = false;
    make_manager().stage(f.task, f.inputs);
    REQUIRE_FALSE(fs::exists(f.workspace / "a.fna"));
}

TEST_CASE("clean_removes_inputs_outputs_and_temp_files_only") {
    Fixture f;
    auto mgr = make_manager();
    mgr.stage(f.task, f.inputs);
    test::write_file(f.workspace / "results" / "x.tsv");
    test::write_file(f.workspace / "scratch" / "y");
    test::write_file(f.workspace / "out" / "summary" / "z");
    test::write_file(f.workspace / "run.log");
    test::write_file(f.workspace / "temp_42");
    test::write_file(f.workspace / "config.ini");

    auto report = mgr.clean(f.task, f.inputs);

    REQUIRE(report.clean());
    REQUIRE_FALSE(fs::exists(f.workspace / "a.fna"));
    REQUIRE_FALSE(fs::exists(f.workspace / "b.fna"));
    REQUIRE_FALSE(fs::exists(f.workspace / "results"));
    REQUIRE_FALSE(fs::exists(f.workspace / "scratch"));
    REQUIRE_FALSE(fs::exists(f.workspace / "out"));
    REQUIRE_FALSE(fs::exists(f.workspace / "run.log"));
    REQUIRE_FALSE(fs::exists(f.workspace / "temp_42"));
    REQUIRE(fs::exists(f.workspace / "tool.sh"));
    REQUIRE(fs::exists(f.workspace / "config.ini"));
}

TEST_CASE("clean_is_idempotent") {
    Fixture f;
    auto mgr = make_manager();
    mgr.stage(f.task, f.inputs);

    auto first = mgr.clean(f.task, f.inputs);
    auto second = mgr.clean(f.task, f.inputs);

    REQUIRE(first.removed.size() == 2);
    REQUIRE(second.removed.empty());
    REQUIRE(second.clean());
    REQUIRE(fs::exists(f.workspace / "tool.sh"));
}

TEST_CASE("clean_of_missing_workspace_is_a_no_op") {
    Fixture f;
    f.task.workspace = f.dir / "missing";
    auto report = make_manager().clean(f.task, f.inputs);
    REQUIRE(report.removed.empty());
    REQUIRE(report.clean());
}

TEST_CASE("clean_keeps_temp_patterns_when_disabled") {
    Fixture f;
    f.task.purge_temp_files = false;
    test::write_file(f.workspace / "report.html");
    make_manager().clean(f.task, f.inputs);
    REQUIRE(fs::exists(f.workspace / "report.html"));
}

TEST_CASE("lease_cleans_on_scope_exit") {
    Fixture f;
    auto mgr = make_manager();
    {
        WorkspaceLease lease(mgr, f.task, f.inputs);
        lease.stage();
        REQUIRE(fs::exists(f.workspace / "a.fna"));
        REQUIRE_FALSE(lease.released());
    }
    REQUIRE_FALSE(fs::exists(f.workspace / "a.fna"));
}

TEST_CASE("lease_release_is_idempotent") {
    Fixture f;
    auto mgr = make_manager();
    WorkspaceLease lease(mgr, f.task, f.inputs);
    lease.stage();

    auto first = lease.release();
    REQUIRE(first.removed.size() == 2);

    // Anything written after release belongs to someone else.
    test::write_file(f.workspace / "a.fna");
    auto second = lease.release();
    REQUIRE(second.removed.empty());
    REQUIRE(fs::exists(f.workspace / "a.fna"));
}

TEST_CASE("lease_cleans_partial_copies_when_staging_fails") {
    Fixture f;
    f.inputs.push_back(test::make_input(f.dir / "in" / "zz_missing.fna"));
    auto mgr = make_manager();

    {
        WorkspaceLease lease(mgr, f.task, f.inputs);
        REQUIRE_THROWS_AS(lease.stage(), StageError);
        REQUIRE(fs::exists(f.workspace / "a.fna"));
    }
    REQUIRE_FALSE(fs::exists(f.workspace / "a.fna"));
    REQUIRE_FALSE(fs::exists(f.workspace / "b.fna"));
}

TEST_CASE("lease_cleans_when_body_throws") {
    Fixture f;
    auto mgr = make_manager();
    try {
        WorkspaceLease lease(mgr, f.task, f.inputs);
        lease.stage();
        throw std::runtime_error("tool crashed");
    } catch (const std::runtime_error&) {
    }
    REQUIRE_FALSE(fs::exists(f.workspace / "a.fna"));
}

TEST_CASE("lease_cleans_even_when_never_staged") {
    Fixture f;
    auto mgr = make_manager();
    test::write_file(f.workspace / "a.fna");
    test::write_file(f.workspace / "results" / "old.tsv");
    {
        WorkspaceLease lease(mgr, f.task, f.inputs);
    }
    REQUIRE_FALSE(fs::exists(f.workspace / "a.fna"));
    REQUIRE_FALSE(fs::exists(f.workspace / "results"));
    REQUIRE(fs::exists(f.workspace / "tool.sh"));
}

TEST_CASE("clean_never_removes_paths_outside_the_workspace") {
    Fixture f;
    const fs::path victim = f.dir / "victim";
    test::write_file(victim / "keep");
    test::write_file(f.dir / "sibling" / "keep");
    f.task.purge_dirs = {victim.string(), "../sibling", ".", "scratch"};
    test::write_file(f.workspace / "scratch" / "y");

    auto report = make_manager().clean(f.task, f.inputs);

    REQUIRE(fs::exists(victim / "keep"));
    REQUIRE(fs::exists(f.dir / "sibling" / "keep"));
    REQUIRE(fs::exists(f.workspace / "tool.sh"));
    REQUIRE_FALSE(fs::exists(f.workspace / "scratch"));
    REQUIRE(report.warnings.size() == 3);
}
