#include "batchtyper/config/configuration.hpp"
#include "batchtyper/core/console.hpp"
#include "batchtyper/core/errors.hpp"
#include "batchtyper/core/thread_budget.hpp"
#include "batchtyper/core/utils.hpp"
#include "batchtyper/io/fileset.hpp"
#include "batchtyper/runner/aggregator.hpp"
#include "batchtyper/runner/events.hpp"
#include "batchtyper/runner/interrupt.hpp"
#include "batchtyper/runner/manifest.hpp"
#include "batchtyper/runner/run_state.hpp"
#include "batchtyper/runner/scheduler.hpp"
#include "batchtyper/runner/task_runner.hpp"
#include "batchtyper/runner/workspace.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct RunOptions {
  std::string input;
  std::string output;
  int threads = 0; // 0 = config value
  std::string config_path;
  std::string tools_root;
  std::vector<std::string> skip;
  bool dry_run = false;
  bool no_checksums = false;
  bool json_events = false;
};

std::string pad(const std::string &s, size_t width) {
  if (s.size() >= width)
    return s + " ";
  return s + std::string(width - s.size(), ' ');
}

void print_analysis_plan(const std::vector<batchtyper::TaskSpec> &tasks) {
  using batchtyper::core::Console;
  Console::line("Analysis plan:");
  for (const auto &t : tasks) {
    std::string line = "  " + pad(t.enabled ? "ENABLED" : "SKIPPED", 9) +
                        pad(t.display_name(), 20);
    if (t.batch != batchtyper::TaskBatch::Parallel) {
      line += "[" + batchtyper::task_batch_to_string(t.batch) + "] ";
    }
    line += t.description;
    Console::line(line);
  }
}

void print_dry_run(const std::vector<batchtyper::TaskSpec> &tasks,
                   const batchtyper::InputSet &inputs, int budget) {
  using namespace batchtyper;
  using core::Console;

  int parallel_count = 0;
  for (const auto &t : tasks) {
    if (t.enabled && t.batch == TaskBatch::Parallel)
      ++parallel_count;
  }
  const core::ParallelPlan plan =
      core::plan_parallel_batch(budget, parallel_count);

  Console::line("Dry run: " + std::to_string(parallel_count) +
                " parallel analyses, " + std::to_string(plan.pool_width) +
                " worker(s), " + std::to_string(plan.per_task_threads) +
                " thread(s) each; sequential analyses get " +
                std::to_string(budget) + " thread(s)");

  for (const auto &t : tasks) {
    if (!t.enabled)
      continue;
    const int threads =
        t.batch == TaskBatch::Parallel ? plan.per_task_threads : budget;
    std::vector<std::string> quoted;
    for (const auto &arg : runner::TaskRunner::build_command(t, inputs, threads)) {
      quoted.push_back(core::shell_quote(arg));
    }
    Console::line("  [" + t.name + "] (cd " + core::shell_quote(t.workspace.string()) +
                  " && " + core::join(quoted, " ") + ")");
  }
}

void print_results(const batchtyper::ResultSet &results,
                   const std::vector<std::string> &order) {
  using namespace batchtyper;
  using core::Console;

  auto describe = [](const TaskResult &r) {
    switch (r.status) {
    case TaskStatus::Success:
      return std::string("  [OK]   ") + r.task;
    case TaskStatus::SuccessWithWarnings:
      return std::string("  [WARN] ") + r.task + " (" + core::join(r.warnings, "; ") + ")";
    case TaskStatus::Failed:
      return std::string("  [FAIL] ") + r.task + ": " + r.error;
    case TaskStatus::Skipped:
    default:
      return std::string("  [SKIP] ") + r.task + " (" + r.error + ")";
    }
  };

  Console::line("Results:");
  for (const auto &name : order) {
    auto it = results.find(name);
    if (it != results.end())
      Console::line(describe(it->second));
  }
  for (const auto &[name, r] : results) {
    if (r.status == TaskStatus::Skipped)
      Console::line(describe(r));
  }
}

int run_command(const RunOptions &opts) {
  using namespace batchtyper;
  using core::Console;

  Console::init_from_env();

  // Configuration
  config::Config cfg;
  std::optional<fs::path> cfg_path;
  try {
    if (opts.config_path.empty()) {
      cfg = config::Config::defaults();
    } else {
      cfg_path = fs::path(opts.config_path);
      cfg = config::Config::load(*cfg_path);
    }
    if (opts.threads > 0) {
      cfg.run.threads = opts.threads;
    }
    for (const auto &name : opts.skip) {
      bool found = false;
      for (auto &t : cfg.tools) {
        if (t.name == name) {
          t.enabled = false;
          found = true;
        }
      }
      if (!found) {
        throw ConfigError("unknown tool in --skip: " + name);
      }
    }
    cfg.validate();
  } catch (const BatchTyperError &e) {
    Console::error("CONFIG", e.what());
    return kExitUsage;
  }

  const fs::path tools_root = opts.tools_root.empty()
                                  ? config::default_tools_root(cfg_path)
                                  : fs::absolute(opts.tools_root);
  std::vector<TaskSpec> tasks;
  try {
    tasks = cfg.resolve_tasks(tools_root);
  } catch (const BatchTyperError &e) {
    Console::error("CONFIG", e.what());
    return kExitUsage;
  }
  const core::ThreadPolicy policy =
      core::thread_policy_from_name(cfg.run.thread_policy);
  const int budget = policy(cfg.run.threads);

  // Inputs
  InputSet inputs;
  try {
    inputs = io::resolve_inputs(opts.input, cfg.input.extensions);
    if (inputs.empty()) {
      throw NoInputFiles(opts.input);
    }
  } catch (const BatchTyperError &e) {
    Console::error("INPUT", e.what());
    return kExitFailure;
  }

  const std::string pattern = io::derive_file_pattern(inputs);
  Console::info("INPUT", "Found " + std::to_string(inputs.size()) +
                             " input file(s), formats: " +
                             core::join(io::detected_extensions(inputs), ", ") +
                             ", pattern " + pattern);
  Console::info("INPUT", "Tools root: " + tools_root.string());

  print_analysis_plan(tasks);

  if (opts.dry_run) {
    print_dry_run(tasks, inputs, budget);
    return kExitOk;
  }

  // Run directory
  const fs::path output_root = fs::absolute(opts.output).lexically_normal();
  fs::create_directories(output_root / "logs");

  const std::string run_id = core::get_run_id();
  const std::string started_at = core::get_iso_timestamp();
  std::ofstream event_log_file(output_root / "logs" / "run_events.jsonl",
                               std::ios::app);
  if (!event_log_file) {
    Console::warning("RUN", "cannot open event log in " +
                                (output_root / "logs").string());
  }
  runner::EventEmitter emitter(&event_log_file, opts.json_events);

  cfg.save(output_root / "config.yaml");

  std::vector<std::string> enabled_names;
  for (const auto &t : tasks) {
    if (t.enabled)
      enabled_names.push_back(t.name);
  }
  emitter.run_start(run_id, {{"input_specifier", opts.input},
                             {"output_root", output_root.string()},
                             {"tools_root", tools_root.string()},
                             {"inputs", inputs.size()},
                             {"pattern", pattern},
                             {"threads", budget},
                             {"tasks", enabled_names}});

  Console::info("RUN", "Run ID: " + run_id);
  Console::info("RUN", "Output: " + output_root.string());

  runner::RunState state(run_id, inputs);
  runner::WorkspaceManager workspaces(cfg.cleanup.output_dirs,
                                      cfg.cleanup.temp_patterns);
  workspaces.set_warning_hook(
      [&emitter, &run_id](const fs::path &ws, const std::string &msg) {
        emitter.cleanup_warning(run_id, ws.string(), msg);
      });

  runner::InterruptController interrupts(state, workspaces, &emitter);
  interrupts.install();

  runner::TaskRunner task_runner(workspaces);
  runner::Scheduler scheduler(
      state,
      [&task_runner](const TaskSpec &task, const InputSet &in,
                     const fs::path &out, int threads) {
        return task_runner.run(task, in, out, threads);
      },
      &emitter, policy);

  ResultSet results;
  try {
    results = scheduler.run_all(inputs, output_root, cfg.run.threads, tasks);
  } catch (const std::exception &e) {
    Console::error("RUN", e.what());
    runner::emergency_cleanup(state, workspaces);
    emitter.run_error(run_id, e.what());
    interrupts.uninstall();
    return kExitFailure;
  }

  interrupts.uninstall();

  const runner::RunSummary summary = runner::summarize(results);
  print_results(results, scheduler.completion_order());
  Console::line(runner::summary_line(summary));

  runner::RunInfo info;
  info.run_id = run_id;
  info.input_specifier = opts.input;
  info.output_root = output_root;
  info.pattern = pattern;
  info.threads = budget;
  info.started_at = started_at;
  info.finished_at = core::get_iso_timestamp();
  try {
    auto manifest = runner::build_manifest(info, inputs, results, summary,
                                           !opts.no_checksums);
    runner::write_manifest(output_root, manifest);
  } catch (const std::exception &e) {
    Console::warning("RUN", std::string("manifest not written: ") + e.what());
    emitter.warning(run_id, std::string("manifest not written: ") + e.what());
  }

  emitter.run_end(run_id, summary.all_succeeded,
                  {{"summary", runner::summary_to_json(summary)}});

  Console::info("RUN", "Results in " + output_root.string());
  return summary.all_succeeded ? kExitOk : kExitFailure;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"BatchTyper Runner - runs the typing tools over a batch of assemblies"};
  app.require_subcommand(1);

  RunOptions opts;
  auto run_cmd = app.add_subcommand("run", "Run all enabled analyses");
  run_cmd->add_option("-i,--input", opts.input,
                      "Input file, directory or wildcard pattern")
      ->required();
  run_cmd->add_option("-o,--output", opts.output, "Output directory")
      ->required();
  run_cmd->add_option("-t,--threads", opts.threads, "Total thread budget")
      ->check(CLI::PositiveNumber);
  run_cmd->add_option("--config", opts.config_path, "Path to config.yaml");
  run_cmd->add_option("--tools-root", opts.tools_root,
                      "Directory the tool workspaces are relative to");
  run_cmd->add_option("--skip", opts.skip, "Skip the named analysis (repeatable)");
  run_cmd->add_flag("--dry-run", opts.dry_run,
                    "Print the plan and commands without running anything");
  run_cmd->add_flag("--no-checksums", opts.no_checksums,
                    "Do not record input SHA-256 checksums in the manifest");
  run_cmd->add_flag("--json-events", opts.json_events,
                    "Echo JSONL events to stdout");

  std::vector<std::pair<std::string, bool>> skip_flags;
  for (const auto &t : batchtyper::config::Config::builtin_tools()) {
    skip_flags.emplace_back(t.name, false);
  }
  for (auto &[name, flag] : skip_flags) {
    run_cmd->add_flag("--skip-" + name, flag, "Skip " + name);
  }

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    const int rc = app.exit(e);
    return rc == 0 ? kExitOk : kExitUsage;
  }

  for (const auto &[name, flag] : skip_flags) {
    if (flag)
      opts.skip.push_back(name);
  }

  try {
    return run_command(opts);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitFailure;
  }
}
