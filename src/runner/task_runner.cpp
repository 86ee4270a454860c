#include "batchtyper/runner/task_runner.hpp"
#include "batchtyper/core/console.hpp"
#include "batchtyper/core/errors.hpp"
#include "batchtyper/core/utils.hpp"
#include "batchtyper/io/fileset.hpp"
#include "batchtyper/runner/process.hpp"

namespace batchtyper::runner {

using core::Console;

namespace {

std::string task_tag(const TaskSpec& task) {
    return "TASK " + task.name;
}

} // namespace

TaskRunner::TaskRunner(const WorkspaceManager& workspaces)
    : workspaces_(workspaces) {}

std::string TaskRunner::input_argument(const TaskSpec& task, const InputSet& inputs) {
    if (!task.accepts_pattern && inputs.size() == 1) {
        return inputs.front().name();
    }
    return io::derive_file_pattern(inputs);
}

std::vector<std::string> TaskRunner::build_command(const TaskSpec& task, const InputSet& inputs,
                                                   int threads) {
    const std::string input = input_argument(task, inputs);
    const std::string pattern = io::derive_file_pattern(inputs);
    const std::string thread_str = std::to_string(threads);
    const std::string workspace = task.workspace.string();

    auto expand = [&](std::string s) {
        s = core::replace_all(s, "{input}", input);
        s = core::replace_all(s, "{pattern}", pattern);
        s = core::replace_all(s, "{threads}", thread_str);
        s = core::replace_all(s, "{workspace}", workspace);
        return s;
    };

    std::vector<std::string> cmd;
    cmd.reserve(task.args.size() + 1);
    cmd.push_back(expand(task.executable));
    for (const auto& a : task.args) {
        cmd.push_back(expand(a));
    }
    return cmd;
}

std::string TaskRunner::stderr_excerpt(const std::string& stderr_output) {
    if (stderr_output.size() <= kStderrExcerptLength) return stderr_output;
    return stderr_output.substr(0, kStderrExcerptLength);
}

void TaskRunner::check_tool(const TaskSpec& task) const {
    if (!executable_available(task.executable, task.workspace)) {
        throw ToolExecutionError("executable '" + task.executable + "' not found for " +
                                 task.display_name());
    }
    for (const auto& f : task.required_files) {
        std::error_code ec;
        if (!fs::exists(task.workspace / f, ec)) {
            throw ToolExecutionError("required file missing: " + (task.workspace / f).string());
        }
    }
}

void TaskRunner::purge_stale_result(const TaskSpec& task) const {
    const fs::path stale = task.workspace / task.result_path;
    std::error_code ec;
    if (fs::exists(fs::symlink_status(stale, ec))) {
        Console::info(task_tag(task), "Removing previous result " + stale.string());
        fs::remove_all(stale, ec);
        if (ec) {
            Console::warning(task_tag(task), "cannot remove " + stale.string() + ": " + ec.message());
        }
    }
}

void TaskRunner::classify(const TaskSpec& task, int exit_code, TaskResult& result) const {
    const fs::path artifact = task.workspace / task.result_path;
    std::error_code ec;

    bool present = fs::exists(artifact, ec);
    if (present && task.require_nonempty_result && fs::is_directory(artifact, ec)) {
        present = core::is_nonempty_directory(artifact);
    }
    if (!present) {
        result.status = TaskStatus::Failed;
        result.error = "expected output not found: " + task.result_path;
        if (exit_code != 0) {
            result.error += " (exit code " + std::to_string(exit_code) + ")";
        }
        return;
    }

    result.status = TaskStatus::Success;

    if (exit_code != 0) {
        result.status = TaskStatus::SuccessWithWarnings;
        result.warnings.push_back("tool exited with code " + std::to_string(exit_code));
    }

    if (task.warning_markers.empty()) return;

    fs::path warning_file;
    if (fs::is_directory(artifact, ec)) {
        if (task.warning_file.empty()) return;
        warning_file = artifact / task.warning_file;
    } else {
        warning_file = task.warning_file.empty() ? artifact : task.workspace / task.warning_file;
    }
    if (!fs::is_regular_file(warning_file, ec)) return;

    const std::string content = core::read_text(warning_file);
    for (const auto& marker : task.warning_markers) {
        if (content.find(marker) != std::string::npos) {
            result.status = TaskStatus::SuccessWithWarnings;
            result.warnings.push_back(warning_file.filename().string() + " contains " + marker);
        }
    }
}

void TaskRunner::copy_result(const TaskSpec& task, const fs::path& output_root,
                             TaskResult& result) const {
    const fs::path src = task.workspace / task.result_path;
    const fs::path dest = output_root / task.result_dir_name();

    std::error_code ec;
    fs::remove_all(dest, ec);
    if (ec) {
        throw IOError("cannot replace " + dest.string() + ": " + ec.message());
    }

    if (fs::is_directory(src, ec)) {
        fs::create_directories(dest.parent_path(), ec);
        fs::copy(src, dest, fs::copy_options::recursive, ec);
    } else {
        fs::create_directories(dest, ec);
        if (!ec) {
            fs::copy_file(src, dest / src.filename(), fs::copy_options::overwrite_existing, ec);
        }
    }

    if (ec) {
        std::error_code ignored;
        fs::remove_all(dest, ignored);
        throw IOError("cannot copy " + src.string() + " to " + dest.string() + ": " + ec.message());
    }

    result.output_dir = dest;
}

TaskResult TaskRunner::run(const TaskSpec& task, const InputSet& inputs,
                           const fs::path& output_root, int threads) const noexcept {
    TaskResult result;
    result.task = task.name;
    result.threads = threads;
    result.started = Clock::now();

    const std::string tag = task_tag(task);

    try {
        WorkspaceLease lease(workspaces_, task, inputs);

        check_tool(task);
        purge_stale_result(task);
        lease.stage();

        const auto cmd = build_command(task, inputs, threads);
        Console::info(tag, "Running " + task.display_name() + " with " + std::to_string(threads) +
                               " thread(s): " + core::join(cmd, " "));

        ProcessResult proc = run_process(cmd, task.workspace);
        if (!proc.launched) {
            throw ToolExecutionError(proc.error);
        }
        result.exit_code = proc.exit_code;
        result.stderr_excerpt = stderr_excerpt(proc.stderr_output);

        classify(task, proc.exit_code, result);

        if (result.succeeded()) {
            copy_result(task, output_root, result);
        }

        lease.release();
    } catch (const std::exception& e) {
        result.status = TaskStatus::Failed;
        result.error = e.what();
        result.output_dir.reset();
    } catch (...) {
        result.status = TaskStatus::Failed;
        result.error = "unknown exception";
        result.output_dir.reset();
    }

    result.finished = Clock::now();

    switch (result.status) {
        case TaskStatus::Success:
            Console::success(tag, task.display_name() + " completed");
            break;
        case TaskStatus::SuccessWithWarnings:
            Console::warning(tag, task.display_name() + " completed with warnings: " +
                                      core::join(result.warnings, "; "));
            break;
        default:
            Console::error(tag, task.display_name() + " failed: " + result.error);
            if (!result.stderr_excerpt.empty()) {
                Console::error(tag, "stderr: " + result.stderr_excerpt);
            }
            break;
    }

    return result;
}

} // namespace batchtyper::runner
