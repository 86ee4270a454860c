#include "batchtyper/runner/workspace.hpp"
#include "batchtyper/core/console.hpp"
#include "batchtyper/core/errors.hpp"
#include "batchtyper/core/utils.hpp"

#include <algorithm>

namespace batchtyper::runner {

using core::Console;

namespace {

bool stays_inside(const std::string& rel) {
    if (rel.empty() || fs::path(rel).is_absolute()) return false;
    for (const auto& part : fs::path(rel)) {
        if (part == "..") return false;
    }
    return fs::path(rel).lexically_normal() != ".";
}

} // namespace

WorkspaceManager::WorkspaceManager(std::vector<std::string> shared_output_dirs,
                                   std::vector<std::string> temp_patterns)
    : shared_output_dirs_(std::move(shared_output_dirs)),
      temp_patterns_(std::move(temp_patterns)) {}

void WorkspaceManager::stage(const TaskSpec& task, const InputSet& inputs) const {
    if (!task.stage_inputs) return;

    std::error_code ec;
    if (!fs::is_directory(task.workspace, ec)) {
        throw StageError("workspace does not exist: " + task.workspace.string());
    }

    for (const auto& input : inputs) {
        const fs::path dest = task.workspace / input.name();
        fs::copy_file(input.path, dest, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw StageError("cannot copy " + input.path.string() + " to " +
                             task.workspace.string() + ": " + ec.message());
        }
    }
}

void WorkspaceManager::remove_path(const fs::path& p, CleanupReport& report) const noexcept {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(p, ec))) return;

    fs::remove_all(p, ec);
    if (ec) {
        std::string msg = "cannot remove " + p.string() + ": " + ec.message();
        Console::warning("CLEAN", msg);
        report.warnings.push_back(msg);
        if (warning_hook_) {
            try {
                warning_hook_(report.workspace, msg);
            } catch (const std::exception& e) {
                Console::error("CLEAN", std::string("warning hook failed: ") + e.what());
            }
        }
        return;
    }
    report.removed.push_back(p);
}

CleanupReport WorkspaceManager::clean(const TaskSpec& task, const InputSet& inputs) const noexcept {
    CleanupReport report;
    report.workspace = task.workspace;

    std::error_code ec;
    if (!fs::is_directory(task.workspace, ec)) {
        return report;
    }

    try {
        if (task.stage_inputs) {
            for (const auto& input : inputs) {
                remove_path(task.workspace / input.name(), report);
            }
        }

        std::vector<std::string> dirs = task.purge_dirs;
        for (const auto& d : shared_output_dirs_) {
            if (std::find(dirs.begin(), dirs.end(), d) == dirs.end()) dirs.push_back(d);
        }
        if (!task.result_path.empty()) {
            const std::string top = fs::path(task.result_path).begin()->string();
            if (std::find(dirs.begin(), dirs.end(), top) == dirs.end()) dirs.push_back(top);
        }
        for (const auto& d : dirs) {
            if (!stays_inside(d)) {
                std::string msg = "refusing to purge '" + d + "' outside " + task.workspace.string();
                Console::warning("CLEAN", msg);
                report.warnings.push_back(msg);
                continue;
            }
            remove_path(task.workspace / d, report);
        }

        if (task.purge_temp_files) {
            for (const auto& pattern : temp_patterns_) {
                for (const auto& match : core::glob(task.workspace, pattern)) {
                    if (fs::is_regular_file(fs::symlink_status(match, ec))) {
                        remove_path(match, report);
                    }
                }
            }
        }
    } catch (const std::exception& e) {
        std::string msg = "cleanup of " + task.workspace.string() + " aborted: " + e.what();
        Console::warning("CLEAN", msg);
        report.warnings.push_back(msg);
    }

    if (!report.removed.empty()) {
        Console::info("CLEAN", task.display_name() + ": removed " +
                                   std::to_string(report.removed.size()) + " item(s) from " +
                                   task.workspace.string());
    }
    return report;
}

WorkspaceLease::WorkspaceLease(const WorkspaceManager& manager, const TaskSpec& task,
                               const InputSet& inputs)
    : manager_(manager), task_(task), inputs_(inputs) {}

void WorkspaceLease::stage() {
    manager_.stage(task_, inputs_);
}

WorkspaceLease::~WorkspaceLease() {
    release();
}

CleanupReport WorkspaceLease::release() noexcept {
    if (released_) {
        CleanupReport empty;
        empty.workspace = task_.workspace;
        return empty;
    }
    released_ = true;
    return manager_.clean(task_, inputs_);
}

} // namespace batchtyper::runner
