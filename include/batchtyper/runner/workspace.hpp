#pragma once

#include "batchtyper/core/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace batchtyper::runner {

struct CleanupReport {
    fs::path workspace;
    std::vector<fs::path> removed;
    std::vector<std::string> warnings;

    bool clean() const { return warnings.empty(); }
};

/**
 * Copy-in and cleanup of per-tool working directories.
 *
 * stage() copies every input into the tool workspace and throws StageError on
 * the first failed copy. clean() never throws: each removal is attempted and
 * failures are collected as warnings. Purge entries that are absolute or climb
 * out with ".." are skipped with a warning. Calling clean() twice is harmless.
 */
class WorkspaceManager {
public:
    using WarningHook = std::function<void(const fs::path& workspace, const std::string& message)>;

    WorkspaceManager(std::vector<std::string> shared_output_dirs,
                     std::vector<std::string> temp_patterns);

    void stage(const TaskSpec& task, const InputSet& inputs) const;
    CleanupReport clean(const TaskSpec& task, const InputSet& inputs) const noexcept;

    void set_warning_hook(WarningHook hook) { warning_hook_ = std::move(hook); }

private:
    std::vector<std::string> shared_output_dirs_;
    std::vector<std::string> temp_patterns_;
    WarningHook warning_hook_;

    void remove_path(const fs::path& p, CleanupReport& report) const noexcept;
};

// Claim on a tool workspace. From construction on, release() or the
// destructor cleans exactly once, whether or not stage() ran or succeeded.
class WorkspaceLease {
public:
    WorkspaceLease(const WorkspaceManager& manager, const TaskSpec& task, const InputSet& inputs);
    ~WorkspaceLease();

    WorkspaceLease(const WorkspaceLease&) = delete;
    WorkspaceLease& operator=(const WorkspaceLease&) = delete;

    // Copies the inputs in; throws StageError and leaves partial copies to release().
    void stage();
    CleanupReport release() noexcept;
    bool released() const { return released_; }

private:
    const WorkspaceManager& manager_;
    const TaskSpec& task_;
    const InputSet& inputs_;
    bool released_ = false;
};

} // namespace batchtyper::runner
