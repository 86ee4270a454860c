#pragma once

#include "batchtyper/core/types.hpp"
#include "batchtyper/runner/workspace.hpp"

#include <string>
#include <vector>

namespace batchtyper::runner {

constexpr size_t kStderrExcerptLength = 200;

/**
 * Runs one external tool against the staged inputs and copies its result
 * artifact into output_root/<name>_results.
 *
 * Every error is converted into a Failed result; the workspace is cleaned
 * before run() returns on every path.
 */
class TaskRunner {
public:
    explicit TaskRunner(const WorkspaceManager& workspaces);

    TaskResult run(const TaskSpec& task, const InputSet& inputs, const fs::path& output_root,
                   int threads) const noexcept;

    // Single file name for tools that cannot take a pattern, else the pattern.
    static std::string input_argument(const TaskSpec& task, const InputSet& inputs);

    static std::vector<std::string> build_command(const TaskSpec& task, const InputSet& inputs,
                                                  int threads);

    static std::string stderr_excerpt(const std::string& stderr_output);

private:
    const WorkspaceManager& workspaces_;

    void check_tool(const TaskSpec& task) const;
    void purge_stale_result(const TaskSpec& task) const;
    void classify(const TaskSpec& task, int exit_code, TaskResult& result) const;
    void copy_result(const TaskSpec& task, const fs::path& output_root, TaskResult& result) const;
};

} // namespace batchtyper::runner
