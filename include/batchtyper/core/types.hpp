#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace batchtyper {

namespace fs = std::filesystem;

using Clock = std::chrono::system_clock;

// One resolved input. Path is absolute, extension lower-cased with its dot.
struct InputFile {
    fs::path path;
    std::string extension;

    std::string name() const { return path.filename().string(); }

    bool operator<(const InputFile& other) const { return path < other.path; }
    bool operator==(const InputFile& other) const { return path == other.path; }
};

// Sorted, duplicate-free.
using InputSet = std::vector<InputFile>;

enum class TaskBatch {
    Parallel,
    Exclusive,  // runs alone after the parallel batch drains
    Post        // runs after the exclusive task, no concurrency
};

inline std::string task_batch_to_string(TaskBatch batch) {
    switch (batch) {
        case TaskBatch::Parallel: return "parallel";
        case TaskBatch::Exclusive: return "exclusive";
        case TaskBatch::Post: return "post";
        default: return "unknown";
    }
}

inline std::optional<TaskBatch> string_to_task_batch(const std::string& s) {
    if (s == "parallel") return TaskBatch::Parallel;
    if (s == "exclusive") return TaskBatch::Exclusive;
    if (s == "post") return TaskBatch::Post;
    return std::nullopt;
}

enum class TaskStatus {
    Success,
    SuccessWithWarnings,
    Failed,
    Skipped
};

inline std::string task_status_to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Success: return "success";
        case TaskStatus::SuccessWithWarnings: return "success_with_warnings";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Skipped: return "skipped";
        default: return "unknown";
    }
}

// Declarative description of one wrapped tool. Argument templates may use
// {input}, {pattern}, {threads} and {workspace}.
struct TaskSpec {
    std::string name;
    std::string label;
    std::string description;
    fs::path workspace;
    std::string executable;
    std::vector<std::string> args;
    std::vector<std::string> required_files;
    bool accepts_pattern = true;
    TaskBatch batch = TaskBatch::Parallel;
    std::string result_path;
    bool require_nonempty_result = false;
    std::vector<std::string> purge_dirs;
    bool purge_temp_files = true;
    std::string warning_file;
    std::vector<std::string> warning_markers;
    bool stage_inputs = true;
    bool enabled = true;

    std::string display_name() const { return label.empty() ? name : label; }
    std::string result_dir_name() const { return name + "_results"; }
};

struct TaskResult {
    std::string task;
    TaskStatus status = TaskStatus::Skipped;
    int exit_code = -1;
    int threads = 1;
    std::string error;
    std::string stderr_excerpt;
    std::vector<std::string> warnings;
    std::optional<fs::path> output_dir;
    Clock::time_point started{};
    Clock::time_point finished{};

    bool succeeded() const {
        return status == TaskStatus::Success ||
               status == TaskStatus::SuccessWithWarnings;
    }
};

// Keyed by task name. Iteration order says nothing about completion order.
using ResultSet = std::map<std::string, TaskResult>;

} // namespace batchtyper
