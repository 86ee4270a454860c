#include "batchtyper/runner/run_state.hpp"

#include <algorithm>

namespace batchtyper::runner {

RunState::RunState(std::string run_id, InputSet inputs)
    : run_id_(std::move(run_id)), inputs_(std::move(inputs)) {}

void RunState::register_workspace(const TaskSpec& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(workspaces_.begin(), workspaces_.end(),
                           [&](const TaskSpec& t) { return t.workspace == task.workspace; });
    if (it == workspaces_.end()) {
        workspaces_.push_back(task);
    }
}

std::vector<TaskSpec> RunState::workspaces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workspaces_;
}

} // namespace batchtyper::runner
