#pragma once

#include "batchtyper/core/types.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace batchtyper::runner {

// Set once by the interrupt path, polled by the scheduler between tasks.
class CancellationToken {
public:
    void request_cancel(int signal_number = 0) noexcept {
        signal_.store(signal_number);
        cancelled_.store(true);
    }
    bool cancelled() const noexcept { return cancelled_.load(); }
    int signal() const noexcept { return signal_.load(); }

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<int> signal_{0};
};

/**
 * State shared by the scheduler and the interrupt controller for one run:
 * the inputs, the cancellation token and every workspace a task has been
 * dispatched to.
 */
class RunState {
public:
    RunState(std::string run_id, InputSet inputs);

    const std::string& run_id() const { return run_id_; }
    const InputSet& inputs() const { return inputs_; }

    CancellationToken& cancellation() { return token_; }
    const CancellationToken& cancellation() const { return token_; }

    // No-op for a workspace that is already registered.
    void register_workspace(const TaskSpec& task);
    std::vector<TaskSpec> workspaces() const;

private:
    std::string run_id_;
    InputSet inputs_;
    CancellationToken token_;

    mutable std::mutex mutex_;
    std::vector<TaskSpec> workspaces_;
};

} // namespace batchtyper::runner
