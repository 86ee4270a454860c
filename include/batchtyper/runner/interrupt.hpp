#pragma once

#include "batchtyper/runner/events.hpp"
#include "batchtyper/runner/run_state.hpp"
#include "batchtyper/runner/workspace.hpp"

#include <signal.h>
#include <functional>
#include <mutex>
#include <thread>

namespace batchtyper::runner {

// Cleans every workspace registered in the run state. Failures are logged
// and counted as warnings, never thrown. Returns the number of workspaces
// visited.
int emergency_cleanup(const RunState& state, const WorkspaceManager& workspaces) noexcept;

/**
 * SIGINT/SIGTERM handling for a run.
 *
 * The signal handler only writes the signal number into a self-pipe. A watcher
 * thread reads it, cancels the run, cleans all registered workspaces, emits
 * run_interrupted and terminates with 128 + signal. Only one controller can be
 * installed at a time.
 */
class InterruptController {
public:
    using ExitFunction = std::function<void(int exit_code)>;

    InterruptController(RunState& state, const WorkspaceManager& workspaces,
                        EventEmitter* events = nullptr);
    ~InterruptController();

    InterruptController(const InterruptController&) = delete;
    InterruptController& operator=(const InterruptController&) = delete;

    void install();
    void uninstall() noexcept;
    bool installed() const { return installed_; }

    // Replaces process termination, for tests.
    void set_exit_function(ExitFunction fn) { exit_fn_ = std::move(fn); }

    // The work done by the watcher thread for one delivered signal.
    void handle_signal(int signal_number);

private:
    RunState& state_;
    const WorkspaceManager& workspaces_;
    EventEmitter* events_;
    ExitFunction exit_fn_;

    bool installed_ = false;
    int pipe_fds_[2] = {-1, -1};
    struct sigaction old_int_ {};
    struct sigaction old_term_ {};
    std::thread watcher_;
    std::mutex handle_mutex_;

    void watch();
};

} // namespace batchtyper::runner
