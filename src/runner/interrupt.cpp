#include "batchtyper/runner/interrupt.hpp"
#include "batchtyper/core/console.hpp"
#include "batchtyper/core/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <unistd.h>

namespace batchtyper::runner {

using core::Console;

namespace {

// Write end of the active controller's self-pipe.
volatile sig_atomic_t g_signal_fd = -1;

void on_termination_signal(int signal_number) {
    const int saved_errno = errno;
    const int fd = g_signal_fd;
    if (fd >= 0) {
        unsigned char byte = static_cast<unsigned char>(signal_number);
        ssize_t n = ::write(fd, &byte, 1);
        (void)n;
    }
    errno = saved_errno;
}

void terminate_process(int exit_code) {
    std::cout.flush();
    std::cerr.flush();
    std::_Exit(exit_code);
}

} // namespace

int emergency_cleanup(const RunState& state, const WorkspaceManager& workspaces) noexcept {
    int visited = 0;
    int warnings = 0;
    for (const auto& task : state.workspaces()) {
        CleanupReport report = workspaces.clean(task, state.inputs());
        warnings += static_cast<int>(report.warnings.size());
        ++visited;
    }
    Console::info("INTERRUPT", "Emergency cleanup visited " + std::to_string(visited) +
                                   " workspace(s)" +
                                   (warnings > 0 ? ", " + std::to_string(warnings) + " warning(s)"
                                                 : std::string()));
    return visited;
}

InterruptController::InterruptController(RunState& state, const WorkspaceManager& workspaces,
                                         EventEmitter* events)
    : state_(state), workspaces_(workspaces), events_(events), exit_fn_(terminate_process) {}

InterruptController::~InterruptController() {
    uninstall();
}

void InterruptController::install() {
    if (installed_) return;
    if (g_signal_fd >= 0) {
        throw BatchTyperError("another interrupt controller is already installed");
    }

    if (::pipe2(pipe_fds_, O_CLOEXEC) != 0) {
        throw IOError(std::string("cannot create signal pipe: ") + std::strerror(errno));
    }

    auto fail = [this](const std::string& what) {
        const int err = errno;
        g_signal_fd = -1;
        ::close(pipe_fds_[0]);
        ::close(pipe_fds_[1]);
        pipe_fds_[0] = pipe_fds_[1] = -1;
        throw IOError(what + ": " + std::strerror(err));
    };

    const int flags = ::fcntl(pipe_fds_[1], F_GETFL);
    if (flags < 0 || ::fcntl(pipe_fds_[1], F_SETFL, flags | O_NONBLOCK) != 0) {
        fail("cannot make signal pipe non-blocking");
    }

    g_signal_fd = pipe_fds_[1];

    struct sigaction sa {};
    sa.sa_handler = on_termination_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, &old_int_) != 0) {
        fail("cannot install SIGINT handler");
    }
    if (::sigaction(SIGTERM, &sa, &old_term_) != 0) {
        const int err = errno;
        ::sigaction(SIGINT, &old_int_, nullptr);
        errno = err;
        fail("cannot install SIGTERM handler");
    }

    // Signals arriving before the watcher starts wait in the pipe.
    watcher_ = std::thread(&InterruptController::watch, this);

    installed_ = true;
}

void InterruptController::uninstall() noexcept {
    if (!installed_) return;

    ::sigaction(SIGINT, &old_int_, nullptr);
    ::sigaction(SIGTERM, &old_term_, nullptr);
    g_signal_fd = -1;

    // Zero byte stops the watcher.
    unsigned char stop = 0;
    ssize_t n;
    do {
        n = ::write(pipe_fds_[1], &stop, 1);
    } while (n < 0 && errno == EINTR);

    if (watcher_.joinable()) {
        watcher_.join();
    }

    ::close(pipe_fds_[0]);
    ::close(pipe_fds_[1]);
    pipe_fds_[0] = pipe_fds_[1] = -1;
    installed_ = false;
}

void InterruptController::watch() {
    for (;;) {
        unsigned char byte = 0;
        ssize_t n = ::read(pipe_fds_[0], &byte, 1);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0 || byte == 0) break;

        try {
            handle_signal(static_cast<int>(byte));
        } catch (const std::exception& e) {
            Console::error("INTERRUPT", e.what());
            exit_fn_(128 + static_cast<int>(byte));
        }
    }
}

void InterruptController::handle_signal(int signal_number) {
    std::lock_guard<std::mutex> lock(handle_mutex_);

    state_.cancellation().request_cancel(signal_number);
    Console::warning("INTERRUPT", "Received signal " + std::to_string(signal_number) +
                                      ", stopping and cleaning up workspaces");

    emergency_cleanup(state_, workspaces_);

    if (events_) {
        events_->run_interrupted(state_.run_id(), signal_number);
    }

    Console::error("INTERRUPT", "Run interrupted");
    exit_fn_(128 + signal_number);
}

} // namespace batchtyper::runner
