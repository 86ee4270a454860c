#include "batchtyper/runner/process.hpp"
#include "batchtyper/core/utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace batchtyper::runner {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool make_pipe(int fds[2]) {
    return ::pipe2(fds, O_CLOEXEC) == 0;
}

// Child side, between fork and exec: async-signal-safe calls only.
[[noreturn]] void exec_child(char* const* argv, const char* cwd, int stdin_fd,
                             int stdout_fd, int stderr_fd, int status_fd) {
    if (cwd && ::chdir(cwd) != 0) {
        int err = errno;
        ssize_t n = ::write(status_fd, &err, sizeof(err));
        (void)n;
        ::_exit(127);
    }
    if (stdin_fd >= 0) ::dup2(stdin_fd, STDIN_FILENO);
    ::dup2(stdout_fd, STDOUT_FILENO);
    ::dup2(stderr_fd, STDERR_FILENO);

    ::execvp(argv[0], argv);

    int err = errno;
    ssize_t n = ::write(status_fd, &err, sizeof(err));
    (void)n;
    ::_exit(127);
}

void drain(int& out_fd, int& err_fd, std::string& out, std::string& err) {
    char buffer[4096];
    while (out_fd >= 0 || err_fd >= 0) {
        struct pollfd fds[2];
        nfds_t count = 0;
        int* owners[2] = {nullptr, nullptr};
        std::string* sinks[2] = {nullptr, nullptr};
        if (out_fd >= 0) {
            fds[count] = {out_fd, POLLIN, 0};
            owners[count] = &out_fd;
            sinks[count] = &out;
            ++count;
        }
        if (err_fd >= 0) {
            fds[count] = {err_fd, POLLIN, 0};
            owners[count] = &err_fd;
            sinks[count] = &err;
            ++count;
        }

        int ready = ::poll(fds, count, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            close_fd(out_fd);
            close_fd(err_fd);
            return;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close_fd(*owners[i]);
            }
        }
    }
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv, const fs::path& cwd) {
    ProcessResult result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    std::vector<char*> c_args;
    c_args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        c_args.push_back(const_cast<char*>(a.c_str()));
    }
    c_args.push_back(nullptr);
    const std::string cwd_str = cwd.string();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(status_pipe)) {
        result.error = std::string("Failed to create pipes: ") + std::strerror(errno);
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(status_pipe[0]); close_fd(status_pipe[1]);
        return result;
    }
    int null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error = std::string("Failed to fork: ") + std::strerror(errno);
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(status_pipe[0]); close_fd(status_pipe[1]);
        close_fd(null_fd);
        return result;
    }

    if (pid == 0) {
        exec_child(c_args.data(), cwd_str.empty() ? nullptr : cwd_str.c_str(), null_fd,
                   out_pipe[1], err_pipe[1], status_pipe[1]);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);
    close_fd(null_fd);

    // The status pipe closes on a successful exec; otherwise it carries errno.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    drain(out_pipe[0], err_pipe[0], result.stdout_output, result.stderr_output);

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        result.error = "Cannot execute '" + argv[0] + "': " + std::strerror(child_errno);
        return result;
    }

    result.launched = true;
    if (waited < 0) {
        result.error = std::string("waitpid failed: ") + std::strerror(errno);
        return result;
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }
    return result;
}

bool executable_available(const std::string& exe, const fs::path& cwd) {
    if (exe.empty()) return false;

    if (exe.find('/') != std::string::npos) {
        fs::path p(exe);
        if (p.is_relative()) p = cwd / p;
        std::error_code ec;
        return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return false;

    for (const auto& dir : core::split(path_env, ':')) {
        fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / exe;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace batchtyper::runner
