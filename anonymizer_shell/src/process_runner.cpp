#include "process_runner.hpp"

#include "cancellation_token.hpp"
#include "logger.hpp"
#include "sidecar_error.hpp"

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <optional>

#include <log4cplus/loggingmacros.h>

extern char** environ;

namespace sidecar {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kReapPollMs = 10;

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

// Written by the child to the status pipe when it fails before exec succeeds.
struct ChildFailure {
    enum Stage : int { Redirect = 1, ChangeDirectory = 2, Exec = 3 };
    int stage = 0;
    int error = 0;
};

std::string os_error(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

Pipe make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        throw SidecarError(ErrorKind::StartFailed, os_error("pipe", errno));
    }
    return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw SidecarError(ErrorKind::StartFailed, os_error("fcntl", errno));
    }
}

std::vector<char*> to_pointers(std::vector<std::string>& items) {
    std::vector<char*> ptrs;
    ptrs.reserve(items.size() + 1);
    for (auto& item : items) {
        ptrs.push_back(item.data());
    }
    ptrs.push_back(nullptr);
    return ptrs;
}

std::vector<std::string> build_environment(const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string item(*entry);
        std::string key = item.substr(0, item.find('='));
        bool overridden = std::any_of(overrides.begin(), overrides.end(),
                                      [&](const auto& kv) { return kv.first == key; });
        if (!overridden) {
            env.push_back(std::move(item));
        }
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

void kill_and_reap(pid_t pid) {
    if (::kill(pid, SIGKILL) < 0 && errno != ESRCH) {
        LOG4CPLUS_WARN(bridge_logger(), "kill(" << pid << ") failed: " << std::strerror(errno));
    }

    int status = 0;
    pid_t rc;
    do {
        rc = ::waitpid(pid, &status, 0);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        LOG4CPLUS_WARN(bridge_logger(), "waitpid(" << pid << ") failed: " << std::strerror(errno));
    }
}

// Kills and reaps the child unless it was already reaped normally.
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid) : pid_(pid) {}
    ~ChildGuard() {
        if (!reaped_) {
            LOG4CPLUS_DEBUG(bridge_logger(), "Killing worker pid=" << pid_);
            kill_and_reap(pid_);
        }
    }

    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    pid_t pid() const { return pid_; }
    void mark_reaped() { reaped_ = true; }

private:
    pid_t pid_;
    bool reaped_ = false;
};

// Blocks SIGPIPE on the calling thread and discards one raised by our own writes.
class SigpipeGuard {
public:
    SigpipeGuard() {
        sigemptyset(&pipe_set_);
        sigaddset(&pipe_set_, SIGPIPE);

        sigset_t pending;
        sigemptyset(&pending);
        if (::sigpending(&pending) == 0) {
            was_pending_ = sigismember(&pending, SIGPIPE) == 1;
        }
        blocked_ = ::pthread_sigmask(SIG_BLOCK, &pipe_set_, &old_mask_) == 0;
    }

    ~SigpipeGuard() {
        if (!blocked_) {
            return;
        }
        if (!was_pending_) {
            timespec zero{0, 0};
            ::sigtimedwait(&pipe_set_, nullptr, &zero);
        }
        ::pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

private:
    sigset_t pipe_set_;
    sigset_t old_mask_;
    bool was_pending_ = false;
    bool blocked_ = false;
};

[[noreturn]] void report_child_failure(int status_fd, ChildFailure::Stage stage) {
    ChildFailure failure;
    failure.stage = stage;
    failure.error = errno;
    ssize_t ignored = ::write(status_fd, &failure, sizeof(failure));
    (void)ignored;
    ::_exit(127);
}

std::string describe_child_failure(const ChildFailure& failure, const ProcessSpec& spec) {
    switch (failure.stage) {
        case ChildFailure::Redirect:
            return os_error("dup2", failure.error);
        case ChildFailure::ChangeDirectory:
            return os_error("chdir(" + spec.working_directory + ")", failure.error);
        default:
            return os_error("exec(" + spec.program + ")", failure.error);
    }
}

pid_t spawn_child(const ProcessSpec& spec, const Pipe& in, const Pipe& out, const Pipe& err) {
    Pipe status = make_pipe();

    std::vector<std::string> argv_storage;
    argv_storage.reserve(spec.args.size() + 1);
    argv_storage.push_back(spec.program);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv = to_pointers(argv_storage);

    std::vector<std::string> env_storage = build_environment(spec.env);
    std::vector<char*> envp = to_pointers(env_storage);

    const char* cwd = spec.working_directory.empty() ? nullptr : spec.working_directory.c_str();
    const pid_t parent = ::getpid();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw SidecarError(ErrorKind::StartFailed, os_error("fork", errno));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only until exec.
        sigset_t empty;
        sigemptyset(&empty);
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);

        if (spec.kill_on_parent_death) {
            ::prctl(PR_SET_PDEATHSIG, SIGKILL);
            if (::getppid() != parent) {
                ::_exit(127);
            }
        }

        if (::dup2(in.read_end.get(), STDIN_FILENO) < 0 ||
            ::dup2(out.write_end.get(), STDOUT_FILENO) < 0 ||
            ::dup2(err.write_end.get(), STDERR_FILENO) < 0) {
            report_child_failure(status.write_end.get(), ChildFailure::Redirect);
        }

        if (cwd != nullptr && ::chdir(cwd) < 0) {
            report_child_failure(status.write_end.get(), ChildFailure::ChangeDirectory);
        }

        ::execvpe(argv[0], argv.data(), envp.data());
        report_child_failure(status.write_end.get(), ChildFailure::Exec);
    }

    status.write_end.reset();

    // EOF on the status pipe means exec succeeded (O_CLOEXEC closed the child's end).
    ChildFailure failure;
    ssize_t n;
    do {
        n = ::read(status.read_end.get(), &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        int read_errno = errno;
        kill_and_reap(pid);
        throw SidecarError(ErrorKind::StartFailed, os_error("read exec status", read_errno));
    }
    if (n > 0) {
        kill_and_reap(pid);
        throw SidecarError(ErrorKind::StartFailed, describe_child_failure(failure, spec));
    }

    return pid;
}

void check_limits(const std::optional<Clock::time_point>& deadline, const RunLimits& limits) {
    if (limits.cancel != nullptr && limits.cancel->is_cancelled()) {
        throw SidecarError(ErrorKind::Cancelled, "cancellation requested");
    }
    if (deadline && Clock::now() >= *deadline) {
        throw SidecarError(ErrorKind::Timeout,
                           "worker did not exit within " + std::to_string(limits.timeout.count()) + " ms");
    }
}

int poll_timeout_ms(const std::optional<Clock::time_point>& deadline, int cap_ms) {
    if (!deadline) {
        return cap_ms;
    }
    auto remaining = std::chrono::ceil<std::chrono::milliseconds>(*deadline - Clock::now()).count();
    if (remaining < 0) {
        remaining = 0;
    }
    if (cap_ms >= 0 && remaining > cap_ms) {
        return cap_ms;
    }
    if (remaining > INT_MAX) {
        return INT_MAX;
    }
    return static_cast<int>(remaining);
}

// Reads everything currently available. Closes fd on EOF.
void drain(UniqueFd& fd, std::string& sink) {
    char buffer[65536];
    while (true) {
        ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            sink.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            fd.reset();
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        throw SidecarError(ErrorKind::StartFailed, os_error("read worker output", errno));
    }
}

int wait_for_exit(ChildGuard& child, const std::optional<Clock::time_point>& deadline, const RunLimits& limits) {
    const bool bounded = deadline.has_value() || limits.cancel != nullptr;
    while (true) {
        int status = 0;
        pid_t rc = ::waitpid(child.pid(), &status, bounded ? WNOHANG : 0);
        if (rc == child.pid()) {
            child.mark_reaped();
            return status;
        }
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw SidecarError(ErrorKind::StartFailed, os_error("waitpid", errno));
        }

        check_limits(deadline, limits);

        pollfd pfd{};
        nfds_t count = 0;
        if (limits.cancel != nullptr) {
            pfd.fd = limits.cancel->fd();
            pfd.events = POLLIN;
            count = 1;
        }
        if (::poll(count > 0 ? &pfd : nullptr, count, poll_timeout_ms(deadline, kReapPollMs)) < 0 && errno != EINTR) {
            throw SidecarError(ErrorKind::StartFailed, os_error("poll", errno));
        }
    }
}

} // namespace

ProcessOutcome run_process(const ProcessSpec& spec, const std::string& input, const RunLimits& limits) {
    if (limits.cancel != nullptr && limits.cancel->is_cancelled()) {
        throw SidecarError(ErrorKind::Cancelled, "cancelled before the worker was started");
    }

    Pipe in = make_pipe();
    Pipe out = make_pipe();
    Pipe err = make_pipe();
    set_nonblocking(in.write_end.get());
    set_nonblocking(out.read_end.get());
    set_nonblocking(err.read_end.get());

    std::optional<Clock::time_point> deadline;
    if (limits.timeout.count() > 0) {
        // A timeout past the clock's range never fires.
        const Clock::time_point now = Clock::now();
        const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
        if (limits.timeout < headroom) {
            deadline = now + limits.timeout;
        }
    }

    ChildGuard child(spawn_child(spec, in, out, err));
    in.read_end.reset();
    out.write_end.reset();
    err.write_end.reset();

    LOG4CPLUS_DEBUG(bridge_logger(), "Spawned " << spec.program << " pid=" << child.pid());

    SigpipeGuard sigpipe_guard;
    ProcessOutcome outcome;
    std::size_t written = 0;
    if (input.empty()) {
        in.write_end.reset();
    }

    while (in.write_end.valid() || out.read_end.valid() || err.read_end.valid()) {
        check_limits(deadline, limits);

        pollfd fds[4];
        nfds_t count = 0;
        int in_idx = -1;
        int out_idx = -1;
        int err_idx = -1;

        if (in.write_end.valid()) {
            in_idx = static_cast<int>(count);
            fds[count++] = pollfd{in.write_end.get(), POLLOUT, 0};
        }
        if (out.read_end.valid()) {
            out_idx = static_cast<int>(count);
            fds[count++] = pollfd{out.read_end.get(), POLLIN, 0};
        }
        if (err.read_end.valid()) {
            err_idx = static_cast<int>(count);
            fds[count++] = pollfd{err.read_end.get(), POLLIN, 0};
        }
        if (limits.cancel != nullptr) {
            fds[count++] = pollfd{limits.cancel->fd(), POLLIN, 0};
        }

        int rc = ::poll(fds, count, poll_timeout_ms(deadline, -1));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw SidecarError(ErrorKind::StartFailed, os_error("poll", errno));
        }
        if (rc == 0) {
            continue;
        }

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            ssize_t n = ::write(in.write_end.get(), input.data() + written, input.size() - written);
            if (n < 0) {
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    throw SidecarError(ErrorKind::StartFailed, os_error("write payload", errno));
                }
            } else {
                written += static_cast<std::size_t>(n);
                if (written == input.size()) {
                    in.write_end.reset();
                }
            }
        }
        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLERR | POLLHUP))) {
            drain(out.read_end, outcome.stdout_data);
        }
        if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLERR | POLLHUP))) {
            drain(err.read_end, outcome.stderr_data);
        }
    }

    int status = wait_for_exit(child, deadline, limits);
    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.term_signal = WTERMSIG(status);
    }

    LOG4CPLUS_DEBUG(bridge_logger(), "Worker pid=" << child.pid() << " exited code=" << outcome.exit_code
                                     << " signal=" << outcome.term_signal << " stdout=" << outcome.stdout_data.size()
                                     << "B stderr=" << outcome.stderr_data.size() << "B");
    return outcome;
}

} // namespace sidecar
