/**
 * @file subprocess.cpp
 * @brief fork/execvp subprocess runner with poll-driven capture
 *
 * **Lifecycle**:
 * ```
 * pipe(stdout) + pipe(stderr) + pipe(exec status, CLOEXEC)
 *   → fork → child: setpgid, dup2, execvp
 *   → parent: poll both pipes until EOF or deadline
 *   → deadline: kill(-pgid, SIGKILL), drain, waitpid
 * ```
 *
 * The exec-status pipe reports execvp failure (errno) back to the parent; it
 * closes on a successful exec because of O_CLOEXEC.
 *
 * @date 2025
 */

#include "runcage/utils/subprocess.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace runcage {
namespace utils {

namespace {

/// Owns one file descriptor
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { Close(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    void Reset(int fd) {
        Close();
        fd_ = fd;
    }

    void Close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;
};

bool OpenPipe(Pipe& p, int flags) {
    int fds[2];
    if (::pipe2(fds, flags) != 0) {
        return false;
    }
    p.read_end.Reset(fds[0]);
    p.write_end.Reset(fds[1]);
    return true;
}

int DecodeExitCode(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return status;
}

/// Read what is available; returns false on EOF or hard error
bool DrainInto(FileDescriptor& fd, std::string& sink, std::size_t cap) {
    std::array<char, 4096> buffer;
    ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
    if (n > 0) {
        std::size_t take = static_cast<std::size_t>(n);
        if (sink.size() + take > cap) {
            take = cap > sink.size() ? cap - sink.size() : 0;
        }
        sink.append(buffer.data(), take);
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    fd.Close();
    return false;
}

pid_t WaitChild(pid_t pid, int& status) {
    pid_t r;
    do {
        r = ::waitpid(pid, &status, 0);
    } while (r < 0 && errno == EINTR);
    return r;
}

} // anonymous namespace

SubprocessResult RunSubprocess(const std::vector<std::string>& argv,
                               const SubprocessOptions& options) {
    if (argv.empty()) {
        throw std::invalid_argument("RunSubprocess: empty argv");
    }

    SubprocessResult result;

    Pipe out_pipe, err_pipe, exec_pipe;
    if (!OpenPipe(out_pipe, O_CLOEXEC) || !OpenPipe(err_pipe, O_CLOEXEC) ||
        !OpenPipe(exec_pipe, O_CLOEXEC)) {
        result.spawn_failed = true;
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    // argv must be materialized before fork; the child only calls
    // async-signal-safe functions.
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.spawn_failed = true;
        result.error = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe.write_end.get(), STDOUT_FILENO);
        ::dup2(err_pipe.write_end.get(), STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(c_argv[0], c_argv.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe.write_end.get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Mirror setpgid in the parent to close the race with an early kill.
    ::setpgid(pid, pid);

    out_pipe.write_end.Close();
    err_pipe.write_end.Close();
    exec_pipe.write_end.Close();

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe.read_end.get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        WaitChild(pid, status);
        result.spawn_failed = true;
        result.error = "exec " + argv[0] + " failed: " + std::strerror(exec_errno);
        return result;
    }

    bool killed = false;
    while (out_pipe.read_end.valid() || err_pipe.read_end.valid()) {
        std::array<pollfd, 2> fds{};
        nfds_t nfds = 0;
        if (out_pipe.read_end.valid()) {
            fds[nfds++] = pollfd{out_pipe.read_end.get(), POLLIN, 0};
        }
        if (err_pipe.read_end.valid()) {
            fds[nfds++] = pollfd{err_pipe.read_end.get(), POLLIN, 0};
        }

        int timeout_ms = -1;
        if (!options.deadline.IsInfinite() && !killed) {
            auto remaining = options.deadline.RemainingMillis().count();
            timeout_ms = static_cast<int>(std::min<long long>(remaining, 60 * 60 * 1000));
        } else if (killed) {
            // After SIGKILL the pipes close promptly unless a grandchild
            // escaped the process group; bound the drain.
            timeout_ms = 1000;
        }

        int ready = ::poll(fds.data(), nfds, timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll failed while capturing {}: {}", argv[0], std::strerror(errno));
            break;
        }

        if (ready == 0) {
            if (killed) {
                break;
            }
            if (options.deadline.Expired()) {
                spdlog::debug("Deadline reached, killing process group {}", pid);
                ::kill(-pid, SIGKILL);
                killed = true;
                result.timed_out = true;
            }
            continue;
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == out_pipe.read_end.get()) {
                DrainInto(out_pipe.read_end, result.stdout_output, options.max_output_bytes);
            } else if (fds[i].fd == err_pipe.read_end.get()) {
                DrainInto(err_pipe.read_end, result.stderr_output, options.max_output_bytes);
            }
        }
    }

    // Pipes can close while the child lives on (it closed its own output);
    // keep enforcing the deadline while reaping it.
    int status = 0;
    while (true) {
        int flags = (killed || options.deadline.IsInfinite()) ? 0 : WNOHANG;
        pid_t r = ::waitpid(pid, &status, flags);
        if (r == pid) {
            break;
        }
        if (r < 0) {
            if (errno == EINTR) continue;
            result.exit_code = -1;
            result.error = std::string("waitpid failed: ") + std::strerror(errno);
            return result;
        }
        if (options.deadline.Expired()) {
            ::kill(-pid, SIGKILL);
            killed = true;
            result.timed_out = true;
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    result.exit_code = DecodeExitCode(status);
    return result;
}

} // namespace utils
} // namespace runcage
