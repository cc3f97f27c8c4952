/**
 * Subprocess.cpp - Spawn child processes and capture their output
 */

#include "lh/Subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lh {

namespace {

class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
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
    FileDescriptor read_end;
    FileDescriptor write_end;

    bool open() {
        int fds[2];
        if (::pipe(fds) != 0) {
            return false;
        }
        ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        read_end = FileDescriptor(fds[0]);
        write_end = FileDescriptor(fds[1]);
        return true;
    }
};

// Kills and reaps the child if it is still running when the scope ends
class ChildProcess {
public:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}
    ~ChildProcess() {
        if (pid_ > 0) {
            ::kill(pid_, SIGKILL);
            wait();
        }
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    void kill() {
        if (pid_ > 0) ::kill(pid_, SIGKILL);
    }

    // Raw wait status, or -1 if waitpid failed
    int wait() {
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0) {
            if (errno != EINTR) {
                pid_ = -1;
                return -1;
            }
        }
        pid_ = -1;
        return status;
    }

private:
    pid_t pid_;
};

// Writing to a child that closed its stdin must not kill us
class ScopedIgnoreSigpipe {
public:
    ScopedIgnoreSigpipe() {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        ::sigaction(SIGPIPE, &ignore, &previous_);
    }
    ~ScopedIgnoreSigpipe() { ::sigaction(SIGPIPE, &previous_, nullptr); }

private:
    struct sigaction previous_ {};
};

std::string errnoMessage(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

} // anonymous namespace

std::string formatArgv(const std::vector<std::string>& argv) {
    std::ostringstream out;
    out << "[";
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) out << ", ";
        out << argv[i];
    }
    out << "]";
    return out.str();
}

ProcessResult SubprocessRunner::run(const std::vector<std::string>& argv,
                                    const std::string& input,
                                    size_t max_output) {
    ProcessResult result;

    if (argv.empty()) {
        result.error = "empty argument vector";
        return result;
    }

    Pipe stdin_pipe, stdout_pipe, stderr_pipe, exec_pipe;
    if (!stdin_pipe.open() || !stdout_pipe.open() || !stderr_pipe.open() || !exec_pipe.open()) {
        result.error = errnoMessage("pipe", errno);
        return result;
    }

    // Build argv before forking; only async-signal-safe calls in the child
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    ScopedIgnoreSigpipe sigpipe_guard;

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error = errnoMessage("fork", errno);
        return result;
    }

    if (pid == 0) {
        ::dup2(stdin_pipe.read_end.get(), STDIN_FILENO);
        ::dup2(stdout_pipe.write_end.get(), STDOUT_FILENO);
        ::dup2(stderr_pipe.write_end.get(), STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(c_argv[0], c_argv.data());

        int err = errno;
        ssize_t ignored = ::write(exec_pipe.write_end.get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ChildProcess child(pid);
    stdin_pipe.read_end.reset();
    stdout_pipe.write_end.reset();
    stderr_pipe.write_end.reset();
    exec_pipe.write_end.reset();

    // The exec pipe closes on a successful exec; otherwise it carries errno
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe.read_end.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        child.wait();
        result.error = errnoMessage("failed to execute '" + argv[0] + "'", child_errno);
        return result;
    }

    size_t written = 0;
    if (input.empty()) {
        stdin_pipe.write_end.reset();
    } else {
        ::fcntl(stdin_pipe.write_end.get(), F_SETFL, O_NONBLOCK);
    }

    bool overflow = false;
    char buffer[4096];

    while (!overflow && (stdin_pipe.write_end.valid() ||
                         stdout_pipe.read_end.valid() ||
                         stderr_pipe.read_end.valid())) {
        struct pollfd fds[3];
        FileDescriptor* owners[3];
        std::string* sinks[3];
        nfds_t count = 0;

        if (stdin_pipe.write_end.valid()) {
            fds[count] = {stdin_pipe.write_end.get(), POLLOUT, 0};
            owners[count] = &stdin_pipe.write_end;
            sinks[count] = nullptr;
            ++count;
        }
        if (stdout_pipe.read_end.valid()) {
            fds[count] = {stdout_pipe.read_end.get(), POLLIN, 0};
            owners[count] = &stdout_pipe.read_end;
            sinks[count] = &result.stdout_text;
            ++count;
        }
        if (stderr_pipe.read_end.valid()) {
            fds[count] = {stderr_pipe.read_end.get(), POLLIN, 0};
            owners[count] = &stderr_pipe.read_end;
            sinks[count] = &result.stderr_text;
            ++count;
        }

        if (::poll(fds, count, -1) < 0) {
            if (errno == EINTR) continue;
            result.error = errnoMessage("poll", errno);
            return result;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;

            if (sinks[i] == nullptr) {
                ssize_t w = ::write(fds[i].fd, input.data() + written, input.size() - written);
                if (w > 0) {
                    written += static_cast<size_t>(w);
                    if (written == input.size()) owners[i]->reset();
                } else if (w < 0 && errno != EAGAIN && errno != EINTR) {
                    // Child stopped reading (EPIPE); drop the rest
                    owners[i]->reset();
                }
                continue;
            }

            ssize_t r = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (r > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(r));
                if (sinks[i]->size() > max_output) {
                    overflow = true;
                    break;
                }
            } else if (r == 0 || (errno != EAGAIN && errno != EINTR)) {
                owners[i]->reset();
            }
        }
    }

    if (overflow) {
        child.kill();
        child.wait();
        result.error = "output exceeded " + std::to_string(max_output) + " bytes";
        return result;
    }

    int status = child.wait();
    if (status < 0) {
        result.error = errnoMessage("waitpid", errno);
        return result;
    }

    result.started = true;
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

} // namespace lh
