/**
 * @file subprocess.cpp
 * @brief fork/exec based child processes with pipe capture.
 */

#include "subprocess.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <thread>
#include <utility>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void signalGroup(pid_t pid, int sig) {
    if (::kill(-pid, sig) != 0) {
        ::kill(pid, sig);
    }
}

} // namespace

FdLineSource::FdLineSource(int fd) : fd(fd) {}

FdLineSource::~FdLineSource() {
    closeFd(fd);
}

bool FdLineSource::nextLine(std::string& line) {
    while (true) {
        auto pos = buffer.find('\n');
        if (pos != std::string::npos) {
            line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }
        if (eof || fd < 0) {
            if (buffer.empty()) {
                return false;
            }
            line = std::move(buffer);
            buffer.clear();
            return true;
        }

        char chunk[4096];
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            eof = true;
            continue;
        }
        buffer.append(chunk, static_cast<std::size_t>(n));
    }
}

std::expected<ChildProcess, std::string> ChildProcess::spawn(const std::vector<std::string>& argv,
                                                             const SpawnOptions& options) {
    if (argv.empty()) {
        return std::unexpected("Cannot spawn an empty command");
    }

    std::vector<char*> args;
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    auto closeAll = [&]() {
        for (int* fd : {&outPipe[0], &outPipe[1], &errPipe[0], &errPipe[1], &execPipe[0], &execPipe[1]}) {
            closeFd(*fd);
        }
    };

    if ((options.captureStdout && ::pipe2(outPipe, O_CLOEXEC) != 0) ||
        (options.captureStderr && ::pipe2(errPipe, O_CLOEXEC) != 0) ||
        ::pipe2(execPipe, O_CLOEXEC) != 0) {
        std::string errorMsg = fmt::format("Failed to create pipe for {}: {}", argv[0], std::strerror(errno));
        closeAll();
        return std::unexpected(errorMsg);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        std::string errorMsg = fmt::format("Failed to fork for {}: {}", argv[0], std::strerror(errno));
        closeAll();
        return std::unexpected(errorMsg);
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::setpgid(0, 0);
        int devNull = ::open("/dev/null", O_RDWR);
        ::dup2(devNull, STDIN_FILENO);
        ::dup2(options.captureStdout ? outPipe[1] : devNull, STDOUT_FILENO);
        ::dup2(options.captureStderr ? errPipe[1] : devNull, STDERR_FILENO);
        ::execvp(args[0], args.data());
        int err = errno;
        ssize_t ignored = ::write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(execPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int rawStatus = 0;
        while (::waitpid(pid, &rawStatus, 0) < 0 && errno == EINTR) {
        }
        closeAll();
        return std::unexpected(fmt::format("Failed to execute {}: {}", argv[0], std::strerror(childErrno)));
    }

    return ChildProcess(pid, outPipe[0], errPipe[0]);
}

ChildProcess::ChildProcess(pid_t pid, int stdoutFd, int stderrFd)
    : childPid(pid), stdoutFd(stdoutFd), stderrFd(stderrFd) {}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : childPid(std::exchange(other.childPid, -1)),
      stdoutFd(std::exchange(other.stdoutFd, -1)),
      stderrFd(std::exchange(other.stderrFd, -1)),
      status(std::exchange(other.status, std::nullopt)) {}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        if (childPid > 0 && !status) {
            signalGroup(childPid, SIGKILL);
            wait();
        }
        closeFds();
        childPid = std::exchange(other.childPid, -1);
        stdoutFd = std::exchange(other.stdoutFd, -1);
        stderrFd = std::exchange(other.stderrFd, -1);
        status = std::exchange(other.status, std::nullopt);
    }
    return *this;
}

ChildProcess::~ChildProcess() {
    if (childPid > 0 && !status) {
        signalGroup(childPid, SIGKILL);
        wait();
    }
    closeFds();
}

void ChildProcess::recordStatus(int rawStatus) {
    if (WIFEXITED(rawStatus)) {
        status = WEXITSTATUS(rawStatus);
    } else if (WIFSIGNALED(rawStatus)) {
        status = 128 + WTERMSIG(rawStatus);
    } else {
        status = -1;
    }
}

void ChildProcess::closeFds() {
    closeFd(stdoutFd);
    closeFd(stderrFd);
}

bool ChildProcess::isRunning() {
    if (status || childPid <= 0) {
        return false;
    }
    int rawStatus = 0;
    pid_t result = ::waitpid(childPid, &rawStatus, WNOHANG);
    if (result == 0) {
        return true;
    }
    if (result == childPid) {
        recordStatus(rawStatus);
        return false;
    }
    if (errno == EINTR) {
        return true;
    }
    // ECHILD: reaped elsewhere, status unknown.
    status = -1;
    return false;
}

int ChildProcess::wait() {
    if (status || childPid <= 0) {
        return status.value_or(-1);
    }
    int rawStatus = 0;
    pid_t result;
    do {
        result = ::waitpid(childPid, &rawStatus, 0);
    } while (result < 0 && errno == EINTR);
    if (result == childPid) {
        recordStatus(rawStatus);
    } else {
        status = -1;
    }
    return *status;
}

bool ChildProcess::waitFor(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (isRunning()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(std::chrono::milliseconds(20), deadline - now);
        std::this_thread::sleep_for(slice);
    }
    return true;
}

void ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (!isRunning()) {
        return;
    }
    signalGroup(childPid, SIGTERM);
    if (!waitFor(grace)) {
        signalGroup(childPid, SIGKILL);
        wait();
    }
}

int ChildProcess::takeStdout() {
    return std::exchange(stdoutFd, -1);
}

int ChildProcess::takeStderr() {
    return std::exchange(stderrFd, -1);
}

std::expected<CommandResult, std::string> runCommand(const std::vector<std::string>& argv,
                                                     std::chrono::milliseconds timeout,
                                                     std::chrono::milliseconds grace) {
    SpawnOptions options;
    options.captureStdout = true;
    auto child = ChildProcess::spawn(argv, options);
    if (!child) {
        return std::unexpected(child.error());
    }

    int fd = child->takeStdout();
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string output;
    bool timedOut = false;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timedOut = true;
            break;
        }
        pollfd pfd{fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0 && errno == EINTR) {
            continue;
        }
        if (ready == 0) {
            timedOut = true;
            break;
        }
        if (ready < 0) {
            break;
        }
        char buf[4096];
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        output.append(buf, static_cast<std::size_t>(n));
    }
    closeFd(fd);

    if (!timedOut) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        timedOut = !child->waitFor(std::max(remaining, std::chrono::milliseconds(0)));
    }
    if (timedOut) {
        child->terminate(grace);
        return std::unexpected(fmt::format("Command timed out after {} ms: {}", timeout.count(), argv[0]));
    }

    return CommandResult{child->exitCode().value_or(-1), output};
}
