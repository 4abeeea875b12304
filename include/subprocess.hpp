/**
 * @file subprocess.hpp
 * @brief Child process management for external tools.
 *
 * Spawns external tools with fork/exec, optionally capturing their output through
 * pipes, and exposes non-blocking liveness checks and graceful termination. Used
 * for the copy tool itself and for the short device queries around it.
 *
 * @note POSIX only.
 */

#ifndef SUBPROCESS_HPP
#define SUBPROCESS_HPP

#include <string>
#include <vector>
#include <chrono>
#include <expected>
#include <optional>
#include <sys/types.h>

/**
 * @brief Line-oriented text stream.
 *
 * Consumed by the diagnostic collector; implemented over a pipe in production and
 * over in-memory lines in tests.
 */
class LineSource {
public:
    virtual ~LineSource() = default;

    /**
     * @brief Reads the next line without its terminator.
     *
     * Blocks until a full line, end of stream, or an error.
     *
     * @param line Receives the line.
     * @return bool False once the stream is closed or failed.
     */
    virtual bool nextLine(std::string& line) = 0;
};

/**
 * @brief LineSource reading from an owned file descriptor.
 *
 * A final line without a newline is still returned before end of stream.
 */
class FdLineSource : public LineSource {
public:
    /**
     * @brief Takes ownership of a readable descriptor.
     *
     * @param fd Descriptor to read; closed by the destructor.
     */
    explicit FdLineSource(int fd);
    ~FdLineSource() override;

    FdLineSource(const FdLineSource&) = delete;
    FdLineSource& operator=(const FdLineSource&) = delete;

    bool nextLine(std::string& line) override;

private:
    int fd;
    std::string buffer;
    bool eof = false;
};

/**
 * @brief Output redirection of a spawned process.
 */
struct SpawnOptions {
    bool captureStdout = false; ///< Pipe stdout to the parent; /dev/null otherwise.
    bool captureStderr = false; ///< Pipe stderr to the parent; /dev/null otherwise.
};

/**
 * @brief Owned child process.
 *
 * Move-only. The destructor kills and reaps a child that is still running so no
 * zombie or orphaned copy survives its owner. The child runs in its own process
 * group, so terminal interrupts reach it only through terminate().
 */
class ChildProcess {
public:
    /**
     * @brief Starts a process.
     *
     * Exec failures are detected before returning, through a close-on-exec pipe.
     *
     * @param argv Program and arguments; argv[0] is looked up in PATH.
     * @param options Output redirection.
     * @return std::expected<ChildProcess, std::string> The running child or why it could not start.
     */
    static std::expected<ChildProcess, std::string> spawn(const std::vector<std::string>& argv,
                                                          const SpawnOptions& options = {});

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ~ChildProcess();

    /**
     * @brief Non-blocking liveness check; reaps the child once it has exited.
     */
    bool isRunning();

    /**
     * @brief Blocks until the child exits.
     *
     * @return int Exit status, or 128 + signal number when killed by a signal.
     */
    int wait();

    /**
     * @brief Waits up to a timeout for the child to exit.
     *
     * @return bool True when the child has exited.
     */
    bool waitFor(std::chrono::milliseconds timeout);

    /**
     * @brief Sends SIGTERM, waits up to the grace period, then SIGKILL, and reaps.
     *
     * No-op when the child already exited.
     */
    void terminate(std::chrono::milliseconds grace);

    /**
     * @brief Exit status once reaped.
     */
    std::optional<int> exitCode() const { return status; }

    /**
     * @brief Releases the read end of the stdout pipe to the caller (-1 if not captured).
     */
    int takeStdout();

    /**
     * @brief Releases the read end of the stderr pipe to the caller (-1 if not captured).
     */
    int takeStderr();

private:
    ChildProcess(pid_t pid, int stdoutFd, int stderrFd);
    void recordStatus(int rawStatus);
    void closeFds();

    pid_t childPid = -1;
    int stdoutFd = -1;
    int stderrFd = -1;
    std::optional<int> status;
};

/**
 * @brief Result of a short command.
 */
struct CommandResult {
    int exitCode = 0;   ///< Exit status of the command.
    std::string output; ///< Everything the command wrote to stdout.
};

/**
 * @brief Runs a command to completion, capturing stdout, under a deadline.
 *
 * The command is killed when the deadline passes.
 *
 * @param argv Program and arguments.
 * @param timeout Deadline for the whole run.
 * @param grace Delay between SIGTERM and SIGKILL on timeout.
 * @return std::expected<CommandResult, std::string> Output and status, or a launch/timeout error.
 */
std::expected<CommandResult, std::string> runCommand(const std::vector<std::string>& argv,
                                                     std::chrono::milliseconds timeout,
                                                     std::chrono::milliseconds grace = std::chrono::milliseconds(500));

#endif // SUBPROCESS_HPP
