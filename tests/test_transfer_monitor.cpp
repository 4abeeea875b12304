#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>
#include <memory>
#include <sstream>
#include "line_sources.hpp"
#include "temp_dir.hpp"
#include "transfer_monitor.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

/**
 * @brief What a fake copy process went through, shared with the test after the monitor drops it.
 */
struct ProcessLog {
    int launches = 0;
    bool terminated = false;
    std::string lastSource;
    fs::path lastDestination;
};

class FakeProcess : public TransferProcess {
public:
    FakeProcess(std::shared_ptr<ProcessLog> log, int runningTicks, int exitStatus, std::vector<std::string> stderrLines)
        : log(std::move(log)), remaining(runningTicks), exitStatus(exitStatus), stderrLines(std::move(stderrLines)) {}

    bool isRunning() override {
        if (status) {
            return false;
        }
        if (remaining-- > 0) {
            return true;
        }
        status = exitStatus;
        return false;
    }

    void terminate() override {
        log->terminated = true;
        if (!status) {
            status = 143;
        }
    }

    std::unique_ptr<LineSource> takeDiagnostics() override {
        return std::make_unique<VectorLineSource>(std::move(stderrLines));
    }

    std::optional<int> exitCode() const override { return status; }

private:
    std::shared_ptr<ProcessLog> log;
    int remaining;
    int exitStatus;
    std::vector<std::string> stderrLines;
    std::optional<int> status;
};

class FakeLauncher : public TransferLauncher {
public:
    std::expected<std::unique_ptr<TransferProcess>, std::string> launch(const std::string& /*deviceId*/,
                                                                        const std::string& sourcePath,
                                                                        const fs::path& destinationPath) override {
        ++log->launches;
        log->lastSource = sourcePath;
        log->lastDestination = destinationPath;
        if (failure) {
            return std::unexpected(*failure);
        }
        return std::make_unique<FakeProcess>(log, runningTicks, exitStatus, stderrLines);
    }

    std::shared_ptr<ProcessLog> log = std::make_shared<ProcessLog>();
    std::optional<std::string> failure;
    int runningTicks = 2;
    int exitStatus = 0;
    std::vector<std::string> stderrLines;
};

class FakeProbe : public PathProbe {
public:
    bool exists(const std::string& /*deviceId*/, const std::string& /*path*/) override {
        ++calls;
        return present;
    }

    bool present = true;
    int calls = 0;
};

/**
 * @brief Replays scripted usages; the last one repeats.
 */
class ScriptedSampler : public ProgressSampler {
public:
    DirectoryUsage sample(const fs::path& /*root*/, std::chrono::system_clock::time_point /*since*/) override {
        if (script.empty()) {
            return {};
        }
        DirectoryUsage usage = script[std::min(next, script.size() - 1)];
        ++next;
        return usage;
    }

    std::vector<DirectoryUsage> script;
    std::size_t next = 0;
};

class RecordingReporter : public ProgressReporter {
public:
    void onProgress(const ProgressReport& report) override { reports.push_back(report); }
    void onFinish() override { ++finishes; }

    std::vector<ProgressReport> reports;
    int finishes = 0;
};

class ManualClock : public MonitorClock {
public:
    std::chrono::steady_clock::time_point now() override { return current; }

    void sleepFor(std::chrono::steady_clock::duration duration, const std::function<bool()>& /*cancelled*/) override {
        current += duration;
    }

    std::chrono::steady_clock::time_point current = std::chrono::steady_clock::time_point{} + 1h;
};

std::string readFile(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream text;
    text << in.rdbuf();
    return text.str();
}

} // namespace

class TransferMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto configFile = dir.writeFile("archiver_config.json",
                                        R"({"log_dir": ")" + (dir.path() / "logs").string() +
                                            R"(", "tick_interval_ms": 1000, "collector_grace_ms": 2000})");
        config = std::make_unique<ArchiverConfig>(configFile.string());

        session.deviceId = "R58M123ABC";
        session.sourcePath = "/sdcard/DCIM";
        session.destinationPath = dir.path() / "backup";
        session.startTime = std::chrono::system_clock::now();
        session.totalEstimatedBytes = 1000;
        session.directoryCreatedByMonitor = true;
        fs::create_directories(session.destinationPath);
    }

    std::expected<SessionOutcome, std::string> run(const std::function<bool()>& cancel = [] { return false; }) {
        TransferMonitor monitor(*config, launcher, probe, sampler, reporter, clock);
        auto result = monitor.run(session, cancel);
        finalState = monitor.state();
        return result;
    }

    TempDir dir;
    std::unique_ptr<ArchiverConfig> config;
    TransferSession session;
    FakeLauncher launcher;
    FakeProbe probe;
    ScriptedSampler sampler;
    RecordingReporter reporter;
    ManualClock clock;
    MonitorState finalState = MonitorState::Verifying;
};

TEST_F(TransferMonitorTest, NothingCopiedIsFailureAndRemovesOwnedDirectory) {
    sampler.script = {{0, 0}};

    auto outcome = run();
    ASSERT_TRUE(outcome.has_value()) << outcome.error();
    EXPECT_EQ(outcome->state, MonitorState::Completed);
    EXPECT_FALSE(outcome->success);
    EXPECT_EQ(outcome->bytesTransferred, 0u);
    EXPECT_FALSE(outcome->completionMarker.has_value());
    EXPECT_EQ(outcome->message, "Backup failed - no files were transferred");
    EXPECT_FALSE(fs::exists(session.destinationPath));
    EXPECT_EQ(finalState, MonitorState::Completed);
}

TEST_F(TransferMonitorTest, SuccessWritesCompletionMarker) {
    sampler.script = {{100, 1}, {400, 2}, {700, 3}, {900, 4}};
    session.excludesRestrictedSubtree = true;

    auto outcome = run();
    ASSERT_TRUE(outcome.has_value()) << outcome.error();
    EXPECT_EQ(outcome->state, MonitorState::Completed);
    EXPECT_TRUE(outcome->success);
    EXPECT_EQ(outcome->bytesTransferred, 900u);
    EXPECT_EQ(outcome->fileCount, 4u);
    EXPECT_EQ(outcome->exitCode, 0);
    EXPECT_FALSE(outcome->diagnosticsPresent);
    EXPECT_EQ(outcome->elapsedTime, 3s);

    ASSERT_TRUE(outcome->completionMarker.has_value());
    EXPECT_EQ(*outcome->completionMarker, session.destinationPath / "backup_completed.txt");
    std::string marker = readFile(*outcome->completionMarker);
    EXPECT_NE(marker.find("Backup completed on: "), std::string::npos);
    EXPECT_NE(marker.find("Device: R58M123ABC"), std::string::npos);
    EXPECT_NE(marker.find("Source: /sdcard/DCIM"), std::string::npos);
    EXPECT_NE(marker.find("Total files: 4"), std::string::npos);
    EXPECT_NE(marker.find("Total size: 900 B"), std::string::npos);
    EXPECT_NE(marker.find("Elapsed time: 00:00:03"), std::string::npos);
    EXPECT_NE(marker.find("Android folder was excluded"), std::string::npos);
    EXPECT_EQ(marker.find("Some files were skipped"), std::string::npos);

    EXPECT_EQ(launcher.log->lastSource, "/sdcard/DCIM");
    EXPECT_EQ(launcher.log->lastDestination, session.destinationPath);
}

TEST_F(TransferMonitorTest, ReportsProgressEveryTick) {
    sampler.script = {{250, 1}, {500, 2}, {1500, 3}};

    auto outcome = run();
    ASSERT_TRUE(outcome.has_value()) << outcome.error();
    ASSERT_EQ(reporter.reports.size(), 3u);
    EXPECT_EQ(reporter.finishes, 1);

    EXPECT_DOUBLE_EQ(reporter.reports[0].percent, 25.0);
    EXPECT_DOUBLE_EQ(reporter.reports[0].bytesPerSecond, 250.0);
    EXPECT_DOUBLE_EQ(reporter.reports[0].etaSeconds, 3.0);
    EXPECT_DOUBLE_EQ(reporter.reports[1].percent, 50.0);
    EXPECT_DOUBLE_EQ(reporter.reports[1].bytesPerSecond, 250.0);
    // More than the estimate: percent saturates.
    EXPECT_DOUBLE_EQ(reporter.reports[2].percent, 100.0);
    for (const auto& report : reporter.reports) {
        EXPECT_GE(report.bytesPerSecond, 0.0);
        EXPECT_EQ(report.totalBytes, 1000u);
    }
}

TEST_F(TransferMonitorTest, NonZeroExitWithDataIsSuccess) {
    sampler.script = {{100, 1}, {300, 2}};
    launcher.exitStatus = 1;
    launcher.stderrLines = {
        "adb: error: failed to copy '/sdcard/DCIM/.thumbnails/x' to 'backup/x': Permission denied",
        "[100%] /sdcard/DCIM/b.jpg",
    };

    auto outcome = run();
    ASSERT_TRUE(outcome.has_value()) << outcome.error();
    EXPECT_TRUE(outcome->success);
    EXPECT_EQ(outcome->exitCode, 1);
    EXPECT_TRUE(outcome->diagnosticsPresent);
    ASSERT_TRUE(outcome->completionMarker.has_value());
    EXPECT_NE(readFile(*outcome->completionMarker).find("Note: Some files were skipped - see backup_errors.log"),
              std::string::npos);

    std::string diagnostics = readFile(session.destinationPath / "backup_errors.log");
    EXPECT_NE(diagnostics.find("Permission denied"), std::string::npos);
    EXPECT_EQ(diagnostics.find("[100%]"), std::string::npos);
}

TEST_F(TransferMonitorTest, MissingSourceAbortsBeforeLaunch) {
    probe.present = false;

    auto outcome = run();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_NE(outcome.error().find("/sdcard/DCIM not found on device R58M123ABC"), std::string::npos);
    EXPECT_EQ(probe.calls, 1);
    EXPECT_EQ(launcher.log->launches, 0);
    EXPECT_EQ(finalState, MonitorState::Aborted);
    EXPECT_TRUE(reporter.reports.empty());
    EXPECT_FALSE(fs::exists(session.destinationPath));
}

TEST_F(TransferMonitorTest, LaunchFailureAborts) {
    launcher.failure = "Failed to execute adb: No such file or directory";
    session.directoryCreatedByMonitor = false;

    auto outcome = run();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_NE(outcome.error().find("Failed to start copy tool"), std::string::npos);
    EXPECT_EQ(finalState, MonitorState::Aborted);
    EXPECT_TRUE(fs::exists(session.destinationPath));
}

TEST_F(TransferMonitorTest, CancelKeepsMergedDirectory) {
    session.directoryCreatedByMonitor = false;
    dir.writeFile("backup/previous/old.jpg", "from an earlier run");
    sampler.script = {{300, 3}};
    launcher.runningTicks = 100;

    auto outcome = run([this] { return !reporter.reports.empty(); });
    ASSERT_TRUE(outcome.has_value()) << outcome.error();
    EXPECT_EQ(outcome->state, MonitorState::Interrupted);
    EXPECT_FALSE(outcome->success);
    EXPECT_TRUE(launcher.log->terminated);
    EXPECT_EQ(outcome->bytesTransferred, 300u);
    EXPECT_EQ(outcome->exitCode, 143);
    EXPECT_EQ(outcome->message, "Backup interrupted by user.");
    EXPECT_FALSE(outcome->completionMarker.has_value());
    EXPECT_EQ(finalState, MonitorState::Interrupted);
    EXPECT_TRUE(fs::exists(session.destinationPath / "previous" / "old.jpg"));
    EXPECT_FALSE(fs::exists(session.destinationPath / "backup_completed.txt"));
}

TEST_F(TransferMonitorTest, CancelRemovesOwnedDirectory) {
    sampler.script = {{300, 3}};
    launcher.runningTicks = 100;

    auto outcome = run([this] { return reporter.reports.size() >= 2; });
    ASSERT_TRUE(outcome.has_value()) << outcome.error();
    EXPECT_EQ(outcome->state, MonitorState::Interrupted);
    EXPECT_EQ(reporter.reports.size(), 2u);
    EXPECT_TRUE(launcher.log->terminated);
    EXPECT_FALSE(fs::exists(session.destinationPath));
}

TEST_F(TransferMonitorTest, PendingCancelNeverLaunches) {
    launcher.runningTicks = 100;

    auto outcome = run([] { return true; });
    ASSERT_TRUE(outcome.has_value()) << outcome.error();
    EXPECT_EQ(outcome->state, MonitorState::Interrupted);
    EXPECT_FALSE(outcome->success);
    EXPECT_FALSE(outcome->exitCode.has_value());
    EXPECT_EQ(probe.calls, 0);
    EXPECT_EQ(launcher.log->launches, 0);
    EXPECT_TRUE(reporter.reports.empty());
    EXPECT_EQ(finalState, MonitorState::Interrupted);
    EXPECT_FALSE(fs::exists(session.destinationPath));
}

TEST_F(TransferMonitorTest, CancelDuringVerificationNeverLaunches) {
    session.directoryCreatedByMonitor = false;
    dir.writeFile("backup/previous/old.jpg", "from an earlier run");

    // Cancellation arrives while the source check is running.
    auto outcome = run([this] { return probe.calls > 0; });
    ASSERT_TRUE(outcome.has_value()) << outcome.error();
    EXPECT_EQ(outcome->state, MonitorState::Interrupted);
    EXPECT_EQ(probe.calls, 1);
    EXPECT_EQ(launcher.log->launches, 0);
    EXPECT_FALSE(launcher.log->terminated);
    EXPECT_TRUE(fs::exists(session.destinationPath / "previous" / "old.jpg"));
}

TEST(MonitorStateName, Names) {
    EXPECT_STREQ(monitorStateName(MonitorState::Verifying), "verifying");
    EXPECT_STREQ(monitorStateName(MonitorState::Completed), "completed");
    EXPECT_STREQ(monitorStateName(MonitorState::Aborted), "aborted");
    EXPECT_STREQ(monitorStateName(MonitorState::Interrupted), "interrupted");
}
