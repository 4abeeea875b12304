#include <gtest/gtest.h>

#include "cleanup_policy.hpp"
#include "temp_dir.hpp"

namespace fs = std::filesystem;

class CleanupPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        session.deviceId = "emulator-5554";
        session.sourcePath = "/sdcard/DCIM";
        session.destinationPath = dir.path() / "backup";
        dir.writeFile("backup/DCIM/partial.jpg", "partial");
    }

    TempDir dir;
    TransferSession session;
    CleanupPolicy policy;
};

TEST_F(CleanupPolicyTest, SuccessNeedsNothing) {
    session.directoryCreatedByMonitor = true;
    SessionOutcome outcome;
    outcome.state = MonitorState::Completed;
    outcome.success = true;

    auto action = policy.maybeCleanup(session, outcome);
    ASSERT_TRUE(action.has_value());
    EXPECT_EQ(*action, CleanupAction::NotNeeded);
    EXPECT_TRUE(fs::exists(session.destinationPath));
}

TEST_F(CleanupPolicyTest, RemovesDirectoryCreatedByRun) {
    session.directoryCreatedByMonitor = true;
    SessionOutcome outcome;
    outcome.state = MonitorState::Interrupted;

    auto action = policy.maybeCleanup(session, outcome);
    ASSERT_TRUE(action.has_value());
    EXPECT_EQ(*action, CleanupAction::Deleted);
    EXPECT_FALSE(fs::exists(session.destinationPath));
}

TEST_F(CleanupPolicyTest, KeepsPreexistingDirectory) {
    session.directoryCreatedByMonitor = false;
    SessionOutcome outcome;
    outcome.state = MonitorState::Completed;
    outcome.success = false;

    auto action = policy.maybeCleanup(session, outcome);
    ASSERT_TRUE(action.has_value());
    EXPECT_EQ(*action, CleanupAction::KeptExisting);
    EXPECT_TRUE(fs::exists(session.destinationPath / "DCIM" / "partial.jpg"));
}

TEST_F(CleanupPolicyTest, MissingDirectoryIsNotAnError) {
    session.directoryCreatedByMonitor = true;
    session.destinationPath = dir.path() / "never-created";
    SessionOutcome outcome;

    auto action = policy.maybeCleanup(session, outcome);
    ASSERT_TRUE(action.has_value());
    EXPECT_EQ(*action, CleanupAction::Deleted);
}
