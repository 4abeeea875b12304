#include "cleanup_policy.hpp"
#include <filesystem>
#include <system_error>
#include <fmt/format.h>

namespace fs = std::filesystem;

std::expected<CleanupAction, std::string> CleanupPolicy::maybeCleanup(const TransferSession& session,
                                                                      const SessionOutcome& outcome) const {
    if (outcome.success) {
        return CleanupAction::NotNeeded;
    }
    if (!session.directoryCreatedByMonitor) {
        return CleanupAction::KeptExisting;
    }

    std::error_code ec;
    fs::remove_all(session.destinationPath, ec);
    if (ec) {
        return std::unexpected(fmt::format("Failed to remove {}: {}", session.destinationPath.string(), ec.message()));
    }
    return CleanupAction::Deleted;
}
