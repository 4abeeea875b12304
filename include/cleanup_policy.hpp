/**
 * @file cleanup_policy.hpp
 * @brief Removal of partial backups after a failed session.
 */

#ifndef CLEANUP_POLICY_HPP
#define CLEANUP_POLICY_HPP

#include <string>
#include <expected>
#include "transfer_session.hpp"

/**
 * @brief What the cleanup policy did.
 */
enum class CleanupAction {
    NotNeeded,    ///< The session succeeded.
    KeptExisting, ///< Failed, but the directory pre-existed (merge mode).
    Deleted       ///< Failed and the directory was created by this run; it was removed.
};

/**
 * @brief Decides whether a failed session's destination is deleted.
 *
 * Only directories created by the run are ever deleted. A pre-existing directory may
 * hold earlier backups and is left alone whatever the outcome.
 */
class CleanupPolicy {
public:
    /**
     * @brief Applies the policy.
     *
     * Deletion is attempted once; a failure is reported, not retried.
     *
     * @param session The finished session.
     * @param outcome Its outcome.
     * @return std::expected<CleanupAction, std::string> The action taken or why deletion failed.
     */
    std::expected<CleanupAction, std::string> maybeCleanup(const TransferSession& session,
                                                           const SessionOutcome& outcome) const;
};

#endif // CLEANUP_POLICY_HPP
