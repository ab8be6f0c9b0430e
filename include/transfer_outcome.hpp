/**
 * @file transfer_outcome.hpp
 * @brief Result of one delivery run.
 *
 * An outcome is owned by the run that produced it. It holds per-item results, the
 * verification listing, the overall status, and the abort reason when the run stopped early.
 */

#ifndef TRANSFER_OUTCOME_HPP
#define TRANSFER_OUTCOME_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include "path_resolver.hpp"
#include "remote_path.hpp"
#include "transfer_error.hpp"

/**
 * @brief Overall run status.
 */
enum class TransferStatus {
    Verified,            ///< Every item uploaded and the listing shows them.
    CompletedUnverified, ///< Every item uploaded but the listing failed or missed an item.
    PartialFailure,      ///< At least one item failed; the rest were attempted.
    EmptyResolution,     ///< Wildcard matched nothing; no upload happened.
    Aborted              ///< Fatal condition; see TransferOutcome::abortError.
};

/**
 * @brief Result for one planned item.
 */
struct ItemResult {
    TransferItem item;                  ///< Planned item.
    bool succeeded = false;             ///< True when the upload completed.
    std::optional<TransferError> error; ///< Failure cause (ItemTransferFailure) when not succeeded.
};

/**
 * @brief Result of the post-upload listing.
 */
struct VerificationResult {
    bool attempted = false;               ///< False when the run never reached Verifying.
    bool listed = false;                  ///< True when the listing command succeeded.
    std::vector<std::string> lines;       ///< Raw listing lines.
    std::vector<std::string> missing;     ///< Uploaded basenames not found in the listing.
    std::optional<TransferError> error;   ///< Listing failure, advisory only.

    bool verified() const { return attempted && listed && missing.empty(); }
};

/**
 * @brief Full outcome of a run.
 */
struct TransferOutcome {
    TransferStatus status = TransferStatus::Aborted; ///< Overall status.
    RemoteDestination destination;                   ///< Remote directory used by the run.
    std::vector<ItemResult> items;                   ///< One entry per planned item, plan order.
    VerificationResult verification;                 ///< Listing result.
    std::optional<TransferError> abortError;         ///< Set only when status is Aborted.

    std::size_t succeededCount() const;
    std::size_t failedCount() const;

    /**
     * @brief One-line summary for logs and notifications.
     */
    std::string summary() const;
};

std::string_view statusName(TransferStatus status);

/**
 * @brief Maps an outcome to a process exit code.
 *
 * 0 for Verified, CompletedUnverified and EmptyResolution; 1 for Aborted; 2 for
 * PartialFailure unless partialIsSuccess is set, in which case 0.
 */
int exitCodeFor(const TransferOutcome& outcome, bool partialIsSuccess);

#endif // TRANSFER_OUTCOME_HPP
