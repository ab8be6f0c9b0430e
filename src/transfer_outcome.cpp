#include "transfer_outcome.hpp"
#include <algorithm>
#include <format>

std::size_t TransferOutcome::succeededCount() const {
    return static_cast<std::size_t>(std::ranges::count_if(items, [](const ItemResult& r) { return r.succeeded; }));
}

std::size_t TransferOutcome::failedCount() const {
    return items.size() - succeededCount();
}

std::string TransferOutcome::summary() const {
    switch (status) {
    case TransferStatus::Aborted:
        return std::format("Delivery to {} aborted: {}", destination,
                           abortError ? abortError->describe() : std::string("unknown error"));
    case TransferStatus::EmptyResolution:
        return std::format("Nothing to transfer to {}: no matching files", destination);
    default:
        return std::format("Delivery to {} {}: {} of {} item(s) uploaded, {} failed", destination,
                           statusName(status), succeededCount(), items.size(), failedCount());
    }
}

std::string_view statusName(TransferStatus status) {
    switch (status) {
    case TransferStatus::Verified: return "verified";
    case TransferStatus::CompletedUnverified: return "completed (unverified)";
    case TransferStatus::PartialFailure: return "partially failed";
    case TransferStatus::EmptyResolution: return "empty";
    case TransferStatus::Aborted: return "aborted";
    }
    return "unknown";
}

int exitCodeFor(const TransferOutcome& outcome, bool partialIsSuccess) {
    switch (outcome.status) {
    case TransferStatus::Verified:
    case TransferStatus::CompletedUnverified:
    case TransferStatus::EmptyResolution:
        return 0;
    case TransferStatus::PartialFailure:
        return partialIsSuccess ? 0 : 2;
    case TransferStatus::Aborted:
        return 1;
    }
    return 1;
}
