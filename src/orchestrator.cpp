#include "orchestrator.hpp"
#include "remote_path.hpp"
#include <algorithm>
#include <exception>
#include <format>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

/**
 * @brief Serializes sink calls and stamps events. Shared by upload workers.
 */
class TransferOrchestrator::EventEmitter {
public:
    explicit EventEmitter(const ProgressSink& sink) : sink_(sink) {}

    void operator()(RunPhase phase, std::string message, Severity severity = Severity::Info) {
        if (!sink_) {
            return;
        }
        ProgressEvent event{phase, std::move(message), severity, std::chrono::system_clock::now()};
        std::lock_guard<std::mutex> lock(mutex_);
        sink_(event);
    }

private:
    const ProgressSink& sink_;
    std::mutex mutex_;
};

namespace {

bool cancelled(const RunRequest& request) {
    return request.cancelFlag && request.cancelFlag->load();
}

void recordItem(ItemResult& result, const std::expected<void, TransferError>& upload) {
    result.succeeded = upload.has_value();
    if (!upload) {
        result.error = TransferError{TransferErrorKind::ItemTransferFailure,
                                     std::format("{}: {}", result.item.basename, upload.error().describe())};
    }
}

} // namespace

std::string listingEntryName(const std::string& line) {
    if (line.empty()) {
        return {};
    }
    // mode links owner group size month day time|year, plus "major," for devices
    int columns = (line.front() == 'b' || line.front() == 'c') ? 9 : 8;
    std::size_t pos = 0;
    for (int column = 0; column < columns; ++column) {
        pos = line.find_first_not_of(' ', pos);
        if (pos == std::string::npos) {
            return {};
        }
        pos = line.find(' ', pos);
        if (pos == std::string::npos) {
            return {};
        }
    }
    pos = line.find_first_not_of(' ', pos);
    if (pos == std::string::npos) {
        return {};
    }
    std::string name = line.substr(pos);
    if (line.front() == 'l') {
        if (auto arrow = name.find(" -> "); arrow != std::string::npos) {
            name.erase(arrow);
        }
    }
    return name;
}

bool listingContains(const std::vector<std::string>& lines, const std::string& name) {
    return std::ranges::any_of(lines, [&](const std::string& line) { return listingEntryName(line) == name; });
}

TransferOrchestrator::TransferOrchestrator(SessionFactory factory, OrchestratorOptions options)
    : factory_(std::move(factory)), options_(options) {
    if (options_.parallelUploads == 0) {
        options_.parallelUploads = 1;
    }
}

TransferOutcome TransferOrchestrator::run(RunRequest request, const ProgressSink& sink) const {
    TransferOutcome outcome;
    EventEmitter emit(sink);
    try {
        execute(request, outcome, emit);
    } catch (const std::exception& e) {
        outcome.status = TransferStatus::Aborted;
        outcome.abortError = TransferError::unexpected(e.what());
        emit(RunPhase::Aborted, outcome.abortError->describe(), Severity::Error);
    }
    request.credentials.secret.clear();
    return outcome;
}

void TransferOrchestrator::execute(RunRequest& request, TransferOutcome& outcome, EventEmitter& emit) const {
    auto abortRun = [&](TransferError error) {
        outcome.status = TransferStatus::Aborted;
        emit(RunPhase::Aborted, error.describe(), Severity::Error);
        outcome.abortError = std::move(error);
    };

    emit(RunPhase::Validating, "Validating input");
    if (request.credentials.secret.empty()) {
        return abortRun(TransferError::invalidInput("Password or key file is empty"));
    }
    if (request.sourceSpec.empty()) {
        return abortRun(TransferError::invalidInput("Source path is empty"));
    }
    if (request.credentials.host.empty()) {
        return abortRun(TransferError::invalidInput("Remote host is empty"));
    }
    if (request.remoteBaseDir.empty()) {
        return abortRun(TransferError::invalidInput("Remote base directory is empty"));
    }
    if (options_.rejectTraversal && RemotePathBuilder::containsTraversal(request.subdirToken)) {
        return abortRun(TransferError::invalidInput(
            std::format("Subdirectory '{}' contains a '..' segment", request.subdirToken)));
    }

    outcome.destination = RemotePathBuilder::build(request.remoteBaseDir, request.subdirToken);

    if (cancelled(request)) {
        return abortRun(TransferError::cancelled());
    }
    emit(RunPhase::EnsuringDirectory,
         std::format("Connecting to {}@{}:{}", request.credentials.username, request.credentials.host,
                     request.credentials.port));
    auto created = factory_();
    if (!created) {
        return abortRun(created.error());
    }
    std::unique_ptr<TransportSession> session = std::move(*created);
    if (auto opened = session->open(request.credentials); !opened) {
        return abortRun(opened.error());
    }
    if (auto ensured = session->ensureDirectory(outcome.destination); !ensured) {
        return abortRun(ensured.error());
    }
    emit(RunPhase::EnsuringDirectory, std::format("Remote directory ready: {}", outcome.destination));

    if (cancelled(request)) {
        return abortRun(TransferError::cancelled());
    }
    auto plan = resolver_.resolve(request.sourceSpec);
    if (!plan) {
        return abortRun(plan.error());
    }
    if (plan->empty()) {
        outcome.status = TransferStatus::EmptyResolution;
        emit(RunPhase::Done, std::format("Nothing to transfer: '{}' matched no files", request.sourceSpec),
             Severity::Warning);
        return;
    }
    emit(RunPhase::Resolving, std::format("Resolved {} item(s) from '{}'", plan->size(), request.sourceSpec));

    outcome.items.reserve(plan->size());
    for (const auto& item : *plan) {
        outcome.items.push_back(ItemResult{item, false, std::nullopt});
    }

    if (options_.parallelUploads > 1 && plan->size() > 1) {
        uploadParallel(session, *plan, request, outcome, emit);
    } else {
        uploadSequential(*session, *plan, request, outcome, emit);
    }
    if (cancelled(request)) {
        for (auto& result : outcome.items) {
            if (!result.succeeded && !result.error) {
                result.error = TransferError::cancelled();
            }
        }
        return abortRun(TransferError::cancelled());
    }

    verify(*session, outcome, emit);
    session->close();

    bool anyFailed = std::ranges::any_of(outcome.items, [](const ItemResult& r) { return !r.succeeded; });
    if (anyFailed) {
        outcome.status = TransferStatus::PartialFailure;
    } else if (outcome.verification.verified()) {
        outcome.status = TransferStatus::Verified;
    } else {
        outcome.status = TransferStatus::CompletedUnverified;
    }
    emit(RunPhase::Done, outcome.summary(),
         outcome.status == TransferStatus::Verified ? Severity::Info : Severity::Warning);
}

void TransferOrchestrator::uploadSequential(TransportSession& session, const TransferPlan& plan,
                                            const RunRequest& request, TransferOutcome& outcome,
                                            EventEmitter& emit) const {
    for (std::size_t i = 0; i < plan.size(); ++i) {
        if (cancelled(request)) {
            return;
        }
        auto& result = outcome.items[i];
        recordItem(result, session.uploadItem(plan[i], outcome.destination));
        if (result.succeeded) {
            emit(RunPhase::Uploading, std::format("Uploaded {} ({}/{})", plan[i].basename, i + 1, plan.size()));
        } else {
            emit(RunPhase::Uploading, std::format("Failed to upload {}", result.error->message), Severity::Error);
        }
    }
}

void TransferOrchestrator::uploadParallel(std::unique_ptr<TransportSession>& primary, const TransferPlan& plan,
                                          const RunRequest& request, TransferOutcome& outcome,
                                          EventEmitter& emit) const {
    std::size_t workerCount = std::min<std::size_t>(options_.parallelUploads, plan.size());

    // Worker 0 uses the run's session; the others get their own connection.
    std::vector<std::unique_ptr<TransportSession>> sessions;
    sessions.reserve(workerCount);
    sessions.push_back(nullptr);
    for (std::size_t w = 1; w < workerCount; ++w) {
        auto created = factory_();
        if (created) {
            if (auto opened = (*created)->open(request.credentials); opened) {
                sessions.push_back(std::move(*created));
                continue;
            } else {
                emit(RunPhase::Uploading, std::format("Upload worker {} unavailable: {}", w, opened.error().describe()),
                     Severity::Warning);
            }
        } else {
            emit(RunPhase::Uploading, std::format("Upload worker {} unavailable: {}", w, created.error().describe()),
                 Severity::Warning);
        }
    }

    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> done{0};
    std::mutex failureMutex;
    std::exception_ptr failure;

    auto work = [&](TransportSession& session) {
        try {
            for (std::size_t i = next++; i < plan.size(); i = next++) {
                if (cancelled(request)) {
                    return;
                }
                auto& result = outcome.items[i];
                recordItem(result, session.uploadItem(plan[i], outcome.destination));
                std::size_t finished = ++done;
                if (result.succeeded) {
                    emit(RunPhase::Uploading, std::format("Uploaded {} ({}/{})", plan[i].basename, finished, plan.size()));
                } else {
                    emit(RunPhase::Uploading, std::format("Failed to upload {}", result.error->message), Severity::Error);
                }
            }
        } catch (...) {
            std::lock_guard<std::mutex> lock(failureMutex);
            if (!failure) {
                failure = std::current_exception();
            }
        }
    };

    std::vector<std::thread> threads;
    for (std::size_t w = 1; w < sessions.size(); ++w) {
        threads.emplace_back(work, std::ref(*sessions[w]));
    }
    work(*primary);
    for (auto& thread : threads) {
        thread.join();
    }
    for (std::size_t w = 1; w < sessions.size(); ++w) {
        sessions[w]->close();
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
}

void TransferOrchestrator::verify(TransportSession& session, TransferOutcome& outcome, EventEmitter& emit) const {
    auto& verification = outcome.verification;
    verification.attempted = true;

    auto listing = session.listDirectory(outcome.destination);
    if (!listing) {
        verification.error = listing.error();
        emit(RunPhase::Verifying, std::format("Listing {} failed, upload left unverified: {}", outcome.destination,
                                              listing.error().describe()),
             Severity::Warning);
        return;
    }

    verification.listed = true;
    verification.lines = std::move(*listing);
    for (const auto& result : outcome.items) {
        if (result.succeeded && !listingContains(verification.lines, result.item.basename)) {
            verification.missing.push_back(result.item.basename);
        }
    }
    if (verification.missing.empty()) {
        emit(RunPhase::Verifying, std::format("Listed {} ({} entries)", outcome.destination, verification.lines.size()));
    } else {
        std::string names;
        for (const auto& name : verification.missing) {
            names += names.empty() ? name : ", " + name;
        }
        emit(RunPhase::Verifying, std::format("Listing of {} does not show: {}", outcome.destination, names),
             Severity::Warning);
    }
}
