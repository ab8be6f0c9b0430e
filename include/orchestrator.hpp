/**
 * @file orchestrator.hpp
 * @brief Sequences one delivery run: validate, ensure directory, resolve, upload, verify.
 *
 * Phases run strictly in order. A failure to create the remote directory, an unresolvable
 * source, a handshake failure or cancellation aborts the run. A single item's upload failure
 * is recorded and the remaining items are still attempted. A failed or incomplete listing
 * downgrades the result to unverified but never undoes an upload.
 */

#ifndef ORCHESTRATOR_HPP
#define ORCHESTRATOR_HPP

#include <string>
#include <atomic>
#include <memory>
#include "credentials.hpp"
#include "path_resolver.hpp"
#include "progress.hpp"
#include "remote_transfer.hpp"
#include "transfer_outcome.hpp"

/**
 * @brief Inputs of one run. Moved into TransferOrchestrator::run, which owns the secret.
 */
struct RunRequest {
    std::string sourceSpec;                     ///< File, directory or wildcard pattern.
    Credentials credentials;                    ///< Remote identity; the secret is wiped when the run ends.
    std::string remoteBaseDir;                  ///< Fixed remote base directory.
    std::string subdirToken;                    ///< Optional subdirectory, typically a year.
    const std::atomic<bool>* cancelFlag = nullptr; ///< Checked between phases and items.
};

/**
 * @brief Behavior switches for the orchestrator.
 */
struct OrchestratorOptions {
    unsigned parallelUploads = 1; ///< Upload workers; 1 uploads sequentially on the run's session.
    bool rejectTraversal = true;  ///< Reject subdirectory tokens containing ".." segments.
};

/**
 * @brief Runs deliveries against sessions produced by a SessionFactory.
 */
class TransferOrchestrator {
public:
    /**
     * @brief Constructs an orchestrator.
     *
     * @param factory Produces unopened sessions. Called once per run, plus once per extra
     * upload worker when parallelUploads > 1.
     * @param options Behavior switches.
     */
    explicit TransferOrchestrator(SessionFactory factory, OrchestratorOptions options = {});

    /**
     * @brief Executes one run.
     *
     * @param request Run inputs. The secret is cleared on every exit path.
     * @param sink Receives progress events in algorithm order. May be empty.
     * @return TransferOutcome Per-item results, verification and overall status.
     */
    TransferOutcome run(RunRequest request, const ProgressSink& sink) const;

private:
    class EventEmitter;

    void execute(RunRequest& request, TransferOutcome& outcome, EventEmitter& emit) const;
    void uploadSequential(TransportSession& session, const TransferPlan& plan, const RunRequest& request,
                          TransferOutcome& outcome, EventEmitter& emit) const;
    void uploadParallel(std::unique_ptr<TransportSession>& primary, const TransferPlan& plan,
                        const RunRequest& request, TransferOutcome& outcome, EventEmitter& emit) const;
    void verify(TransportSession& session, TransferOutcome& outcome, EventEmitter& emit) const;

    SessionFactory factory_;
    OrchestratorOptions options_;
    PathResolver resolver_;
};

/**
 * @brief Name field of one `ls -l` line, or an empty string for lines without one ("total 8").
 *
 * The name is whatever follows the mode, links, owner, group, size and three date columns
 * (one more for device files). A symlink's " -> target" suffix is dropped.
 */
std::string listingEntryName(const std::string& line);

/**
 * @brief True if some listing line has exactly the given entry name.
 */
bool listingContains(const std::vector<std::string>& lines, const std::string& name);

#endif // ORCHESTRATOR_HPP
