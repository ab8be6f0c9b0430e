/**
 * @file delivery.hpp
 * @brief Top-level delivery class wiring configuration, transport, logging and notification.
 *
 * Delivery owns what outlives a single run (configuration, session factory, notifier) and
 * turns each call to execute() into one TransferOrchestrator run whose progress events are
 * written to the configured log files.
 */

#ifndef DELIVERY_HPP
#define DELIVERY_HPP

#include <string>
#include <memory>
#include <atomic>
#include "delivery_config.hpp"
#include "notification.hpp"
#include "orchestrator.hpp"
#include "transfer_outcome.hpp"

/**
 * @brief Main delivery orchestration class.
 */
class Delivery {
public:
    /**
     * @brief Constructs a delivery using the configured transport and notification settings.
     *
     * @param config Loaded configuration.
     * @throws std::runtime_error If a notification section is incomplete.
     */
    explicit Delivery(DeliveryConfig config);

    /**
     * @brief Constructs a delivery with an explicit session factory and notifier.
     *
     * @param config Loaded configuration.
     * @param factory Session factory used for every run.
     * @param notifier Optional notifier; may be null.
     */
    Delivery(DeliveryConfig config, SessionFactory factory, std::unique_ptr<NotificationStrategy> notifier);

    /**
     * @brief Runs one delivery and reports the summary.
     *
     * @param sourceSpec File, directory or wildcard pattern.
     * @param subdirToken Subdirectory below the configured base; empty for the base itself.
     * @param credentials Remote identity; its secret is wiped before this call returns.
     * @param cancelFlag Optional external cancellation flag.
     * @return TransferOutcome Result of the run.
     */
    TransferOutcome execute(const std::string& sourceSpec, const std::string& subdirToken, Credentials credentials,
                            const std::atomic<bool>* cancelFlag = nullptr);

    /**
     * @brief Process exit code for an outcome under the configured partial-failure policy.
     */
    int exitCode(const TransferOutcome& outcome) const;

private:
    void logEvent(const ProgressEvent& event) const;

    DeliveryConfig config;                                     ///< Delivery configuration.
    SessionFactory factory;                                    ///< Transport session factory.
    std::unique_ptr<NotificationStrategy> notificationStrategy; ///< Optional notifier.
};

#endif // DELIVERY_HPP
