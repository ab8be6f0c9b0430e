#include "delivery.hpp"
#include <format>
#include <utility>

Delivery::Delivery(DeliveryConfig config)
    : config(std::move(config)) {
    factory = makeSessionFactory(this->config.transport);
    notificationStrategy = makeNotificationStrategy(this->config.telegramConfig, this->config.emailConfig);
}

Delivery::Delivery(DeliveryConfig config, SessionFactory factory, std::unique_ptr<NotificationStrategy> notifier)
    : config(std::move(config)), factory(std::move(factory)), notificationStrategy(std::move(notifier)) {}

void Delivery::logEvent(const ProgressEvent& event) const {
    switch (event.severity) {
    case Severity::Info:
        config.logMessage(formatEvent(event));
        break;
    case Severity::Warning:
        config.logMessage(std::format("WARNING: {}", formatEvent(event)));
        break;
    case Severity::Error:
        config.logError(formatEvent(event));
        break;
    }
}

TransferOutcome Delivery::execute(const std::string& sourceSpec, const std::string& subdirToken,
                                  Credentials credentials, const std::atomic<bool>* cancelFlag) {
    RunRequest request;
    request.sourceSpec = sourceSpec;
    request.credentials = std::move(credentials);
    request.remoteBaseDir = config.remoteBaseDir;
    request.subdirToken = subdirToken;
    request.cancelFlag = cancelFlag;

    OrchestratorOptions options;
    options.parallelUploads = config.parallelUploads;
    options.rejectTraversal = config.rejectTraversal;

    TransferOrchestrator orchestrator(factory, options);
    TransferOutcome outcome = orchestrator.run(std::move(request),
                                               [this](const ProgressEvent& event) { logEvent(event); });

    for (const auto& result : outcome.items) {
        if (!result.succeeded && result.error) {
            config.logError(std::format("Not delivered: {}", result.item.localPath.string()));
        }
    }

    if (notificationStrategy) {
        auto notified = notificationStrategy->notify(outcome.summary());
        if (!notified) {
            config.logError(std::format("Notification failed: {}", notified.error()));
        }
    }
    return outcome;
}

int Delivery::exitCode(const TransferOutcome& outcome) const {
    return exitCodeFor(outcome, config.treatPartialAsSuccess);
}
