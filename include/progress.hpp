/**
 * @file progress.hpp
 * @brief Progress events emitted by a delivery run.
 *
 * The orchestrator never owns presentation state. It reports phase boundaries through a
 * write-only ProgressSink; the caller decides how to render or log them.
 */

#ifndef PROGRESS_HPP
#define PROGRESS_HPP

#include <string>
#include <string_view>
#include <chrono>
#include <functional>

/**
 * @brief Run phase an event belongs to.
 */
enum class RunPhase {
    Validating,
    EnsuringDirectory,
    Resolving,
    Uploading,
    Verifying,
    Done,
    Aborted
};

/**
 * @brief Event severity.
 */
enum class Severity {
    Info,
    Warning,
    Error
};

/**
 * @brief One progress notification.
 */
struct ProgressEvent {
    RunPhase phase = RunPhase::Validating;       ///< Phase that produced the event.
    std::string message;                         ///< Human-readable text.
    Severity severity = Severity::Info;          ///< Event severity.
    std::chrono::system_clock::time_point timestamp; ///< Emission time.
};

/**
 * @brief Write-only callback receiving events in algorithm order.
 */
using ProgressSink = std::function<void(const ProgressEvent&)>;

std::string_view phaseName(RunPhase phase);

/**
 * @brief Formats an event as "[phase] message", the form used in log files.
 */
std::string formatEvent(const ProgressEvent& event);

#endif // PROGRESS_HPP
