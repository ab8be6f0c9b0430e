#include "progress.hpp"
#include <format>

std::string_view phaseName(RunPhase phase) {
    switch (phase) {
    case RunPhase::Validating: return "validating";
    case RunPhase::EnsuringDirectory: return "ensure-directory";
    case RunPhase::Resolving: return "resolving";
    case RunPhase::Uploading: return "uploading";
    case RunPhase::Verifying: return "verifying";
    case RunPhase::Done: return "done";
    case RunPhase::Aborted: return "aborted";
    }
    return "unknown";
}

std::string formatEvent(const ProgressEvent& event) {
    return std::format("[{}] {}", phaseName(event.phase), event.message);
}
