#include "transfer_error.hpp"
#include <format>
#include <utility>

TransferError TransferError::invalidInput(std::string message) {
    return {TransferErrorKind::InvalidInput, std::move(message)};
}

TransferError TransferError::sourceNotFound(const std::string& sourceSpec) {
    return {TransferErrorKind::SourceNotFound, std::format("Source not found: {}", sourceSpec)};
}

TransferError TransferError::authentication(std::string message) {
    return {TransferErrorKind::AuthenticationFailure, std::move(message)};
}

TransferError TransferError::connection(std::string message) {
    return {TransferErrorKind::ConnectionFailure, std::move(message)};
}

TransferError TransferError::remoteCommand(int exitCode, std::string stderrText, const std::string& command) {
    TransferError error{TransferErrorKind::RemoteCommandFailure,
                        std::format("Remote command failed with exit code {}: {}", exitCode, command)};
    error.exitCode = exitCode;
    error.stderrText = std::move(stderrText);
    return error;
}

TransferError TransferError::transport(std::string message) {
    return {TransferErrorKind::TransportFailure, std::move(message)};
}

TransferError TransferError::unavailable(std::string message) {
    return {TransferErrorKind::TransportUnavailable, std::move(message)};
}

TransferError TransferError::cancelled() {
    return {TransferErrorKind::Cancelled, "Run cancelled"};
}

TransferError TransferError::unexpected(std::string message) {
    return {TransferErrorKind::UnexpectedFailure, std::move(message)};
}

std::string TransferError::describe() const {
    std::string text = std::format("{}: {}", errorKindName(kind), message);
    if (!stderrText.empty()) {
        text += std::format(" (stderr: {})", stderrText);
    }
    if (auto hint = errorKindHint(kind); !hint.empty()) {
        text += std::format(". {}", hint);
    }
    return text;
}

std::string_view errorKindName(TransferErrorKind kind) {
    switch (kind) {
    case TransferErrorKind::InvalidInput: return "InvalidInput";
    case TransferErrorKind::SourceNotFound: return "SourceNotFound";
    case TransferErrorKind::AuthenticationFailure: return "AuthenticationFailure";
    case TransferErrorKind::ConnectionFailure: return "ConnectionFailure";
    case TransferErrorKind::RemoteCommandFailure: return "RemoteCommandFailure";
    case TransferErrorKind::ItemTransferFailure: return "ItemTransferFailure";
    case TransferErrorKind::TransportFailure: return "TransportFailure";
    case TransferErrorKind::TransportUnavailable: return "TransportUnavailable";
    case TransferErrorKind::Cancelled: return "Cancelled";
    case TransferErrorKind::UnexpectedFailure: return "UnexpectedFailure";
    }
    return "UnexpectedFailure";
}

std::string_view errorKindHint(TransferErrorKind kind) {
    switch (kind) {
    case TransferErrorKind::AuthenticationFailure:
        return "Check the username and password or key file";
    case TransferErrorKind::ConnectionFailure:
        return "Check the network connection and that the host is reachable";
    case TransferErrorKind::TransportUnavailable:
        return "Install the OpenSSH client (and sshpass for password logins) or use the sftp transport";
    default:
        return {};
    }
}
