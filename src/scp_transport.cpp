#include "remote_transfer.hpp"
#include <format>
#include <sstream>

namespace {

// sshpass reports a rejected password with exit code 5; ssh uses 255 for its own failures.
constexpr int kSshpassBadPassword = 5;
constexpr int kSshFailure = 255;

std::string firstLine(const std::string& text) {
    auto end = text.find('\n');
    return text.substr(0, end);
}

} // namespace

ScpTransportSession::ScpTransportSession(std::chrono::seconds connectTimeout, ProcessRunner runner)
    : connectTimeout_(connectTimeout), runner_(std::move(runner)) {}

std::vector<std::string> ScpTransportSession::commonOptions(std::string_view portFlag) const {
    std::vector<std::string> args;
    if (secretKind_ == SecretKind::Password) {
        args = {"sshpass", "-e"};
    }
    args.insert(args.end(), {
        std::string(portFlag), std::to_string(port_),
        "-o", std::format("ConnectTimeout={}", connectTimeout_.count()),
        "-o", "StrictHostKeyChecking=accept-new",
    });
    if (secretKind_ == SecretKind::KeyFile) {
        args.insert(args.end(), {"-o", "BatchMode=yes", "-i", std::string(secret_.view())});
    } else {
        args.insert(args.end(), {"-o", "PubkeyAuthentication=no",
                                 "-o", "PreferredAuthentications=password,keyboard-interactive"});
    }
    return args;
}

std::vector<std::pair<std::string, std::string>> ScpTransportSession::environment() const {
    if (secretKind_ == SecretKind::Password) {
        return {{"SSHPASS", std::string(secret_.view())}};
    }
    return {};
}

std::vector<std::string> ScpTransportSession::sshCommand(const std::string& remoteCommand) const {
    std::vector<std::string> args = commonOptions("-p");
    // The program name goes right after sshpass, if present, ahead of the options.
    auto insertAt = secretKind_ == SecretKind::Password ? args.begin() + 2 : args.begin();
    args.insert(insertAt, "ssh");
    args.push_back(std::format("{}@{}", user_, host_));
    args.push_back("--");
    args.push_back(remoteCommand);
    return args;
}

std::vector<std::string> ScpTransportSession::scpCommand(const TransferItem& item, const RemoteDestination& destination) const {
    std::vector<std::string> args = commonOptions("-P");
    auto insertAt = secretKind_ == SecretKind::Password ? args.begin() + 2 : args.begin();
    // -O selects the legacy protocol, where the remote path goes through the remote shell
    // and therefore has to be quoted.
    args.insert(insertAt, {"scp", "-O", "-q"});
    std::string remotePath = destination;
    if (item.kind == ItemKind::Directory) {
        args.push_back("-r");
    } else {
        remotePath += item.basename;
    }
    args.push_back(item.localPath.string());
    args.push_back(std::format("{}@{}:{}", user_, host_, shellQuote(remotePath)));
    return args;
}

std::expected<ProcessResult, TransferError> ScpTransportSession::run(const std::vector<std::string>& argv) const {
    auto env = environment();
    auto result = runner_(argv, env);
    for (auto& entry : env) {
        secureWipe(entry.second);
    }
    return result;
}

TransferError ScpTransportSession::classifyFailure(const ProcessResult& result, const std::string& what) const {
    std::string detail = firstLine(result.errors);
    if (secretKind_ == SecretKind::Password && result.exitCode == kSshpassBadPassword) {
        return TransferError::authentication(std::format("{}: password rejected for {}", what, user_));
    }
    if (result.exitCode == kSshFailure) {
        if (result.errors.find("Permission denied") != std::string::npos) {
            return TransferError::authentication(std::format("{}: {}", what, detail));
        }
        return TransferError::connection(std::format("{}: {}", what, detail));
    }
    return TransferError::transport(std::format("{} exited with code {}: {}", what, result.exitCode, detail));
}

std::expected<void, TransferError> ScpTransportSession::open(const Credentials& credentials) {
    close();
    host_ = credentials.host;
    port_ = credentials.port;
    user_ = credentials.username;
    secretKind_ = credentials.secretKind;
    secret_ = ScopedSecret(std::string(credentials.secret.view()));

    if (secretKind_ == SecretKind::Password && findExecutable("sshpass").empty()) {
        close();
        return std::unexpected(TransferError::unavailable("'sshpass' not found on PATH; required for password logins"));
    }

    auto result = run(sshCommand("true"));
    if (!result) {
        close();
        return std::unexpected(result.error());
    }
    if (result->exitCode != 0) {
        auto error = classifyFailure(*result, std::format("ssh to {}:{}", host_, port_));
        if (error.kind == TransferErrorKind::TransportFailure) {
            error = TransferError::connection(error.message);
        }
        close();
        return std::unexpected(error);
    }
    opened_ = true;
    return {};
}

std::expected<void, TransferError> ScpTransportSession::ensureDirectory(const RemoteDestination& path) {
    if (!opened_) {
        return std::unexpected(TransferError::transport("Session is not open"));
    }
    std::string command = std::format("mkdir -p {}", shellQuote(path));
    auto result = run(sshCommand(command));
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exitCode == kSshFailure) {
        return std::unexpected(classifyFailure(*result, "ssh"));
    }
    if (result->exitCode != 0) {
        return std::unexpected(TransferError::remoteCommand(result->exitCode, firstLine(result->errors), command));
    }
    return {};
}

std::expected<void, TransferError> ScpTransportSession::uploadItem(const TransferItem& item, const RemoteDestination& destination) {
    if (!opened_) {
        return std::unexpected(TransferError::transport("Session is not open"));
    }
    auto result = run(scpCommand(item, destination));
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exitCode != 0) {
        auto error = classifyFailure(*result, std::format("scp {}", item.basename));
        return std::unexpected(TransferError::transport(error.message));
    }
    return {};
}

std::expected<std::vector<std::string>, TransferError> ScpTransportSession::listDirectory(const RemoteDestination& path) {
    if (!opened_) {
        return std::unexpected(TransferError::transport("Session is not open"));
    }
    std::string command = std::format("ls -lh {}", shellQuote(path));
    auto result = run(sshCommand(command));
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exitCode == kSshFailure) {
        return std::unexpected(classifyFailure(*result, "ssh"));
    }
    if (result->exitCode != 0) {
        return std::unexpected(TransferError::remoteCommand(result->exitCode, firstLine(result->errors), command));
    }

    std::vector<std::string> lines;
    std::istringstream stream(result->output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

void ScpTransportSession::close() {
    secret_.clear();
    opened_ = false;
}
