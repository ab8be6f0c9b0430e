#include "remote_transfer.hpp"
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include <fstream>
#include <format>
#include <sstream>
#include <fcntl.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

std::string trimTrailingNewlines(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

} // namespace

SftpTransportSession::SftpTransportSession(std::chrono::seconds connectTimeout)
    : connectTimeout_(connectTimeout) {}

SftpTransportSession::~SftpTransportSession() {
    close();
}

std::string SftpTransportSession::lastError() const {
    return ssh_ ? std::string(ssh_get_error(ssh_)) : std::string("no session");
}

std::expected<void, TransferError> SftpTransportSession::open(const Credentials& credentials) {
    close();

    ssh_ = ssh_new();
    if (!ssh_) {
        return std::unexpected(TransferError::transport("Failed to create SSH session"));
    }

    int port = credentials.port;
    long timeout = static_cast<long>(connectTimeout_.count());
    ssh_options_set(ssh_, SSH_OPTIONS_HOST, credentials.host.c_str());
    ssh_options_set(ssh_, SSH_OPTIONS_PORT, &port);
    ssh_options_set(ssh_, SSH_OPTIONS_USER, credentials.username.c_str());
    ssh_options_set(ssh_, SSH_OPTIONS_TIMEOUT, &timeout);

    if (ssh_connect(ssh_) != SSH_OK) {
        auto error = TransferError::connection(std::format("SSH connection to {}:{} failed: {}",
                                                           credentials.host, credentials.port, lastError()));
        close();
        return std::unexpected(error);
    }

    if (auto hostKey = verifyHostKey(); !hostKey) {
        close();
        return std::unexpected(hostKey.error());
    }

    if (auto auth = authenticate(credentials); !auth) {
        close();
        return std::unexpected(auth.error());
    }

    sftp_ = sftp_new(ssh_);
    if (!sftp_ || sftp_init(sftp_) != SSH_OK) {
        auto error = TransferError::transport(std::format("SFTP initialization failed: {}", lastError()));
        close();
        return std::unexpected(error);
    }
    return {};
}

std::expected<void, TransferError> SftpTransportSession::verifyHostKey() {
    switch (ssh_session_is_known_server(ssh_)) {
    case SSH_KNOWN_HOSTS_OK:
        return {};
    case SSH_KNOWN_HOSTS_NOT_FOUND:
    case SSH_KNOWN_HOSTS_UNKNOWN:
        // First contact: remember the key, like OpenSSH's accept-new.
        if (ssh_session_update_known_hosts(ssh_) != SSH_OK) {
            return std::unexpected(TransferError::connection(
                std::format("Failed to record host key: {}", lastError())));
        }
        return {};
    case SSH_KNOWN_HOSTS_CHANGED:
    case SSH_KNOWN_HOSTS_OTHER:
        return std::unexpected(TransferError::connection(
            "Host key does not match the known_hosts entry; refusing to connect"));
    case SSH_KNOWN_HOSTS_ERROR:
    default:
        return std::unexpected(TransferError::connection(
            std::format("Host key check failed: {}", lastError())));
    }
}

std::expected<void, TransferError> SftpTransportSession::authenticate(const Credentials& credentials) {
    if (credentials.secretKind == SecretKind::Password) {
        if (ssh_userauth_password(ssh_, nullptr, credentials.secret.c_str()) != SSH_AUTH_SUCCESS) {
            return std::unexpected(TransferError::authentication(
                std::format("SSH password authentication failed for {}: {}", credentials.username, lastError())));
        }
        return {};
    }

    ssh_key key = nullptr;
    if (ssh_pki_import_privkey_file(credentials.secret.c_str(), nullptr, nullptr, nullptr, &key) != SSH_OK) {
        return std::unexpected(TransferError::authentication(
            std::format("Failed to load private key file for {}", credentials.username)));
    }
    int rc = ssh_userauth_publickey(ssh_, nullptr, key);
    ssh_key_free(key);
    if (rc != SSH_AUTH_SUCCESS) {
        return std::unexpected(TransferError::authentication(
            std::format("SSH public key authentication failed for {}: {}", credentials.username, lastError())));
    }
    return {};
}

std::expected<SftpTransportSession::CommandOutput, TransferError> SftpTransportSession::execute(const std::string& command) {
    if (!ssh_) {
        return std::unexpected(TransferError::transport("Session is not open"));
    }

    ssh_channel channel = ssh_channel_new(ssh_);
    if (!channel) {
        return std::unexpected(TransferError::transport("ssh_channel_new failed"));
    }
    if (ssh_channel_open_session(channel) != SSH_OK) {
        auto error = TransferError::transport(std::format("ssh_channel_open_session failed: {}", lastError()));
        ssh_channel_free(channel);
        return std::unexpected(error);
    }
    if (ssh_channel_request_exec(channel, command.c_str()) != SSH_OK) {
        auto error = TransferError::transport(std::format("ssh_channel_request_exec failed: {}", lastError()));
        ssh_channel_close(channel);
        ssh_channel_free(channel);
        return std::unexpected(error);
    }

    // Drain stdout and stderr alternately so neither stream stalls the other.
    CommandOutput output;
    char buf[4096];
    bool failed = false;
    while (!failed) {
        int outBytes = ssh_channel_read_timeout(channel, buf, sizeof(buf), 0, 100);
        if (outBytes > 0) {
            output.out.append(buf, static_cast<std::size_t>(outBytes));
        }
        int errBytes = ssh_channel_read_timeout(channel, buf, sizeof(buf), 1, 100);
        if (errBytes > 0) {
            output.err.append(buf, static_cast<std::size_t>(errBytes));
        }
        if (outBytes == SSH_ERROR || errBytes == SSH_ERROR) {
            failed = true;
        } else if (outBytes <= 0 && errBytes <= 0 && ssh_channel_is_eof(channel)) {
            break;
        }
    }
    if (failed) {
        auto error = TransferError::transport(std::format("Reading remote command output failed: {}", lastError()));
        ssh_channel_close(channel);
        ssh_channel_free(channel);
        return std::unexpected(error);
    }

    ssh_channel_send_eof(channel);
    ssh_channel_close(channel);
    output.exitCode = ssh_channel_get_exit_status(channel);
    ssh_channel_free(channel);
    return output;
}

std::expected<void, TransferError> SftpTransportSession::ensureDirectory(const RemoteDestination& path) {
    std::string command = std::format("mkdir -p {}", shellQuote(path));
    auto result = execute(command);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exitCode != 0) {
        return std::unexpected(TransferError::remoteCommand(result->exitCode, trimTrailingNewlines(result->err), command));
    }
    return {};
}

std::expected<std::vector<std::string>, TransferError> SftpTransportSession::listDirectory(const RemoteDestination& path) {
    std::string command = std::format("ls -lh {}", shellQuote(path));
    auto result = execute(command);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exitCode != 0) {
        return std::unexpected(TransferError::remoteCommand(result->exitCode, trimTrailingNewlines(result->err), command));
    }
    return splitLines(result->out);
}

std::expected<void, TransferError> SftpTransportSession::makeRemoteDirectory(const std::string& remoteDir) {
    if (sftp_mkdir(sftp_, remoteDir.c_str(), 0755) == SSH_OK) {
        return {};
    }
    // Many servers answer SSH_FX_FAILURE instead of FILE_ALREADY_EXISTS; stat to be sure.
    sftp_attributes attributes = sftp_stat(sftp_, remoteDir.c_str());
    if (attributes) {
        bool isDirectory = attributes->type == SSH_FILEXFER_TYPE_DIRECTORY;
        sftp_attributes_free(attributes);
        if (isDirectory) {
            return {};
        }
    }
    return std::unexpected(TransferError::transport(
        std::format("Failed to create remote directory {} (sftp error {})", remoteDir, sftp_get_error(sftp_))));
}

std::expected<void, TransferError> SftpTransportSession::uploadFile(const fs::path& localFile, const std::string& remoteFile) {
    std::ifstream input(localFile, std::ios::binary);
    if (!input) {
        return std::unexpected(TransferError::transport(std::format("Failed to open local file: {}", localFile.string())));
    }

    std::error_code ec;
    auto perms = static_cast<mode_t>(fs::status(localFile, ec).permissions() & fs::perms::all);
    if (ec) {
        perms = 0644;
    }

    sftp_file file = sftp_open(sftp_, remoteFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC, perms);
    if (!file) {
        return std::unexpected(TransferError::transport(
            std::format("Failed to open remote file {}: {}", remoteFile, lastError())));
    }

    char buf[16384];
    while (input) {
        input.read(buf, sizeof(buf));
        auto count = input.gcount();
        if (count <= 0) {
            break;
        }
        ssize_t written = sftp_write(file, buf, static_cast<std::size_t>(count));
        if (written != count) {
            sftp_close(file);
            return std::unexpected(TransferError::transport(
                std::format("Write to remote file {} failed: {}", remoteFile, lastError())));
        }
    }
    if (input.bad()) {
        sftp_close(file);
        return std::unexpected(TransferError::transport(std::format("Read error on local file: {}", localFile.string())));
    }
    if (sftp_close(file) != SSH_NO_ERROR) {
        return std::unexpected(TransferError::transport(std::format("Failed to close remote file {}", remoteFile)));
    }
    return {};
}

std::expected<void, TransferError> SftpTransportSession::uploadItem(const TransferItem& item, const RemoteDestination& destination) {
    if (!sftp_) {
        return std::unexpected(TransferError::transport("Session is not open"));
    }

    std::string remoteRoot = destination + item.basename;
    if (item.kind == ItemKind::File) {
        return uploadFile(item.localPath, remoteRoot);
    }

    // Walk the whole local tree first so an unreadable subdirectory fails only this item.
    auto entries = PathResolver::walkDirectory(item.localPath);
    if (!entries) {
        return std::unexpected(entries.error());
    }
    if (auto made = makeRemoteDirectory(remoteRoot); !made) {
        return made;
    }
    for (const auto& entry : *entries) {
        std::string remotePath = std::format("{}/{}", remoteRoot, entry.relative);
        auto sent = entry.directory ? makeRemoteDirectory(remotePath) : uploadFile(entry.path, remotePath);
        if (!sent) {
            return sent;
        }
    }
    return {};
}

void SftpTransportSession::close() {
    if (sftp_) {
        sftp_free(sftp_);
        sftp_ = nullptr;
    }
    if (ssh_) {
        if (ssh_is_connected(ssh_)) {
            ssh_disconnect(ssh_);
        }
        ssh_free(ssh_);
        ssh_ = nullptr;
    }
}
