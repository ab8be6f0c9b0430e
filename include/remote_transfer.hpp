/**
 * @file remote_transfer.hpp
 * @brief Transport sessions used to deliver files to a remote host.
 *
 * A TransportSession wraps one authenticated connection and exposes the three operations a
 * delivery run needs: create the destination directory, upload an item, list a directory.
 * Operations are never retried internally; the caller decides what a failure means.
 *
 * Two implementations satisfy the same contract:
 * - SftpTransportSession talks SSH directly through libssh (exec channels + SFTP).
 * - ScpTransportSession shells out to the OpenSSH `ssh` and `scp` binaries.
 *
 * @note libssh is required for the SFTP session. The scp session needs `ssh`/`scp` on PATH,
 * plus `sshpass` when authenticating with a password.
 */

#ifndef REMOTE_TRANSFER_HPP
#define REMOTE_TRANSFER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <utility>
#include <chrono>
#include <expected>
#include <functional>
#include <filesystem>
#include "credentials.hpp"
#include "path_resolver.hpp"
#include "remote_path.hpp"
#include "transfer_error.hpp"

// Forward-declare libssh types to keep libssh headers out of this header.
struct ssh_session_struct;
struct sftp_session_struct;

/**
 * @brief Interface for remote transport sessions.
 */
class TransportSession {
public:
    /**
     * @brief Virtual destructor for safe polymorphism. Implementations close the connection.
     */
    virtual ~TransportSession() = default;

    /**
     * @brief Performs the authenticated handshake.
     *
     * @param credentials Host, port, user and secret. Implementations must not keep a copy
     * of the secret beyond their own lifetime.
     * @return std::expected<void, TransferError> ConnectionFailure, AuthenticationFailure,
     * TransportUnavailable or TransportFailure on error.
     */
    virtual std::expected<void, TransferError> open(const Credentials& credentials) = 0;

    /**
     * @brief Creates a remote directory and missing parents. Succeeds if it already exists.
     *
     * @param path Remote directory.
     * @return std::expected<void, TransferError> RemoteCommandFailure with the exit code and
     * stderr when the remote command fails.
     */
    virtual std::expected<void, TransferError> ensureDirectory(const RemoteDestination& path) = 0;

    /**
     * @brief Uploads one planned item.
     *
     * A File item lands at destination + basename. A Directory item is copied recursively to
     * destination + basename, keeping its internal structure.
     *
     * @param item Item to upload.
     * @param destination Remote directory, ending in '/'.
     * @return std::expected<void, TransferError> TransportFailure on error.
     */
    virtual std::expected<void, TransferError> uploadItem(const TransferItem& item, const RemoteDestination& destination) = 0;

    /**
     * @brief Lists a remote directory with details and human-readable sizes.
     *
     * @param path Remote directory.
     * @return std::expected<std::vector<std::string>, TransferError> Raw listing lines in
     * the order the remote produced them.
     */
    virtual std::expected<std::vector<std::string>, TransferError> listDirectory(const RemoteDestination& path) = 0;

    /**
     * @brief Releases the connection. Safe to call more than once.
     */
    virtual void close() = 0;
};

/**
 * @brief Available transport implementations.
 */
enum class TransportKind {
    Sftp, ///< libssh session.
    Scp   ///< External ssh/scp binaries.
};

/**
 * @brief Settings shared by transport implementations.
 */
struct TransportOptions {
    TransportKind kind = TransportKind::Sftp;           ///< Implementation to create.
    std::chrono::seconds connectTimeout{20};            ///< Handshake timeout.
};

/**
 * @brief Produces a fresh, unopened session. Used once per run, or once per upload worker.
 */
using SessionFactory = std::function<std::expected<std::unique_ptr<TransportSession>, TransferError>()>;

/**
 * @brief Parses "sftp" or "scp".
 */
std::expected<TransportKind, std::string> parseTransportKind(std::string_view text);

/**
 * @brief Creates an unopened session of the configured kind.
 *
 * @return std::expected<std::unique_ptr<TransportSession>, TransferError> TransportUnavailable
 * when the scp transport's binaries are not on PATH.
 */
std::expected<std::unique_ptr<TransportSession>, TransferError> createTransportSession(const TransportOptions& options);

/**
 * @brief Builds a SessionFactory bound to the given options.
 */
SessionFactory makeSessionFactory(TransportOptions options);

/**
 * @brief SFTP transport backed by libssh.
 *
 * Directory creation and listing run as remote commands on exec channels so their exit
 * status and stderr are reported. Uploads go through one SFTP subsystem opened at handshake.
 */
class SftpTransportSession : public TransportSession {
public:
    /**
     * @brief Constructs an unopened SFTP session.
     *
     * @param connectTimeout Timeout applied to the TCP connect and SSH handshake.
     */
    explicit SftpTransportSession(std::chrono::seconds connectTimeout);
    ~SftpTransportSession() override;

    SftpTransportSession(const SftpTransportSession&) = delete;
    SftpTransportSession& operator=(const SftpTransportSession&) = delete;

    std::expected<void, TransferError> open(const Credentials& credentials) override;
    std::expected<void, TransferError> ensureDirectory(const RemoteDestination& path) override;
    std::expected<void, TransferError> uploadItem(const TransferItem& item, const RemoteDestination& destination) override;
    std::expected<std::vector<std::string>, TransferError> listDirectory(const RemoteDestination& path) override;
    void close() override;

private:
    struct CommandOutput {
        int exitCode = 0;
        std::string out;
        std::string err;
    };

    std::expected<void, TransferError> verifyHostKey();
    std::expected<void, TransferError> authenticate(const Credentials& credentials);
    std::expected<CommandOutput, TransferError> execute(const std::string& command);
    std::expected<void, TransferError> uploadFile(const std::filesystem::path& localFile, const std::string& remoteFile);
    std::expected<void, TransferError> makeRemoteDirectory(const std::string& remoteDir);
    std::string lastError() const;

    std::chrono::seconds connectTimeout_;  ///< Handshake timeout.
    ssh_session_struct* ssh_ = nullptr;    ///< libssh session, owned.
    sftp_session_struct* sftp_ = nullptr;  ///< SFTP subsystem, owned.
};

/**
 * @brief Exit status and captured streams of a local child process.
 */
struct ProcessResult {
    int exitCode = 0;    ///< Exit status, or 127 when the program could not be started.
    std::string output;  ///< Captured stdout.
    std::string errors;  ///< Captured stderr.
};

/**
 * @brief Runs argv[0] with the given arguments and extra environment entries.
 *
 * Extra environment entries are set in the child only. Returns TransportFailure when the
 * process cannot be spawned.
 */
using ProcessRunner = std::function<std::expected<ProcessResult, TransferError>(
    const std::vector<std::string>& argv,
    const std::vector<std::pair<std::string, std::string>>& extraEnv)>;

/**
 * @brief Environment variable the CLI reads the secret from. Never passed on to child processes.
 */
inline constexpr std::string_view kSecretEnvironmentVariable = "FILEDROP_SECRET";

/**
 * @brief Default ProcessRunner using fork/execve with piped stdout and stderr.
 *
 * The child inherits the parent environment minus kSecretEnvironmentVariable, plus extraEnv.
 */
std::expected<ProcessResult, TransferError> runProcess(const std::vector<std::string>& argv,
                                                       const std::vector<std::pair<std::string, std::string>>& extraEnv);

/**
 * @brief Looks a program up on PATH. Returns an empty path when absent.
 */
std::filesystem::path findExecutable(std::string_view program);

/**
 * @brief Transport that drives the OpenSSH command-line tools.
 *
 * Every operation spawns one process: `ssh` for mkdir/ls, `scp -r` for uploads. Password
 * secrets are passed to `sshpass -e` through the child's SSHPASS variable, key secrets with
 * `-i`. The session keeps its own ScopedSecret copy for the duration of the run.
 */
class ScpTransportSession : public TransportSession {
public:
    /**
     * @brief Constructs an unopened scp session.
     *
     * @param connectTimeout Passed as ConnectTimeout to ssh and scp.
     * @param runner Process launcher, replaceable in tests.
     */
    explicit ScpTransportSession(std::chrono::seconds connectTimeout, ProcessRunner runner = runProcess);

    std::expected<void, TransferError> open(const Credentials& credentials) override;
    std::expected<void, TransferError> ensureDirectory(const RemoteDestination& path) override;
    std::expected<void, TransferError> uploadItem(const TransferItem& item, const RemoteDestination& destination) override;
    std::expected<std::vector<std::string>, TransferError> listDirectory(const RemoteDestination& path) override;
    void close() override;

    /**
     * @brief Builds the argv for running a remote command through ssh.
     */
    std::vector<std::string> sshCommand(const std::string& remoteCommand) const;

    /**
     * @brief Builds the argv for uploading a local path with scp.
     */
    std::vector<std::string> scpCommand(const TransferItem& item, const RemoteDestination& destination) const;

private:
    std::vector<std::string> commonOptions(std::string_view portFlag) const;
    std::vector<std::pair<std::string, std::string>> environment() const;
    std::expected<ProcessResult, TransferError> run(const std::vector<std::string>& argv) const;
    TransferError classifyFailure(const ProcessResult& result, const std::string& what) const;

    std::chrono::seconds connectTimeout_; ///< ConnectTimeout option value.
    ProcessRunner runner_;                ///< Process launcher.
    std::string host_;                    ///< Remote host.
    int port_ = 22;                       ///< Remote port.
    std::string user_;                    ///< Remote user.
    SecretKind secretKind_ = SecretKind::Password; ///< How secret_ is passed.
    ScopedSecret secret_;                 ///< Own copy of the secret, wiped on close.
    bool opened_ = false;                 ///< Set after a successful handshake.
};

#endif // REMOTE_TRANSFER_HPP
