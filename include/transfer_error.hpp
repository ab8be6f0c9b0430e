/**
 * @file transfer_error.hpp
 * @brief Error taxonomy shared by every stage of a delivery run.
 *
 * Errors cross module boundaries as std::expected<T, TransferError>. The kind tells the
 * caller how to react (abort, record against an item, downgrade verification); the message
 * carries the human-readable detail.
 */

#ifndef TRANSFER_ERROR_HPP
#define TRANSFER_ERROR_HPP

#include <string>
#include <string_view>

/**
 * @brief Classification of everything that can go wrong during a delivery run.
 */
enum class TransferErrorKind {
    InvalidInput,          ///< Empty secret, empty source spec, or a rejected token. No I/O attempted.
    SourceNotFound,        ///< Source spec names nothing and contains no wildcard.
    AuthenticationFailure, ///< Remote host rejected the credentials.
    ConnectionFailure,     ///< Host unreachable or handshake failed.
    RemoteCommandFailure,  ///< Remote command exited non-zero (see exitCode / stderrText).
    ItemTransferFailure,   ///< One planned item failed to upload.
    TransportFailure,      ///< Generic channel or SFTP failure.
    TransportUnavailable,  ///< External ssh/scp binaries needed by the transport are missing.
    Cancelled,             ///< Run stopped by the external cancellation flag.
    UnexpectedFailure      ///< Anything not classified above.
};

/**
 * @brief Error value carried through std::expected.
 */
struct TransferError {
    TransferErrorKind kind = TransferErrorKind::UnexpectedFailure; ///< Error class.
    std::string message;    ///< Detail text, safe to log (never contains secrets).
    int exitCode = 0;       ///< Remote exit status for RemoteCommandFailure.
    std::string stderrText; ///< Remote stderr for RemoteCommandFailure.

    static TransferError invalidInput(std::string message);
    static TransferError sourceNotFound(const std::string& sourceSpec);
    static TransferError authentication(std::string message);
    static TransferError connection(std::string message);
    static TransferError remoteCommand(int exitCode, std::string stderrText, const std::string& command);
    static TransferError transport(std::string message);
    static TransferError unavailable(std::string message);
    static TransferError cancelled();
    static TransferError unexpected(std::string message);

    /**
     * @brief Full one-line description including the operator hint, if the kind has one.
     */
    std::string describe() const;
};

/**
 * @brief Stable name of an error kind, used in logs and notifications.
 */
std::string_view errorKindName(TransferErrorKind kind);

/**
 * @brief Operator hint for a kind, or an empty view when there is none.
 *
 * Authentication failures point at the username/secret, connection failures at the network
 * and host availability.
 */
std::string_view errorKindHint(TransferErrorKind kind);

#endif // TRANSFER_ERROR_HPP
