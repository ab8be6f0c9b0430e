/**
 * @file delivery_config.hpp
 * @brief Configuration management for filedrop.
 *
 * Loads the remote target, transport, logging and notification settings from a JSON file and
 * provides the timestamped file logging used by the command-line front end.
 *
 * @note Secrets may be stored in the file for unattended use, but the CLI prefers the
 * FILEDROP_SECRET environment variable or an interactive prompt.
 */

#ifndef DELIVERY_CONFIG_HPP
#define DELIVERY_CONFIG_HPP

#include <string>
#include <json/json.h>
#include "remote_transfer.hpp"

/**
 * @brief Connection settings for the remote host.
 */
struct RemoteConfig {
    std::string host;     ///< Remote host name or address.
    int port = 22;        ///< SSH port.
    std::string user;     ///< Remote account.
    std::string password; ///< Optional password.
    std::string keyFile;  ///< Optional private key path, preferred over password when both are set.
};

/**
 * @brief Configuration class for delivery runs.
 *
 * Missing keys fall back to defaults; an unreadable or malformed file is an error.
 */
class DeliveryConfig {
public:
    /**
     * @brief Default-constructed configuration, used by tests and when no file is given.
     */
    DeliveryConfig() = default;

    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is missing, unparsable or holds invalid values.
     */
    explicit DeliveryConfig(const std::string& configFile);

    /**
     * @brief Applies settings from an already parsed JSON document.
     *
     * @param root Parsed configuration object.
     * @throws std::runtime_error If a value is invalid (unknown transport, bad port).
     */
    void load(const Json::Value& root);

    /**
     * @brief Logs a message to stdout and the configured log file.
     *
     * @param message Message to log.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs an error to stderr and the configured error log file.
     *
     * @param message Error message to log.
     */
    void logError(const std::string& message) const;

    std::string remoteBaseDir = "/data/";            ///< Fixed remote base directory.
    std::string subdirToken;                         ///< Default subdirectory token.
    TransportOptions transport;                      ///< Transport kind and connect timeout.
    unsigned parallelUploads = 1;                    ///< Upload workers.
    bool rejectTraversal = true;                     ///< Reject ".." in subdirectory tokens.
    bool treatPartialAsSuccess = false;              ///< Exit 0 on PartialFailure.
    std::string logFile = "./filedrop.log";          ///< Path to the log file.
    std::string errorLogFile = "./filedrop-errors.log"; ///< Path to the error log file.
    RemoteConfig remote;                             ///< Remote connection settings.
    Json::Value telegramConfig;                      ///< Telegram notification settings.
    Json::Value emailConfig;                         ///< Email notification settings.
};

#endif // DELIVERY_CONFIG_HPP
