/**
 * @file notification.hpp
 * @brief Run-summary notifications for filedrop.
 *
 * After each delivery run a one-line summary can be sent via Telegram or e-mail. A failed
 * notification is logged by the caller and never changes the run's outcome.
 *
 * @note Requires libcurl for Telegram and SMTP.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <string>
#include <memory>
#include <expected>
#include <json/json.h>

/**
 * @brief Interface for notification strategies.
 */
class NotificationStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~NotificationStrategy() = default;

    /**
     * @brief Sends a notification.
     *
     * @param message Message to send.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> notify(const std::string& message) = 0;
};

/**
 * @brief Telegram notification strategy.
 *
 * Sends notifications using the Telegram Bot API.
 */
class TelegramNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @brief Constructs a Telegram notification strategy.
     *
     * @param config JSON configuration with bot_token and chat_id.
     * @throws std::runtime_error If bot_token or chat_id is missing.
     */
    explicit TelegramNotificationStrategy(const Json::Value& config);

    std::expected<void, std::string> notify(const std::string& message) override;

private:
    std::string botToken; ///< Telegram bot token.
    std::string chatId;   ///< Telegram chat ID.
};

/**
 * @brief Email notification strategy.
 *
 * Sends notifications over SMTP.
 */
class EmailNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @brief Constructs an email notification strategy.
     *
     * @param config JSON configuration with email_to, smtp_server and optional email_from,
     * smtp_user and smtp_password.
     * @throws std::runtime_error If email_to or smtp_server is missing.
     */
    explicit EmailNotificationStrategy(const Json::Value& config);

    std::expected<void, std::string> notify(const std::string& message) override;

    /**
     * @brief Builds the RFC 5322 message sent for a summary line.
     */
    std::string buildPayload(const std::string& message) const;

private:
    std::string emailTo;      ///< Recipient email address.
    std::string emailFrom;    ///< Sender address; defaults to emailTo.
    std::string smtpServer;   ///< SMTP server URL, e.g. "smtp://mail.example.com:587".
    std::string smtpUser;     ///< Optional SMTP login.
    std::string smtpPassword; ///< Optional SMTP password.
};

/**
 * @brief Creates the configured strategy: Telegram if set, otherwise email, otherwise none.
 *
 * @return std::unique_ptr<NotificationStrategy> Null when no notification is configured.
 * @throws std::runtime_error If a configured section is incomplete.
 */
std::unique_ptr<NotificationStrategy> makeNotificationStrategy(const Json::Value& telegramConfig,
                                                               const Json::Value& emailConfig);

#endif // NOTIFICATION_HPP
