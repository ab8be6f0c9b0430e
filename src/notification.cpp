#include "notification.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cstring>
#include <format>
#include <stdexcept>

namespace {

size_t discardCallback([[maybe_unused]] void* contents, size_t size, size_t nmemb, [[maybe_unused]] void* userp) {
    return size * nmemb;
}

struct UploadState {
    const std::string* payload;
    size_t offset;
};

size_t payloadCallback(char* buffer, size_t size, size_t nmemb, void* userp) {
    auto* state = static_cast<UploadState*>(userp);
    size_t room = size * nmemb;
    size_t remaining = state->payload->size() - state->offset;
    size_t count = std::min(room, remaining);
    if (count > 0) {
        std::memcpy(buffer, state->payload->data() + state->offset, count);
        state->offset += count;
    }
    return count;
}

std::string requireString(const Json::Value& config, const char* key, const char* section) {
    std::string value = config.get(key, "").asString();
    if (value.empty()) {
        throw std::runtime_error(std::format("Missing {}.{} in configuration", section, key));
    }
    return value;
}

} // namespace

TelegramNotificationStrategy::TelegramNotificationStrategy(const Json::Value& config)
    : botToken(requireString(config, "bot_token", "telegram")),
      chatId(requireString(config, "chat_id", "telegram")) {}

std::expected<void, std::string> TelegramNotificationStrategy::notify(const std::string& message) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    char* escaped = curl_easy_escape(curl, message.c_str(), static_cast<int>(message.length()));
    if (!escaped) {
        curl_easy_cleanup(curl);
        return std::unexpected("Failed to escape notification text");
    }
    std::string url = std::format("https://api.telegram.org/bot{}/sendMessage?chat_id={}&text={}",
        botToken, chatId, escaped);
    curl_free(escaped);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discardCallback);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Failed to send Telegram notification: {}", curl_easy_strerror(res)));
    }
    return {};
}

EmailNotificationStrategy::EmailNotificationStrategy(const Json::Value& config)
    : emailTo(requireString(config, "email_to", "email")),
      emailFrom(config.get("email_from", "").asString()),
      smtpServer(requireString(config, "smtp_server", "email")),
      smtpUser(config.get("smtp_user", "").asString()),
      smtpPassword(config.get("smtp_password", "").asString()) {
    if (emailFrom.empty()) {
        emailFrom = emailTo;
    }
}

std::string EmailNotificationStrategy::buildPayload(const std::string& message) const {
    return std::format("To: <{}>\r\nFrom: <{}>\r\nSubject: filedrop delivery report\r\n\r\n{}\r\n",
                       emailTo, emailFrom, message);
}

std::expected<void, std::string> EmailNotificationStrategy::notify(const std::string& message) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    std::string payload = buildPayload(message);
    UploadState state{&payload, 0};
    std::string from = std::format("<{}>", emailFrom);
    curl_slist* recipients = curl_slist_append(nullptr, std::format("<{}>", emailTo).c_str());

    curl_easy_setopt(curl, CURLOPT_URL, smtpServer.c_str());
    if (!smtpUser.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERNAME, smtpUser.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, smtpPassword.c_str());
        curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    }
    curl_easy_setopt(curl, CURLOPT_MAIL_FROM, from.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, recipients);
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, payloadCallback);
    curl_easy_setopt(curl, CURLOPT_READDATA, &state);
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(recipients);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Failed to send email notification: {}", curl_easy_strerror(res)));
    }
    return {};
}

std::unique_ptr<NotificationStrategy> makeNotificationStrategy(const Json::Value& telegramConfig,
                                                               const Json::Value& emailConfig) {
    if (!telegramConfig.empty()) {
        return std::make_unique<TelegramNotificationStrategy>(telegramConfig);
    }
    if (!emailConfig.empty()) {
        return std::make_unique<EmailNotificationStrategy>(emailConfig);
    }
    return nullptr;
}
