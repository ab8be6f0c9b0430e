#include "delivery_config.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", std::localtime(&timeT));
    return timeBuf;
}

void appendLine(const std::string& path, const std::string& line) {
    fs::path logPath(path);
    std::error_code ec;
    if (logPath.has_parent_path()) {
        fs::create_directories(logPath.parent_path(), ec);
    }
    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << line << '\n';
        log.flush();
    } else {
        std::println(stderr, "Error: Cannot write to log file: {}", path);
    }
}

} // namespace

DeliveryConfig::DeliveryConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::Reader reader;
    if (!reader.parse(file, configJson)) {
        throw std::runtime_error(std::format("Failed to parse config file: {}: {}", configFile,
                                             reader.getFormattedErrorMessages()));
    }
    load(configJson);
}

void DeliveryConfig::load(const Json::Value& root) {
    if (!root.isObject()) {
        throw std::runtime_error("Configuration root must be a JSON object");
    }

    remoteBaseDir = root.get("remote_base_dir", remoteBaseDir).asString();
    subdirToken = root.get("subdir_token", subdirToken).asString();

    auto kind = parseTransportKind(root.get("transport", "sftp").asString());
    if (!kind) {
        throw std::runtime_error(kind.error());
    }
    transport.kind = *kind;
    int timeout = root.get("connect_timeout_seconds", 20).asInt();
    if (timeout <= 0) {
        throw std::runtime_error(std::format("Invalid connect_timeout_seconds: {}", timeout));
    }
    transport.connectTimeout = std::chrono::seconds(timeout);

    int parallel = root.get("parallel_uploads", 1).asInt();
    parallelUploads = parallel < 1 ? 1u : static_cast<unsigned>(parallel);
    rejectTraversal = root.get("reject_traversal", rejectTraversal).asBool();
    treatPartialAsSuccess = root.get("treat_partial_as_success", treatPartialAsSuccess).asBool();
    logFile = root.get("log_file", logFile).asString();
    errorLogFile = root.get("error_log_file", errorLogFile).asString();

    const Json::Value& remoteJson = root["remote"];
    remote.host = remoteJson.get("host", "").asString();
    remote.port = remoteJson.get("port", 22).asInt();
    remote.user = remoteJson.get("user", "").asString();
    remote.password = remoteJson.get("password", "").asString();
    remote.keyFile = remoteJson.get("key_file", "").asString();
    if (remote.port <= 0 || remote.port > 65535) {
        throw std::runtime_error(std::format("Invalid remote port: {}", remote.port));
    }

    telegramConfig = root["telegram"];
    emailConfig = root["email"];
}

void DeliveryConfig::logMessage(const std::string& message) const {
    std::string logEntry = std::format("[{}] {}", timestamp(), message);
    std::println("{}", logEntry);
    appendLine(logFile, logEntry);
}

void DeliveryConfig::logError(const std::string& message) const {
    std::string logEntry = std::format("[{}] ERROR: {}", timestamp(), message);
    std::println(stderr, "{}", logEntry);
    appendLine(errorLogFile, logEntry);
}
