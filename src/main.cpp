#include "delivery.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <format>
#include <iostream>
#include <stdexcept>
#include <string>
#ifndef _WIN32
#include <termios.h>
#include <unistd.h>
#endif

namespace {

std::atomic<bool> gCancelRequested{false};

void signalHandler(int /*sig*/) {
    gCancelRequested.store(true);
}

void installSignalHandlers() {
#ifdef _WIN32
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
#else
    struct sigaction sa;
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
#endif
}

std::string currentYear() {
    auto timeT = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    char yearBuf[8];
    std::strftime(yearBuf, sizeof(yearBuf), "%Y", std::localtime(&timeT));
    return yearBuf;
}

std::string promptSecret(const std::string& user, const std::string& host) {
    std::cerr << std::format("Password for {}@{}: ", user, host) << std::flush;
    std::string secret;
#ifndef _WIN32
    termios saved{};
    bool restore = ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &saved) == 0;
    if (restore) {
        termios silent = saved;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        ::tcsetattr(STDIN_FILENO, TCSANOW, &silent);
    }
    std::getline(std::cin, secret);
    if (restore) {
        ::tcsetattr(STDIN_FILENO, TCSANOW, &saved);
    }
#else
    std::getline(std::cin, secret);
#endif
    std::cerr << std::endl;
    return secret;
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config <path>] [--subdir <token> | --year] [--transport sftp|scp]"
                 " [--host <host>] [--port <port>] [--user <user>] [--key <file>]"
                 " [--parallel <n>] [--allow-partial] <source>" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile = "filedrop_config.json";
    bool configGiven = false;
    std::string source;
    std::string subdir;
    bool subdirGiven = false;
    std::string transport;
    std::string host;
    std::string user;
    std::string keyFile;
    int port = 0;
    int parallel = 0;
    bool allowPartial = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;
        if (arg == "--config" && hasValue) {
            configFile = argv[++i];
            configGiven = true;
        } else if (arg == "--subdir" && hasValue) {
            subdir = argv[++i];
            subdirGiven = true;
        } else if (arg == "--year") {
            subdir = currentYear();
            subdirGiven = true;
        } else if (arg == "--transport" && hasValue) {
            transport = argv[++i];
        } else if (arg == "--host" && hasValue) {
            host = argv[++i];
        } else if (arg == "--user" && hasValue) {
            user = argv[++i];
        } else if (arg == "--key" && hasValue) {
            keyFile = argv[++i];
        } else if ((arg == "--port" || arg == "--parallel") && hasValue) {
            try {
                (arg == "--port" ? port : parallel) = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: " << arg << " expects a number" << std::endl;
                return 1;
            }
        } else if (arg == "--allow-partial") {
            allowPartial = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (source.empty() && !arg.starts_with("--")) {
            source = arg;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    if (source.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    DeliveryConfig config;
    try {
        if (configGiven || std::filesystem::exists(configFile)) {
            config = DeliveryConfig(configFile);
        }
        if (!transport.empty()) {
            auto kind = parseTransportKind(transport);
            if (!kind) {
                throw std::runtime_error(kind.error());
            }
            config.transport.kind = *kind;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Failed to load config: " << e.what() << std::endl;
        return 1;
    }
    if (parallel > 0) {
        config.parallelUploads = static_cast<unsigned>(parallel);
    }
    if (allowPartial) {
        config.treatPartialAsSuccess = true;
    }
    if (!subdirGiven) {
        subdir = config.subdirToken;
    }

    Credentials credentials;
    credentials.host = host.empty() ? config.remote.host : host;
    credentials.port = port > 0 ? port : config.remote.port;
    credentials.username = user.empty() ? config.remote.user : user;
    if (credentials.username.empty()) {
        if (const char* login = std::getenv("USER")) {
            credentials.username = login;
        }
    }

    std::string secret;
    if (!keyFile.empty()) {
        credentials.secretKind = SecretKind::KeyFile;
        secret = keyFile;
    } else if (const char* envSecret = std::getenv(kSecretEnvironmentVariable.data()); envSecret && *envSecret) {
        secret = envSecret;
    } else if (!config.remote.keyFile.empty()) {
        credentials.secretKind = SecretKind::KeyFile;
        secret = config.remote.keyFile;
    } else if (!config.remote.password.empty()) {
        secret = config.remote.password;
    } else {
        secret = promptSecret(credentials.username, credentials.host);
    }
    credentials.secret = ScopedSecret(std::move(secret));
    ::unsetenv(kSecretEnvironmentVariable.data());
    secureWipe(secret);
    secureWipe(config.remote.password);

    installSignalHandlers();

    try {
        Delivery delivery(std::move(config));
        TransferOutcome outcome = delivery.execute(source, subdir, std::move(credentials), &gCancelRequested);
        int code = delivery.exitCode(outcome);
        if (outcome.status == TransferStatus::Aborted) {
            std::cerr << "Error: " << outcome.summary() << std::endl;
        } else if (outcome.status == TransferStatus::PartialFailure) {
            std::cerr << "Warning: " << outcome.summary() << std::endl;
            for (const auto& result : outcome.items) {
                if (!result.succeeded && result.error) {
                    std::cerr << "  retry: " << result.item.localPath.string() << std::endl;
                }
            }
        } else {
            std::cout << outcome.summary() << std::endl;
        }
        return code;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
