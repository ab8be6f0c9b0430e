#include "remote_transfer.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#ifndef _WIN32
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;
#endif

namespace fs = std::filesystem;

std::expected<TransportKind, std::string> parseTransportKind(std::string_view text) {
    if (text == "sftp") {
        return TransportKind::Sftp;
    }
    if (text == "scp") {
        return TransportKind::Scp;
    }
    return std::unexpected(std::format("Unknown transport: {} (use sftp or scp)", text));
}

std::expected<std::unique_ptr<TransportSession>, TransferError> createTransportSession(const TransportOptions& options) {
    if (options.kind == TransportKind::Sftp) {
        return std::make_unique<SftpTransportSession>(options.connectTimeout);
    }
    for (std::string_view program : {"ssh", "scp"}) {
        if (findExecutable(program).empty()) {
            return std::unexpected(TransferError::unavailable(std::format("'{}' not found on PATH", program)));
        }
    }
    return std::make_unique<ScpTransportSession>(options.connectTimeout);
}

SessionFactory makeSessionFactory(TransportOptions options) {
    return [options]() { return createTransportSession(options); };
}

fs::path findExecutable(std::string_view program) {
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) {
        return {};
    }
#ifdef _WIN32
    constexpr char kSeparator = ';';
#else
    constexpr char kSeparator = ':';
#endif
    std::string_view paths(pathEnv);
    while (!paths.empty()) {
        auto sep = paths.find(kSeparator);
        std::string_view dir = paths.substr(0, sep);
        if (!dir.empty()) {
            fs::path candidate = fs::path(dir) / fs::path(program);
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec)) {
#ifndef _WIN32
                if (::access(candidate.c_str(), X_OK) != 0) {
                    candidate.clear();
                }
#endif
                if (!candidate.empty()) {
                    return candidate;
                }
            }
        }
        if (sep == std::string_view::npos) {
            break;
        }
        paths.remove_prefix(sep + 1);
    }
    return {};
}

#ifndef _WIN32
std::expected<ProcessResult, TransferError> runProcess(const std::vector<std::string>& argv,
                                                       const std::vector<std::pair<std::string, std::string>>& extraEnv) {
    if (argv.empty()) {
        return std::unexpected(TransferError::unexpected("Empty command line"));
    }

    // Everything the child needs is prepared here; after fork it only calls
    // async-signal-safe functions.
    fs::path program = argv[0].find('/') == std::string::npos ? findExecutable(argv[0]) : fs::path(argv[0]);
    if (program.empty()) {
        return ProcessResult{127, "", std::format("{}: command not found", argv[0])};
    }
    std::string programPath = program.string();

    // O_CLOEXEC keeps the pipes out of children spawned concurrently by other upload workers.
    int outPipe[2];
    int errPipe[2];
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        return std::unexpected(TransferError::transport(std::format("pipe failed: {}", std::strerror(errno))));
    }
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        return std::unexpected(TransferError::transport(std::format("pipe failed: {}", std::strerror(errno))));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    std::vector<std::string> envStrings;
    for (char** entry = environ; *entry; ++entry) {
        std::string_view current(*entry);
        bool overridden = current.starts_with(std::string(kSecretEnvironmentVariable) + "=");
        for (const auto& [name, value] : extraEnv) {
            if (current.starts_with(name + "=")) {
                overridden = true;
            }
        }
        if (!overridden) {
            envStrings.emplace_back(current);
        }
    }
    for (const auto& [name, value] : extraEnv) {
        envStrings.push_back(name + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(envStrings.size() + 1);
    for (auto& entry : envStrings) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) {
            ::close(fd);
        }
        for (auto& entry : envStrings) {
            secureWipe(entry);
        }
        return std::unexpected(TransferError::transport(std::format("fork failed: {}", std::strerror(errno))));
    }

    if (pid == 0) {
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::close(devNull);
        }
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) {
            ::close(fd);
        }
        ::execve(programPath.c_str(), args.data(), envp.data());
        _exit(127);
    }

    for (auto& entry : envStrings) {
        secureWipe(entry);
    }
    ::close(outPipe[1]);
    ::close(errPipe[1]);

    ProcessResult result;
    pollfd fds[2] = {{outPipe[0], POLLIN, 0}, {errPipe[0], POLLIN, 0}};
    std::string* sinks[2] = {&result.output, &result.errors};
    int openCount = 2;
    char buf[4096];
    while (openCount > 0) {
        if (::poll(fds, 2, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --openCount;
            }
        }
    }
    for (const auto& fd : fds) {
        if (fd.fd >= 0) {
            ::close(fd.fd);
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected(TransferError::transport(std::format("waitpid failed: {}", std::strerror(errno))));
        }
    }
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }
    return result;
}
#else
std::expected<ProcessResult, TransferError> runProcess(const std::vector<std::string>&,
                                                       const std::vector<std::pair<std::string, std::string>>&) {
    return std::unexpected(TransferError::unavailable("The scp transport is not supported on Windows; use sftp"));
}
#endif
