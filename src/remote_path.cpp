#include "remote_path.hpp"

namespace {

std::string_view trimWhitespace(std::string_view text) {
    constexpr std::string_view kSpace = " \t\r\n";
    auto first = text.find_first_not_of(kSpace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(kSpace);
    return text.substr(first, last - first + 1);
}

std::string_view trimSlashes(std::string_view text) {
    while (!text.empty() && text.front() == '/') {
        text.remove_prefix(1);
    }
    while (!text.empty() && text.back() == '/') {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

RemoteDestination RemotePathBuilder::build(std::string_view baseDir, std::string_view subdirToken) {
    RemoteDestination destination(baseDir);
    if (destination.empty() || destination.back() != '/') {
        destination += '/';
    }

    std::string_view token = trimSlashes(trimWhitespace(subdirToken));
    if (token.empty()) {
        return destination;
    }
    destination += token;
    destination += '/';
    return destination;
}

bool RemotePathBuilder::containsTraversal(std::string_view subdirToken) {
    std::string_view token = trimSlashes(trimWhitespace(subdirToken));
    while (!token.empty()) {
        auto slash = token.find('/');
        std::string_view segment = token.substr(0, slash);
        if (segment == "..") {
            return true;
        }
        if (slash == std::string_view::npos) {
            break;
        }
        token.remove_prefix(slash + 1);
    }
    return false;
}

std::string shellQuote(std::string_view text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}
