#include "path_resolver.hpp"
#include <format>
#include <system_error>

namespace fs = std::filesystem;

namespace {

TransferItem makeItem(const fs::path& path, ItemKind kind) {
    fs::path absolute = fs::absolute(path).lexically_normal();
    // "proj/" normalizes to "proj/" with an empty filename
    if (absolute.filename().empty() && absolute.has_parent_path()) {
        absolute = absolute.parent_path();
    }
    return TransferItem{kind, absolute, absolute.filename().string()};
}

} // namespace

std::expected<TransferPlan, TransferError> PathResolver::resolve(const std::string& sourceSpec) const {
    fs::path source(sourceSpec);
    std::error_code ec;

    if (fs::is_directory(source, ec)) {
        return TransferPlan{makeItem(source, ItemKind::Directory)};
    }
    if (fs::exists(source, ec)) {
        return TransferPlan{makeItem(source, ItemKind::File)};
    }
    if (hasWildcard(sourceSpec)) {
        return expand(source);
    }
    return std::unexpected(TransferError::sourceNotFound(sourceSpec));
}

bool PathResolver::hasWildcard(std::string_view text) {
    return text.find_first_of("*?") != std::string_view::npos;
}

bool PathResolver::matchesPattern(std::string_view pattern, std::string_view name) {
    if (!name.empty() && name.front() == '.' && (pattern.empty() || pattern.front() != '.')) {
        return false;
    }

    // Iterative match with single-star backtracking.
    std::size_t p = 0, n = 0;
    std::size_t starP = std::string_view::npos, starN = 0;
    while (n < name.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
            ++p;
            ++n;
        } else if (p < pattern.size() && pattern[p] == '*') {
            starP = p++;
            starN = n;
        } else if (starP != std::string_view::npos) {
            p = starP + 1;
            n = ++starN;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

std::expected<TransferPlan, TransferError> PathResolver::expand(const fs::path& pattern) const {
    TransferPlan plan;
    std::string namePattern = pattern.filename().string();
    fs::path directory = pattern.has_parent_path() ? pattern.parent_path() : fs::path(".");

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return plan;
    }

    fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return plan;
    }
    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (!matchesPattern(namePattern, name)) {
            continue;
        }
        std::error_code typeEc;
        ItemKind kind = entry.is_directory(typeEc) ? ItemKind::Directory : ItemKind::File;
        plan.push_back(makeItem(entry.path(), kind));
    }
    return plan;
}

std::expected<std::vector<LocalEntry>, TransferError> PathResolver::walkDirectory(const fs::path& root) {
    auto unreadable = [&root](const std::error_code& ec) {
        return std::unexpected(TransferError::transport(
            std::format("Failed to read local directory {}: {}", root.string(), ec.message())));
    };

    std::vector<LocalEntry> entries;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    if (ec) {
        return unreadable(ec);
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return unreadable(ec);
        }
        std::error_code typeEc;
        bool directory = it->is_directory(typeEc);
        if (!directory && !it->is_regular_file(typeEc)) {
            continue;
        }
        entries.push_back(LocalEntry{it->path(), it->path().lexically_relative(root).generic_string(), directory});
    }
    if (ec) {
        return unreadable(ec);
    }
    return entries;
}
