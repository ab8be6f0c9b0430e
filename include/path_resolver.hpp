/**
 * @file path_resolver.hpp
 * @brief Turns a user-supplied source specification into a concrete transfer plan.
 *
 * A source spec may name a single file, a directory, or a wildcard pattern (`*`, `?`) in its
 * last path component. Resolution happens once; the resulting plan is a snapshot of what
 * existed at that moment and is not re-validated later.
 */

#ifndef PATH_RESOLVER_HPP
#define PATH_RESOLVER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <expected>
#include <filesystem>
#include "transfer_error.hpp"

/**
 * @brief Type of a planned entry.
 */
enum class ItemKind {
    File,      ///< Regular file, uploaded as destination + basename.
    Directory  ///< Directory, uploaded recursively under the destination.
};

/**
 * @brief One entry of a transfer plan.
 */
struct TransferItem {
    ItemKind kind = ItemKind::File; ///< Entry type at resolution time.
    std::filesystem::path localPath; ///< Absolute local path.
    std::string basename;            ///< Final path component, used as the remote name.
};

/**
 * @brief One entry below a Directory item, as found by PathResolver::walkDirectory.
 */
struct LocalEntry {
    std::filesystem::path path; ///< Local path.
    std::string relative;       ///< Path relative to the walked root, '/' separated.
    bool directory = false;     ///< True for subdirectories; false for regular files.
};

/**
 * @brief Ordered list of items to transfer. Empty when a wildcard matched nothing.
 */
using TransferPlan = std::vector<TransferItem>;

/**
 * @brief Classifies source specifications against the local filesystem.
 */
class PathResolver {
public:
    /**
     * @brief Resolves a source specification.
     *
     * - Existing directory: one Directory item.
     * - Existing file: one File item.
     * - Spec containing `*` or `?`: one item per match in enumeration order; an empty plan
     *   when nothing matches.
     * - Anything else: SourceNotFound.
     *
     * @param sourceSpec Path or pattern supplied by the caller.
     * @return std::expected<TransferPlan, TransferError> The plan or SourceNotFound.
     * @note Enumeration order is filesystem dependent. Callers must not rely on it for
     * correctness.
     */
    std::expected<TransferPlan, TransferError> resolve(const std::string& sourceSpec) const;

    /**
     * @brief True if the text contains a glob metacharacter (`*` or `?`).
     */
    static bool hasWildcard(std::string_view text);

    /**
     * @brief Matches a single path component against a glob pattern.
     *
     * `*` matches any run of characters, `?` exactly one. A leading dot in the name is only
     * matched by a pattern that starts with a dot.
     */
    static bool matchesPattern(std::string_view pattern, std::string_view name);

    /**
     * @brief Lists every subdirectory and regular file below a directory item.
     *
     * Parents come before their children. Other file types are left out. An unreadable or
     * vanished directory anywhere in the tree fails the whole walk, so a directory item is
     * never reported as delivered with parts of it missing.
     *
     * @param root Directory to walk.
     * @return std::expected<std::vector<LocalEntry>, TransferError> Entries or TransportFailure.
     */
    static std::expected<std::vector<LocalEntry>, TransferError> walkDirectory(const std::filesystem::path& root);

private:
    std::expected<TransferPlan, TransferError> expand(const std::filesystem::path& pattern) const;
};

#endif // PATH_RESOLVER_HPP
