/**
 * @file remote_path.hpp
 * @brief Remote destination composition and POSIX shell quoting.
 *
 * The destination is always an absolute directory ending in '/'. Subdirectory tokens are
 * sanitized, never rejected, by build(); callers that want stricter behavior check the token
 * with containsTraversal() first.
 */

#ifndef REMOTE_PATH_HPP
#define REMOTE_PATH_HPP

#include <string>
#include <string_view>

/**
 * @brief Normalized remote directory, always ending in '/'.
 */
using RemoteDestination = std::string;

/**
 * @brief Builds remote destinations from a fixed base directory and an optional token.
 */
class RemotePathBuilder {
public:
    /**
     * @brief Combines the base directory with a subdirectory token.
     *
     * The base gets a trailing '/' if missing. A blank token yields the base. Otherwise the
     * token is trimmed of whitespace and of leading/trailing '/' and joined as base + token + '/'.
     *
     * @param baseDir Fixed remote base directory, e.g. "/data/".
     * @param subdirToken Optional subdirectory, typically a year.
     * @return RemoteDestination Normalized destination.
     */
    static RemoteDestination build(std::string_view baseDir, std::string_view subdirToken);

    /**
     * @brief True if the token has a ".." path segment once trimmed.
     */
    static bool containsTraversal(std::string_view subdirToken);
};

/**
 * @brief Quotes text for a POSIX shell using single quotes.
 *
 * Embedded single quotes become '\''. The result is safe to paste into a remote command line.
 */
std::string shellQuote(std::string_view text);

#endif // REMOTE_PATH_HPP
