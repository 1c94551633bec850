/**
 * @file LinkExtractor.hpp
 * @brief Pure parsing of remote-host links.
 */

#pragma once

#include <optional>
#include <string>

namespace bundlesync::domain {

/**
 * @brief Stateless helpers that understand the remote host's URL shapes.
 * No I/O is performed by any member.
 */
class LinkExtractor {
public:
    /**
     * @brief Pulls the file identifier out of a link.
     *
     * Accepted shapes, tried in this order (first match wins):
     * - @c /file/d/<id>
     * - @c id=<id>
     * - @c /open?id=<id>
     *
     * @return The identifier ([A-Za-z0-9_-]+) or nullopt if no shape matches.
     */
    static std::optional<std::string> ExtractIdentifier(const std::string& url);

    /** @brief Direct-download URL for an identifier. */
    static std::string BuildDirectUrl(const std::string& identifier);

    /** @brief Shareable viewer link for an identifier, as written into pointer files. */
    static std::string BuildShareLink(const std::string& identifier);

    /** @brief First remote-host URL embedded in arbitrary text. */
    static std::optional<std::string> FindFirstRemoteLink(const std::string& text);
};

} // namespace bundlesync::domain
