/**
 * @file ConfirmationPageDetector.hpp
 * @brief Interface for recognizing the remote host's large-file interstitial page.
 */

#pragma once

#include <optional>
#include <string>

namespace bundlesync::domain {

/**
 * @class ConfirmationPageDetector
 * @brief Recognizes the "file too large to scan" page and pulls out its confirmation token.
 *
 * Detection works by sniffing page content, which depends on the host's current markup.
 * All of it lives behind this interface so the fetch logic never inspects HTML itself.
 */
class ConfirmationPageDetector {
public:
    virtual ~ConfirmationPageDetector() = default;

    /**
     * @param body Response body.
     * @param contentType Response Content-Type, or empty when unknown.
     */
    virtual bool isInterstitial(const std::string& body, const std::string& contentType) const = 0;

    /** @brief Confirmation token to append as @c confirm=, if one can be found. */
    virtual std::optional<std::string> extractToken(const std::string& body) const = 0;
};

} // namespace bundlesync::domain
