#pragma once

#include "domain/ConfirmationPageDetector.hpp"

namespace bundlesync::infrastructure {

/**
 * @class ScanWarningPageDetector
 * @brief Recognizes the host's "virus scan warning" page by substring and pattern sniffing.
 *
 * Bodies with a non-HTML Content-Type are never treated as interstitial, so binary payloads
 * that happen to contain "confirm=" are left alone.
 */
class ScanWarningPageDetector : public domain::ConfirmationPageDetector {
public:
    bool isInterstitial(const std::string& body, const std::string& contentType) const override;
    std::optional<std::string> extractToken(const std::string& body) const override;
};

} // namespace bundlesync::infrastructure
