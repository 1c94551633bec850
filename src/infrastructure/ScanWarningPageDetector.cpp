#include "infrastructure/ScanWarningPageDetector.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace bundlesync::infrastructure {

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c){ return std::tolower(c); });
    return text;
}

} // namespace

bool ScanWarningPageDetector::isInterstitial(const std::string& body, const std::string& contentType) const {
    if (!contentType.empty() && ToLower(contentType).find("text/html") == std::string::npos) {
        return false;
    }
    if (body.find("confirm=") != std::string::npos) return true;
    if (body.find("name=\"confirm\"") != std::string::npos) return true;
    if (ToLower(body).find("virus scan warning") != std::string::npos) return true;
    return false;
}

std::optional<std::string> ScanWarningPageDetector::extractToken(const std::string& body) const {
    static const std::regex queryToken(R"(confirm=([a-zA-Z0-9_-]+))");
    // Newer pages carry the token in a hidden form field instead of a link.
    static const std::regex formToken(R"re(name="confirm"\s+value="([a-zA-Z0-9_-]+)")re");

    std::smatch match;
    if (std::regex_search(body, match, queryToken)) {
        return match[1].str();
    }
    if (std::regex_search(body, match, formToken)) {
        return match[1].str();
    }
    return std::nullopt;
}

} // namespace bundlesync::infrastructure
