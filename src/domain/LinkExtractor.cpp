#include "domain/LinkExtractor.hpp"

#include <array>
#include <regex>

namespace bundlesync::domain {

namespace {

const std::array<std::regex, 3>& IdentifierPatterns() {
    static const std::array<std::regex, 3> patterns = {
        std::regex(R"(/file/d/([a-zA-Z0-9_-]+))"),
        std::regex(R"(id=([a-zA-Z0-9_-]+))"),
        std::regex(R"(/open\?id=([a-zA-Z0-9_-]+))"),
    };
    return patterns;
}

const std::regex& RemoteLinkPattern() {
    static const std::regex pattern(R"(https://drive\.google\.com/[^\s]+)");
    return pattern;
}

} // namespace

std::optional<std::string> LinkExtractor::ExtractIdentifier(const std::string& url) {
    for (const auto& pattern : IdentifierPatterns()) {
        std::smatch match;
        if (std::regex_search(url, match, pattern)) {
            return match[1].str();
        }
    }
    return std::nullopt;
}

std::string LinkExtractor::BuildDirectUrl(const std::string& identifier) {
    return "https://drive.google.com/uc?export=download&id=" + identifier;
}

std::string LinkExtractor::BuildShareLink(const std::string& identifier) {
    return "https://drive.google.com/file/d/" + identifier + "/view?usp=sharing";
}

std::optional<std::string> LinkExtractor::FindFirstRemoteLink(const std::string& text) {
    std::smatch match;
    if (std::regex_search(text, match, RemoteLinkPattern())) {
        return match[0].str();
    }
    return std::nullopt;
}

} // namespace bundlesync::domain
