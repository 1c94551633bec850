/**
 * @file RemoteFetcher.cpp
 * @brief Implementation of RemoteFetcher.
 */

#include "infrastructure/RemoteFetcher.hpp"

#include <cstdio>
#include <exception>
#include <fstream>
#include <iterator>
#include <optional>
#include <system_error>

#include "domain/LinkExtractor.hpp"
#include "domain/PackageConventions.hpp"
#include "infrastructure/AtomicFileWriter.hpp"

namespace bundlesync::infrastructure {

namespace fs = std::filesystem;
using domain::ErrorKind;
using domain::FetchedArtifact;
using FetchResult = domain::Result<FetchedArtifact>;

namespace {

constexpr const char* kComponent = "RemoteFetcher";
constexpr const char* kDownloadTool = "curl";
constexpr int kDownloadToolTimeoutSeconds = 3600;
// curl's exit status when --max-filesize is exceeded.
constexpr int kCurlFileTooLarge = 63;
// Files downloaded by curl below this size are checked for the interstitial page.
constexpr std::uintmax_t kSniffLimitBytes = 1024 * 1024;

std::string FormatMB(std::uintmax_t bytes) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f MB", static_cast<double>(bytes) / (1024.0 * 1024.0));
    return buf;
}

std::optional<domain::SyncError> CheckResponse(const domain::HttpResponse& res, const std::string& link) {
    if (!res.transportOk) {
        return domain::SyncError{ErrorKind::Transport, "Download failed: " + res.transportError};
    }
    if (res.status == 404) {
        return domain::SyncError{ErrorKind::NotFound, "File not found (404): " + link};
    }
    if (res.status < 200 || res.status >= 300) {
        return domain::SyncError{ErrorKind::Transport, "HTTP Error " + std::to_string(res.status)};
    }
    return std::nullopt;
}

void RemoveQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

RemoteFetcher::RemoteFetcher(const fs::path& cacheDir,
                             domain::HttpTransport& http,
                             domain::ExternalTool& tools,
                             const domain::ConfirmationPageDetector& detector,
                             Logger& logger)
    : m_cacheDir(cacheDir), m_http(http), m_tools(tools), m_detector(detector), m_logger(logger) {}

std::optional<FetchedArtifact> RemoteFetcher::findCached(const fs::path& target, const std::string& packageName) const {
    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) return std::nullopt;

    auto size = fs::file_size(target, ec);
    if (ec) return std::nullopt;

    m_logger.info(kComponent, "File already exists: " + target.filename().string());
    return FetchedArtifact{packageName, target, size, domain::SourceMethod::Cache};
}

FetchResult RemoteFetcher::fetch(const std::string& link,
                                 const std::string& destinationName,
                                 std::uintmax_t maxSizeBytes,
                                 const std::string& packageName) {
    const fs::path target = m_cacheDir / destinationName;
    const std::string name = packageName.empty() ? fs::path(destinationName).stem().string() : packageName;

    if (auto cached = findCached(target, name)) {
        return FetchResult::Ok(*cached);
    }

    auto identifier = domain::LinkExtractor::ExtractIdentifier(link);
    if (!identifier) {
        return FetchResult::Fail(ErrorKind::LinkExtraction, "Could not extract file ID from URL: " + link);
    }

    const std::string directUrl = domain::LinkExtractor::BuildDirectUrl(*identifier);
    m_logger.info(kComponent, "Downloading " + destinationName + " (file ID " + *identifier + ")");

    try {
        const domain::HttpTransport::Headers headers = {{"User-Agent", domain::kClientIdentity}};

        auto first = m_http.get(directUrl, headers, maxSizeBytes);
        if (auto failure = CheckResponse(first, link)) {
            return FetchResult::Fail(*failure);
        }

        std::string payload = std::move(first.body);
        if (!first.truncated && m_detector.isInterstitial(payload, first.contentType)) {
            auto token = m_detector.extractToken(payload);
            if (!token) {
                return FetchResult::Fail(ErrorKind::Transport,
                                         "Confirmation page received but no token could be found");
            }
            m_logger.debug(kComponent, "Large-file confirmation required, retrying with token");

            auto confirmed = m_http.get(directUrl + "&confirm=" + *token, headers, maxSizeBytes);
            if (auto failure = CheckResponse(confirmed, link)) {
                return FetchResult::Fail(*failure);
            }
            payload = std::move(confirmed.body);
        }

        if (payload.size() > maxSizeBytes) {
            return FetchResult::Fail(ErrorKind::SizeLimitExceeded,
                                     "File too large: exceeds limit of " + FormatMB(maxSizeBytes));
        }

        std::string writeError;
        if (!AtomicFileWriter::Write(target, payload, writeError)) {
            return FetchResult::Fail(ErrorKind::WriteFailed, writeError);
        }

        m_logger.info(kComponent, "Downloaded: " + destinationName + " (" + FormatMB(payload.size()) + ")");
        return FetchResult::Ok(FetchedArtifact{name, target, payload.size(), domain::SourceMethod::Network});
    } catch (const std::exception& e) {
        return FetchResult::Fail(ErrorKind::Transport, std::string("Download failed: ") + e.what());
    }
}

FetchResult RemoteFetcher::fetchViaExternalTool(const std::string& link,
                                                const std::string& destinationName,
                                                std::uintmax_t maxSizeBytes,
                                                const std::string& packageName) {
    const fs::path target = m_cacheDir / destinationName;
    const std::string name = packageName.empty() ? fs::path(destinationName).stem().string() : packageName;

    if (auto cached = findCached(target, name)) {
        return FetchResult::Ok(*cached);
    }

    auto identifier = domain::LinkExtractor::ExtractIdentifier(link);
    if (!identifier) {
        return FetchResult::Fail(ErrorKind::LinkExtraction, "Could not extract file ID from URL: " + link);
    }

    if (!m_tools.isAvailable(kDownloadTool)) {
        m_logger.warn(kComponent, "curl not found, falling back to built-in HTTP client");
        return fetch(link, destinationName, maxSizeBytes, name);
    }
    return downloadWithTool(*identifier, target, maxSizeBytes, name);
}

FetchResult RemoteFetcher::fetchPreferringExternalTool(const std::string& link,
                                                       const std::string& destinationName,
                                                       std::uintmax_t maxSizeBytes,
                                                       const std::string& packageName) {
    const fs::path target = m_cacheDir / destinationName;
    const std::string name = packageName.empty() ? fs::path(destinationName).stem().string() : packageName;

    if (auto cached = findCached(target, name)) {
        return FetchResult::Ok(*cached);
    }

    auto identifier = domain::LinkExtractor::ExtractIdentifier(link);
    if (!identifier) {
        return FetchResult::Fail(ErrorKind::LinkExtraction, "Could not extract file ID from URL: " + link);
    }

    if (m_tools.isAvailable(kDownloadTool)) {
        auto viaTool = downloadWithTool(*identifier, target, maxSizeBytes, name);
        if (viaTool.ok()) {
            return viaTool;
        }
        // Only a failure that left no usable file is retried; a size-cap or timeout verdict is final.
        const ErrorKind kind = viaTool.error().kind;
        if (kind != ErrorKind::MissingTool && kind != ErrorKind::Transport) {
            return viaTool;
        }
        m_logger.warn(kComponent, "curl download failed for " + name + " (" + viaTool.error().describe() +
                                  "), retrying with built-in HTTP client");
    } else {
        m_logger.warn(kComponent, "curl not found, falling back to built-in HTTP client");
    }
    return fetch(link, destinationName, maxSizeBytes, name);
}

FetchResult RemoteFetcher::downloadWithTool(const std::string& identifier,
                                            const fs::path& target,
                                            std::uintmax_t maxSizeBytes,
                                            const std::string& packageName) {
    fs::path partial = target;
    partial += ".part";
    RemoveQuietly(partial);

    std::error_code ec;
    fs::create_directories(m_cacheDir, ec);

    domain::ToolInvocation invocation;
    invocation.program = kDownloadTool;
    invocation.arguments = {
        "-L", "--fail", "-sS",
        "--max-filesize", std::to_string(maxSizeBytes),
        "-H", std::string("User-Agent: ") + domain::kClientIdentity,
        "-o", partial.string(),
        domain::LinkExtractor::BuildDirectUrl(identifier)
    };
    invocation.timeoutSeconds = kDownloadToolTimeoutSeconds;

    m_logger.info(kComponent, "Downloading with curl: " + target.filename().string());
    auto result = m_tools.run(invocation);

    if (result.timedOut) {
        RemoveQuietly(partial);
        return FetchResult::Fail(ErrorKind::Timeout, "curl timed out after " +
                                 std::to_string(kDownloadToolTimeoutSeconds) + "s");
    }
    if (!result.launched) {
        RemoveQuietly(partial);
        return FetchResult::Fail(ErrorKind::MissingTool, "curl could not be started");
    }
    if (result.exitCode != 0) {
        RemoveQuietly(partial);
        if (result.exitCode == kCurlFileTooLarge) {
            return FetchResult::Fail(ErrorKind::SizeLimitExceeded,
                                     "File too large: exceeds limit of " + FormatMB(maxSizeBytes));
        }
        return FetchResult::Fail(ErrorKind::Transport, "curl exited with code " +
                                 std::to_string(result.exitCode) + ": " + result.output);
    }

    if (!fs::is_regular_file(partial, ec)) {
        return FetchResult::Fail(ErrorKind::Transport, "curl reported success but produced no file");
    }
    auto size = fs::file_size(partial, ec);
    if (ec || size == 0) {
        RemoveQuietly(partial);
        return FetchResult::Fail(ErrorKind::Transport, "curl produced an empty file");
    }
    if (size > maxSizeBytes) {
        RemoveQuietly(partial);
        return FetchResult::Fail(ErrorKind::SizeLimitExceeded,
                                 "File too large: " + FormatMB(size) + " exceeds limit of " + FormatMB(maxSizeBytes));
    }
    if (size < kSniffLimitBytes) {
        std::ifstream in(partial, std::ios::binary);
        std::string head((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (m_detector.isInterstitial(head, "")) {
            RemoveQuietly(partial);
            return FetchResult::Fail(ErrorKind::Transport, "curl received the confirmation page instead of the file");
        }
    }

    fs::rename(partial, target, ec);
    if (ec) {
        RemoveQuietly(partial);
        return FetchResult::Fail(ErrorKind::WriteFailed, "rename to " + target.string() + " failed: " + ec.message());
    }

    m_logger.info(kComponent, "Downloaded: " + target.filename().string() + " (" + FormatMB(size) + ")");
    return FetchResult::Ok(FetchedArtifact{packageName, target, size, domain::SourceMethod::ExternalTool});
}

} // namespace bundlesync::infrastructure
