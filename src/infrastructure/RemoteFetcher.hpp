/**
 * @file RemoteFetcher.hpp
 * @brief Materializes remote artifacts into the local cache directory.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "domain/ConfirmationPageDetector.hpp"
#include "domain/ExternalTool.hpp"
#include "domain/FetchedArtifact.hpp"
#include "domain/HttpTransport.hpp"
#include "domain/SyncError.hpp"
#include "infrastructure/Logger.hpp"

namespace bundlesync::infrastructure {

/**
 * @class RemoteFetcher
 * @brief Downloads one artifact per call, either in-process over HTTP or through curl.
 *
 * Every entry point is idempotent: if the destination already exists in the cache it is
 * returned as-is and nothing is transferred. No file larger than the size cap is ever left
 * at the destination. Failures are returned, never thrown.
 */
class RemoteFetcher {
public:
    RemoteFetcher(const std::filesystem::path& cacheDir,
                  domain::HttpTransport& http,
                  domain::ExternalTool& tools,
                  const domain::ConfirmationPageDetector& detector,
                  Logger& logger);

    /**
     * @brief Primary path: in-process GET with the confirmation-token handshake.
     * @param link Any accepted link shape.
     * @param destinationName File name inside the cache directory.
     * @param maxSizeBytes Payloads larger than this are rejected without writing.
     * @param packageName Recorded on the artifact; defaults to the destination stem.
     */
    domain::Result<domain::FetchedArtifact> fetch(const std::string& link,
                                                  const std::string& destinationName,
                                                  std::uintmax_t maxSizeBytes,
                                                  const std::string& packageName = "");

    /**
     * @brief Alternate path through the external download utility.
     * Falls back to fetch() when the utility is not installed.
     */
    domain::Result<domain::FetchedArtifact> fetchViaExternalTool(const std::string& link,
                                                                 const std::string& destinationName,
                                                                 std::uintmax_t maxSizeBytes,
                                                                 const std::string& packageName = "");

    /**
     * @brief Tries the external utility first and the in-process path when it fails.
     * A size-limit or timeout failure from the utility is returned as is.
     */
    domain::Result<domain::FetchedArtifact> fetchPreferringExternalTool(const std::string& link,
                                                                        const std::string& destinationName,
                                                                        std::uintmax_t maxSizeBytes,
                                                                        const std::string& packageName = "");

    const std::filesystem::path& cacheDir() const { return m_cacheDir; }

private:
    std::optional<domain::FetchedArtifact> findCached(const std::filesystem::path& target,
                                                      const std::string& packageName) const;

    domain::Result<domain::FetchedArtifact> downloadWithTool(const std::string& identifier,
                                                             const std::filesystem::path& target,
                                                             std::uintmax_t maxSizeBytes,
                                                             const std::string& packageName);

    std::filesystem::path m_cacheDir;
    domain::HttpTransport& m_http;
    domain::ExternalTool& m_tools;
    const domain::ConfirmationPageDetector& m_detector;
    Logger& m_logger;
};

} // namespace bundlesync::infrastructure
