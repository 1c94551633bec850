/**
 * @file ArtifactPublisher.hpp
 * @brief Upload step shared by the sync and export workflows.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "domain/LedgerDocument.hpp"
#include "domain/PackageRecord.hpp"
#include "domain/SyncError.hpp"
#include "infrastructure/DriveUploader.hpp"
#include "infrastructure/Logger.hpp"

namespace bundlesync::application {

/**
 * @class ArtifactPublisher
 * @brief Uploads an artifact, points the package's pointer file at the new link and records
 * the mapping in the ledger.
 */
class ArtifactPublisher {
public:
    ArtifactPublisher(infrastructure::DriveUploader& uploader, infrastructure::Logger& logger);

    /** @brief Same as DriveUploader::checkReady(). */
    std::optional<domain::SyncError> checkReady();

    /**
     * @brief Publishes @p artifact for @p record.
     *
     * The ledger entry is written as soon as the upload succeeds, so the link survives even
     * if the pointer file cannot be rewritten afterwards (reported as WriteFailed).
     * @return The share link.
     */
    domain::Result<std::string> publish(const domain::PackageRecord& record,
                                        const std::filesystem::path& artifact,
                                        domain::LedgerDocument& ledger);

private:
    infrastructure::DriveUploader& m_uploader;
    infrastructure::Logger& m_logger;
};

} // namespace bundlesync::application
