/**
 * @file DriveUploader.hpp
 * @brief Publishes artifacts to the remote host through the gdrive command-line utility.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "domain/ExternalTool.hpp"
#include "domain/SyncError.hpp"
#include "infrastructure/Logger.hpp"

namespace bundlesync::infrastructure {

class DriveUploader {
public:
    DriveUploader(domain::ExternalTool& tools, Logger& logger);

    /**
     * @brief Checks that gdrive is installed and has an authenticated account.
     * @return A MissingTool or Precondition error, or nullopt when uploads can proceed.
     */
    std::optional<domain::SyncError> checkReady();

    /**
     * @brief Uploads @p file below @p parentFolderId.
     * @return The shareable link of the uploaded file.
     */
    domain::Result<std::string> upload(const std::filesystem::path& file, const std::string& parentFolderId);

    /** @brief Pulls the file identifier out of gdrive's "Id: <id>" output line. */
    static std::optional<std::string> ParseUploadedId(const std::string& output);

private:
    domain::ExternalTool& m_tools;
    Logger& m_logger;
};

} // namespace bundlesync::infrastructure
