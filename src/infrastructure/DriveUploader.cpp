#include "infrastructure/DriveUploader.hpp"
#include <sstream>
#include "domain/LinkExtractor.hpp"

namespace bundlesync::infrastructure {

namespace {
constexpr const char* kComponent = "DriveUploader";
constexpr const char* kUploadTool = "gdrive";
constexpr int kAccountCheckTimeoutSeconds = 60;
constexpr int kUploadTimeoutSeconds = 1800;
}

DriveUploader::DriveUploader(domain::ExternalTool& tools, Logger& logger)
    : m_tools(tools), m_logger(logger) {}

std::optional<domain::SyncError> DriveUploader::checkReady() {
    if (!m_tools.isAvailable(kUploadTool)) {
        return domain::SyncError{domain::ErrorKind::MissingTool,
                                 "gdrive CLI not found. Install it and run: gdrive account add"};
    }

    auto result = m_tools.run({kUploadTool, {"account", "list"}, kAccountCheckTimeoutSeconds});
    if (!result.succeeded() || result.output.find("No accounts") != std::string::npos) {
        return domain::SyncError{domain::ErrorKind::Precondition,
                                 "gdrive not authenticated. Run: gdrive account add"};
    }
    return std::nullopt;
}

std::optional<std::string> DriveUploader::ParseUploadedId(const std::string& output) {
    auto pos = output.find("Id:");
    if (pos == std::string::npos) return std::nullopt;

    std::istringstream rest(output.substr(pos + 3));
    std::string id;
    rest >> id;
    if (id.empty()) return std::nullopt;
    return id;
}

domain::Result<std::string> DriveUploader::upload(const std::filesystem::path& file, const std::string& parentFolderId) {
    m_logger.info(kComponent, "Uploading " + file.filename().string() + " to Google Drive...");

    auto result = m_tools.run({kUploadTool, {"files", "upload", "--parent", parentFolderId, file.string()},
                               kUploadTimeoutSeconds});
    if (result.timedOut) {
        return domain::Result<std::string>::Fail(domain::ErrorKind::Timeout, "Upload timed out");
    }
    if (!result.succeeded()) {
        return domain::Result<std::string>::Fail(domain::ErrorKind::UploadFailed, "Upload failed: " + result.output);
    }

    auto id = ParseUploadedId(result.output);
    if (!id) {
        return domain::Result<std::string>::Fail(domain::ErrorKind::UploadFailed,
                                                 "Could not extract file ID from gdrive output");
    }

    std::string link = domain::LinkExtractor::BuildShareLink(*id);
    m_logger.info(kComponent, "Uploaded successfully: " + link);
    return domain::Result<std::string>::Ok(link);
}

} // namespace bundlesync::infrastructure
