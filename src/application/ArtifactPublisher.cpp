#include "application/ArtifactPublisher.hpp"

#include "domain/LinkExtractor.hpp"
#include "infrastructure/PointerFileWriter.hpp"
#include "infrastructure/SyncLedgerStore.hpp"

namespace bundlesync::application {

namespace {
constexpr const char* kComponent = "Publisher";
}

ArtifactPublisher::ArtifactPublisher(infrastructure::DriveUploader& uploader, infrastructure::Logger& logger)
    : m_uploader(uploader), m_logger(logger) {}

std::optional<domain::SyncError> ArtifactPublisher::checkReady() {
    return m_uploader.checkReady();
}

domain::Result<std::string> ArtifactPublisher::publish(const domain::PackageRecord& record,
                                                       const std::filesystem::path& artifact,
                                                       domain::LedgerDocument& ledger) {
    auto uploaded = m_uploader.upload(artifact, ledger.uploadParent());
    if (!uploaded) {
        return uploaded;
    }

    const std::string& link = uploaded.value();
    const std::string fileId = domain::LinkExtractor::ExtractIdentifier(link).value_or("");
    infrastructure::SyncLedgerStore::UpsertEntry(ledger, record.name, fileId, link);

    if (ledger.autoUpdateInstructions) {
        std::string error;
        if (!infrastructure::PointerFileWriter::Rewrite(record.pointerFilePath, link, record.name, error)) {
            return domain::Result<std::string>::Fail(domain::ErrorKind::WriteFailed,
                                                     "Uploaded but could not update pointer file: " + error);
        }
        m_logger.info(kComponent, "Updated " + record.pointerFilePath.filename().string() + " for " + record.name);
    }
    return uploaded;
}

} // namespace bundlesync::application
