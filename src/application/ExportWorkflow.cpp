#include "application/ExportWorkflow.hpp"

#include <chrono>
#include <cstdint>
#include <sstream>
#include <system_error>

#include "application/ArtifactPublisher.hpp"
#include "application/ExitCodes.hpp"
#include "application/PackageSelection.hpp"
#include "application/RunReporter.hpp"
#include "infrastructure/DriveUploader.hpp"
#include "infrastructure/EditorExporter.hpp"
#include "infrastructure/PointerFileLocator.hpp"
#include "infrastructure/SyncLedgerStore.hpp"
#include "infrastructure/Timestamps.hpp"

namespace bundlesync::application {

namespace fs = std::filesystem;

namespace {
constexpr const char* kComponent = "Export";

std::string FormatMB(std::uintmax_t bytes) {
    std::ostringstream ss;
    ss.setf(std::ios::fixed);
    ss.precision(2);
    ss << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
    return ss.str();
}

bool IsUnder(const fs::path& path, const fs::path& dir) {
    const fs::path relative = path.lexically_relative(dir);
    return !relative.empty() && *relative.begin() != "..";
}
}

ExportWorkflow::ExportWorkflow(WorkflowContext& context, std::vector<fs::path> installLocations)
    : m_ctx(context), m_installLocations(std::move(installLocations)) {}

std::uintmax_t ExportWorkflow::DirectorySize(const fs::path& dir) {
    std::uintmax_t total = 0;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        std::error_code sizeEc;
        if (it->is_regular_file(sizeEc)) {
            auto size = it->file_size(sizeEc);
            if (!sizeEc) total += size;
        }
    }
    return total;
}

int ExportWorkflow::run(const ExportOptions& options) {
    auto& log = m_ctx.logger;
    const auto& layout = m_ctx.layout;

    std::error_code ec;
    if (!fs::is_directory(layout.packagesDir(), ec)) {
        log.error(kComponent, "Packages folder not found: " + layout.packagesDir().string());
        return kExitSetupFailure;
    }

    // Stems are assigned over every search root so exports line up with what sync looks for.
    infrastructure::PointerFileLocator locator(log);
    const auto discovered = locator.discover(layout.searchRoots());
    std::vector<domain::PackageRecord> candidates;
    for (const auto& record : discovered) {
        if (IsUnder(record.pointerFilePath, layout.packagesDir())) candidates.push_back(record);
    }
    auto records = SelectPackages(candidates, options.packages);
    log.info(kComponent, "Found " + std::to_string(records.size()) + " packages to export");

    if (options.dryRun) {
        for (const auto& record : records) {
            log.info(kComponent, "  - " + record.name + " (" + FormatMB(DirectorySize(record.packageRoot)) + ")");
        }
        return kExitSuccess;
    }

    auto editor = infrastructure::EditorExporter::LocateEditor(options.editorPath, m_installLocations);
    if (!editor) {
        domain::SyncError missing{domain::ErrorKind::MissingTool,
                                  "Unity editor not found. Pass --unity-path or set UNITY_PATH"};
        log.error(kComponent, missing.describe());
        return kExitSetupFailure;
    }
    log.info(kComponent, "Using editor: " + editor->string());

    if (!layout.EnsureWorkFolders()) {
        log.error(kComponent, "Could not create " + layout.exportsDir().string());
        return kExitSetupFailure;
    }

    const auto stems = ArtifactStemsFor(discovered, records, log, kComponent);
    infrastructure::EditorExporter exporter(layout, m_ctx.tools, log, *editor);
    const auto start = std::chrono::steady_clock::now();
    std::vector<domain::PackageOutcome> outcomes;

    for (std::size_t i = 0; i < records.size(); ++i) {
        const auto& record = records[i];
        log.info(kComponent, "[" + std::to_string(i + 1) + "/" + std::to_string(records.size()) + "] " + record.name);

        domain::PackageOutcome outcome;
        outcome.packageName = record.name;

        auto exported = exporter.exportPackage(record.packageRoot, stems.at(record.name));
        if (exported) {
            std::error_code sizeEc;
            auto size = fs::file_size(exported.value(), sizeEc);
            outcome.state = domain::PackageState::Exported;
            outcome.artifact = domain::FetchedArtifact{record.name, exported.value(), sizeEc ? 0 : size,
                                                       domain::SourceMethod::ExternalTool};
        } else {
            outcome.state = domain::PackageState::ExportFailed;
            outcome.error = exported.error();
            log.error(kComponent, record.name + ": " + outcome.error->describe());
        }
        outcomes.push_back(outcome);
    }

    auto ledger = infrastructure::SyncLedgerStore::Load(layout.ledgerPath(), log);

    if (options.skipUpload) {
        log.info(kComponent, "Skipping upload");
    } else {
        infrastructure::DriveUploader uploader(m_ctx.tools, log);
        ArtifactPublisher publisher(uploader, log);
        if (auto notReady = publisher.checkReady()) {
            log.warn(kComponent, "Upload skipped: " + notReady->describe());
        } else {
            for (std::size_t i = 0; i < outcomes.size(); ++i) {
                auto& outcome = outcomes[i];
                if (outcome.state != domain::PackageState::Exported) continue;

                auto published = publisher.publish(records[i], outcome.artifact->localPath, ledger);
                if (published) {
                    outcome.state = domain::PackageState::Uploaded;
                } else {
                    outcome.state = domain::PackageState::UploadFailed;
                    outcome.error = published.error();
                    log.error(kComponent, outcome.packageName + ": " + outcome.error->describe());
                }
            }
        }
    }

    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    ledger.lastExportAt = infrastructure::Timestamps::NowIso8601();
    ledger.packagesToExport.clear();
    for (const auto& record : records) {
        ledger.packagesToExport.push_back(record.name);
    }
    if (!infrastructure::SyncLedgerStore::Save(layout.ledgerPath(), ledger, log)) {
        log.warn(kComponent, "Export state was not persisted");
    }

    m_lastReport = RunReporter::Summarize("export", layout.root().string(), outcomes, elapsed);
    m_lastReportPath = RunReporter::Write(*m_lastReport, layout.exportsDir(), "manifest", log);

    const auto& report = *m_lastReport;
    log.info(kComponent, "Exported " + std::to_string(report.successCount) + "/" + std::to_string(report.totalCount) +
                             " packages, " + FormatMB(report.totalSizeBytes));

    return report.failureCount == 0 ? kExitSuccess : kExitPackageFailure;
}

} // namespace bundlesync::application
