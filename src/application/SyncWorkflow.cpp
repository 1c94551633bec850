#include "application/SyncWorkflow.hpp"

#include <chrono>
#include <system_error>

#include "application/ArtifactPublisher.hpp"
#include "application/CatalogWorkflow.hpp"
#include "application/ExitCodes.hpp"
#include "application/PackageSelection.hpp"
#include "application/RunReporter.hpp"
#include "domain/PackageConventions.hpp"
#include "infrastructure/DriveUploader.hpp"
#include "infrastructure/PlaceholderPackager.hpp"
#include "infrastructure/PointerFileLocator.hpp"
#include "infrastructure/SyncLedgerStore.hpp"
#include "infrastructure/Timestamps.hpp"

namespace bundlesync::application {

namespace fs = std::filesystem;

namespace {
constexpr const char* kComponent = "Sync";
}

SyncWorkflow::SyncWorkflow(WorkflowContext& context) : m_ctx(context) {}

int SyncWorkflow::run(const SyncOptions& options) {
    auto& log = m_ctx.logger;
    const auto& layout = m_ctx.layout;

    if (!layout.HasProjectStructure()) {
        log.error(kComponent, "No package folders (Assets/Packages, Assets/Audio) under " + layout.root().string());
        return kExitSetupFailure;
    }

    CatalogWorkflow catalog(m_ctx);
    if (options.listOnly) {
        return catalog.regenerate() ? kExitSuccess : kExitSetupFailure;
    }

    infrastructure::DriveUploader uploader(m_ctx.tools, log);
    ArtifactPublisher publisher(uploader, log);

    if (!options.dryRun) {
        if (auto notReady = publisher.checkReady()) {
            log.error(kComponent, notReady->describe());
            log.info(kComponent, "To set up gdrive:");
            log.info(kComponent, "1. Run: gdrive account add");
            log.info(kComponent, "2. Follow the authentication process");
            log.info(kComponent, "3. Run this command again");
            return kExitSetupFailure;
        }
    }

    if (!layout.EnsureWorkFolders()) {
        log.error(kComponent, "Could not create " + layout.exportsDir().string());
        return kExitSetupFailure;
    }

    infrastructure::PointerFileLocator locator(log);
    const auto discovered = locator.discover(layout.searchRoots());
    auto records = SelectPackages(discovered, options.packages);
    log.info(kComponent, "Found " + std::to_string(records.size()) + " packages to sync");
    const auto stems = ArtifactStemsFor(discovered, records, log, kComponent);

    auto ledger = infrastructure::SyncLedgerStore::Load(layout.ledgerPath(), log);
    infrastructure::PlaceholderPackager placeholders(m_ctx.tools, log);

    const auto start = std::chrono::steady_clock::now();
    std::vector<domain::PackageOutcome> outcomes;

    for (const auto& record : records) {
        log.info(kComponent, "Syncing: " + record.name);

        domain::PackageOutcome outcome;
        outcome.packageName = record.name;

        if (record.hasLink()) {
            log.info(kComponent, "Package already has a remote link, skipping");
            outcome.state = domain::PackageState::AlreadySynced;
            outcomes.push_back(outcome);
            continue;
        }

        const std::string& stem = stems.at(record.name);
        fs::path exportFile = layout.exportsDir() / (stem + domain::kArtifactExtension);
        std::error_code ec;
        const bool hasExport = fs::is_regular_file(exportFile, ec);

        if (options.dryRun) {
            log.info(kComponent, "[dry-run] Would upload " + record.name +
                                     (hasExport ? " from " + exportFile.filename().string() : " as a placeholder package"));
            outcome.state = domain::PackageState::Skipped;
            outcomes.push_back(outcome);
            continue;
        }

        if (!hasExport) {
            if (!options.usePlaceholders) {
                outcome.state = domain::PackageState::ExportFailed;
                outcome.error = domain::SyncError{domain::ErrorKind::ExportFailed,
                                                  "No export found and placeholders are disabled"};
                log.warn(kComponent, record.name + ": " + outcome.error->describe());
                outcomes.push_back(outcome);
                continue;
            }
            auto placeholder = placeholders.create(layout.exportsDir(), record.name, stem);
            if (!placeholder) {
                outcome.state = domain::PackageState::ExportFailed;
                outcome.error = placeholder.error();
                log.error(kComponent, record.name + ": " + outcome.error->describe());
                outcomes.push_back(outcome);
                continue;
            }
            exportFile = placeholder.value();
        }

        auto published = publisher.publish(record, exportFile, ledger);
        if (published) {
            outcome.state = domain::PackageState::Uploaded;
        } else {
            outcome.state = domain::PackageState::UploadFailed;
            outcome.error = published.error();
            log.error(kComponent, record.name + ": " + outcome.error->describe());
        }
        outcomes.push_back(outcome);
    }

    if (options.dryRun) {
        log.info(kComponent, "Dry run complete, nothing was uploaded");
        return kExitSuccess;
    }

    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    ledger.lastSyncAt = infrastructure::Timestamps::NowIso8601();
    if (!infrastructure::SyncLedgerStore::Save(layout.ledgerPath(), ledger, log)) {
        log.warn(kComponent, "Sync mappings were not persisted");
    }

    m_lastReport = RunReporter::Summarize("sync", layout.root().string(), outcomes, elapsed);
    m_lastReportPath = RunReporter::Write(*m_lastReport, layout.exportsDir(), "sync_report", log);

    const auto& report = *m_lastReport;
    log.info(kComponent, "Sync complete: " + std::to_string(report.successCount) + "/" +
                             std::to_string(report.totalCount) + " successful");

    if (report.successCount > 0 && !catalog.regenerate()) {
        log.warn(kComponent, "Package list was not regenerated");
    }

    return report.failureCount == 0 ? kExitSuccess : kExitPackageFailure;
}

} // namespace bundlesync::application
