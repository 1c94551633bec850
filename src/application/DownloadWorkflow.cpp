#include "application/DownloadWorkflow.hpp"

#include <chrono>
#include <set>
#include <sstream>
#include <system_error>

#include "application/ExitCodes.hpp"
#include "application/PackageSelection.hpp"
#include "application/RunReporter.hpp"
#include "domain/LinkExtractor.hpp"
#include "infrastructure/ArtifactVerifier.hpp"
#include "infrastructure/PointerFileLocator.hpp"
#include "infrastructure/RemoteFetcher.hpp"
#include "infrastructure/SyncLedgerStore.hpp"
#include "infrastructure/Timestamps.hpp"

namespace bundlesync::application {

namespace fs = std::filesystem;

namespace {
constexpr const char* kComponent = "Download";

std::string FormatMB(double megabytes) {
    std::ostringstream ss;
    ss.setf(std::ios::fixed);
    ss.precision(2);
    ss << megabytes << " MB";
    return ss.str();
}
}

DownloadWorkflow::DownloadWorkflow(WorkflowContext& context) : m_ctx(context) {}

int DownloadWorkflow::verifyExisting() {
    infrastructure::ArtifactVerifier verifier(m_ctx.logger);
    auto report = verifier.verify(m_ctx.layout.downloadsDir());

    m_ctx.logger.info(kComponent, "Found " + std::to_string(report.valid.size()) + " valid packages:");
    for (const auto& file : report.valid) {
        std::error_code ec;
        auto size = fs::file_size(file, ec);
        m_ctx.logger.info(kComponent, "  - " + file.filename().string() + " (" +
                                          FormatMB(ec ? 0.0 : static_cast<double>(size) / (1024.0 * 1024.0)) + ")");
    }
    return kExitSuccess;
}

int DownloadWorkflow::run(const DownloadOptions& options) {
    auto& log = m_ctx.logger;
    const auto& layout = m_ctx.layout;

    if (!layout.HasProjectStructure()) {
        log.error(kComponent, "No package folders (Assets/Packages, Assets/Audio) under " + layout.root().string());
        return kExitSetupFailure;
    }
    if (!layout.EnsureWorkFolders()) {
        log.error(kComponent, "Could not create " + layout.downloadsDir().string());
        return kExitSetupFailure;
    }

    if (options.verifyOnly) {
        log.info(kComponent, "Verifying existing downloads...");
        return verifyExisting();
    }

    infrastructure::PointerFileLocator locator(log);
    const auto discovered = locator.discover(layout.searchRoots());
    std::vector<domain::PackageRecord> linked;
    for (const auto& record : SelectPackages(discovered, options.packages)) {
        if (record.hasLink()) linked.push_back(record);
    }

    if (linked.empty()) {
        log.warn(kComponent, "No packages with remote links found");
        return kExitSuccess;
    }
    log.info(kComponent, "Found " + std::to_string(linked.size()) + " packages to download");

    const auto stems = ArtifactStemsFor(discovered, linked, log, kComponent);
    auto ledger = infrastructure::SyncLedgerStore::Load(layout.ledgerPath(), log);
    infrastructure::RemoteFetcher fetcher(layout.downloadsDir(), m_ctx.http, m_ctx.tools, m_ctx.detector, log);

    const auto start = std::chrono::steady_clock::now();
    std::vector<domain::PackageOutcome> outcomes;

    for (std::size_t i = 0; i < linked.size(); ++i) {
        const auto& record = linked[i];
        log.info(kComponent, "[" + std::to_string(i + 1) + "/" + std::to_string(linked.size()) + "] Processing: " + record.name);

        domain::PackageOutcome outcome;
        outcome.packageName = record.name;

        auto result = fetcher.fetchPreferringExternalTool(*record.remoteLink,
                                                          stems.at(record.name) + domain::kArtifactExtension,
                                                          options.maxSizeBytes, record.name);
        if (result) {
            outcome.state = domain::PackageState::HasLink;
            outcome.artifact = result.value();
            infrastructure::SyncLedgerStore::UpsertEntry(
                ledger, record.name,
                domain::LinkExtractor::ExtractIdentifier(*record.remoteLink).value_or(""),
                *record.remoteLink);
        } else {
            outcome.state = domain::PackageState::FetchFailed;
            outcome.error = result.error();
            log.error(kComponent, record.name + ": " + result.error().describe());
        }
        outcomes.push_back(outcome);
    }

    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    // Verification decides the final state of every fetched artifact.
    infrastructure::ArtifactVerifier verifier(log);
    auto verification = verifier.verify(layout.downloadsDir());
    std::set<std::string> corrupted;
    for (const auto& file : verification.corrupted) {
        corrupted.insert(file.filename().string());
    }
    for (auto& outcome : outcomes) {
        if (!outcome.artifact) continue;
        if (corrupted.count(outcome.artifact->localPath.filename().string())) {
            outcome.state = domain::PackageState::Corrupted;
            outcome.error = domain::SyncError{domain::ErrorKind::VerificationWarning,
                                              "artifact is " + std::to_string(outcome.artifact->sizeBytes) +
                                                  " bytes, at or below the minimum size"};
            log.warn(kComponent, outcome.packageName + ": " + outcome.error->describe());
        } else {
            outcome.state = domain::PackageState::Verified;
        }
    }

    ledger.lastDownloadAt = infrastructure::Timestamps::NowIso8601();
    if (!infrastructure::SyncLedgerStore::Save(layout.ledgerPath(), ledger, log)) {
        log.warn(kComponent, "Download mappings were not persisted");
    }

    m_lastReport = RunReporter::Summarize("download", layout.root().string(), outcomes, elapsed);
    m_lastReportPath = RunReporter::Write(*m_lastReport, layout.downloadsDir(), "download_report", log);

    const auto& report = *m_lastReport;
    log.info(kComponent, "Download complete: " + std::to_string(report.successCount) + "/" +
                             std::to_string(report.totalCount) + " successful, " + FormatMB(report.totalSizeMB()));
    if (auto mbps = RunReporter::ThroughputMbps(report.totalSizeBytes, elapsed)) {
        std::ostringstream speed;
        speed.setf(std::ios::fixed);
        speed.precision(2);
        speed << *mbps;
        log.info(kComponent, "Average speed: " + speed.str() + " Mbps");
    }
    if (report.failureCount > 0) {
        log.warn(kComponent, std::to_string(report.failureCount) + " packages failed");
    }

    return report.failureCount == 0 ? kExitSuccess : kExitPackageFailure;
}

} // namespace bundlesync::application
