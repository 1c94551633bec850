#include "application/RunReporter.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <system_error>

#include "domain/LinkExtractor.hpp"
#include "domain/PackageConventions.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/Timestamps.hpp"

namespace bundlesync::application {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {
constexpr const char* kComponent = "RunReporter";

double RoundTo2(double value) {
    return std::round(value * 100.0) / 100.0;
}
}

domain::RunReport RunReporter::Summarize(const std::string& workflow,
                                         const std::string& projectPath,
                                         const std::vector<domain::PackageOutcome>& outcomes,
                                         double elapsedSeconds) {
    domain::RunReport report;
    report.workflow = workflow;
    report.timestamp = infrastructure::Timestamps::NowIso8601();
    report.platform = infrastructure::Timestamps::PlatformName();
    report.projectPath = projectPath;
    report.elapsedSeconds = elapsedSeconds;
    report.packages = outcomes;
    report.totalCount = outcomes.size();

    for (const auto& outcome : outcomes) {
        if (outcome.succeeded()) {
            report.successCount++;
            if (outcome.artifact) {
                report.totalSizeBytes += outcome.artifact->sizeBytes;
                report.artifacts.push_back(outcome.artifact->localPath.string());
            }
        } else {
            report.failureCount++;
        }
    }
    return report;
}

json RunReporter::ToJson(const domain::RunReport& report) {
    json j;
    j["timestamp"] = report.timestamp;
    j["platform"] = report.platform;
    j["project_path"] = report.projectPath;
    j["workflow"] = report.workflow;
    j["elapsed_seconds"] = RoundTo2(report.elapsedSeconds);
    j["statistics"] = {
        {"total", report.totalCount},
        {"success", report.successCount},
        {"failed", report.failureCount},
        {"total_size_mb", RoundTo2(report.totalSizeMB())}
    };
    j["files"] = report.artifacts;

    json packages = json::array();
    for (const auto& outcome : report.packages) {
        json p;
        p["name"] = outcome.packageName;
        p["state"] = domain::PackageStateToString(outcome.state);
        if (outcome.error) {
            p["error"] = outcome.error->describe();
        }
        packages.push_back(p);
    }
    j["packages"] = packages;
    return j;
}

std::optional<fs::path> RunReporter::Write(const domain::RunReport& report,
                                           const fs::path& dir,
                                           const std::string& prefix,
                                           infrastructure::Logger& logger) {
    const std::string base = prefix + "_" + infrastructure::Timestamps::NowCompact();
    fs::path target = dir / (base + ".json");

    std::error_code ec;
    for (int n = 1; fs::exists(target, ec); ++n) {
        target = dir / (base + "_" + std::to_string(n) + ".json");
    }

    std::string error;
    if (!infrastructure::AtomicFileWriter::Write(target, ToJson(report).dump(2) + "\n", error)) {
        logger.error(kComponent, "Failed to write report: " + error);
        return std::nullopt;
    }
    logger.info(kComponent, "Generated report: " + target.filename().string());
    return target;
}

std::optional<double> RunReporter::ThroughputMbps(std::uintmax_t bytes, double seconds) {
    if (bytes == 0 || seconds <= 0.0) return std::nullopt;
    double megabytes = static_cast<double>(bytes) / (1024.0 * 1024.0);
    return megabytes * 8.0 / seconds;
}

Catalog RunReporter::BuildCatalog(const std::vector<domain::PackageRecord>& records, const std::string& vendorDirectory) {
    Catalog catalog;
    for (const auto& record : records) {
        // Only links a download could resolve are listed.
        if (!record.hasLink() || !domain::LinkExtractor::ExtractIdentifier(*record.remoteLink)) continue;

        const std::string firstSegment = record.name.substr(0, record.name.find('/'));
        const std::string category = (firstSegment == vendorDirectory) ? vendorDirectory : domain::kThirdPartyCategory;
        catalog[category].push_back({record.name, *record.remoteLink});
    }

    for (auto& [category, items] : catalog) {
        std::sort(items.begin(), items.end(),
                  [](const CatalogItem& a, const CatalogItem& b) { return a.name < b.name; });
    }
    return catalog;
}

std::string RunReporter::RenderCatalog(const Catalog& catalog, const std::string& generatedAt) {
    std::stringstream ss;
    ss << "# Package Downloads\n\n";
    ss << "Generated: " << generatedAt << "\n\n";

    for (const auto& [category, items] : catalog) {
        ss << "\n## " << category << "\n\n";
        for (const auto& item : items) {
            ss << "- [" << item.name << "](" << item.link << ")\n";
        }
    }
    return ss.str();
}

bool RunReporter::WriteCatalog(const Catalog& catalog, const fs::path& target, infrastructure::Logger& logger) {
    std::string error;
    if (!infrastructure::AtomicFileWriter::Write(target, RenderCatalog(catalog, infrastructure::Timestamps::NowHuman()), error)) {
        logger.error(kComponent, "Failed to write package list: " + error);
        return false;
    }
    logger.info(kComponent, "Generated package list: " + target.filename().string());
    return true;
}

} // namespace bundlesync::application
