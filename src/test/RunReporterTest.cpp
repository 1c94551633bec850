#undef NDEBUG
#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

#include "application/RunReporter.hpp"
#include "infrastructure/Logger.hpp"
#include "TestSupport.hpp"

namespace fs = std::filesystem;
using namespace bundlesync;
using application::RunReporter;
using bundlesync::test::ReadFile;
using bundlesync::test::ScratchDir;

namespace {

domain::PackageOutcome Succeeded(const std::string& name, std::uintmax_t bytes) {
    domain::PackageOutcome outcome;
    outcome.packageName = name;
    outcome.state = domain::PackageState::Verified;
    outcome.artifact = domain::FetchedArtifact{name, "/cache/" + name + ".unitypackage", bytes,
                                               domain::SourceMethod::Network};
    return outcome;
}

domain::PackageOutcome Failed(const std::string& name) {
    domain::PackageOutcome outcome;
    outcome.packageName = name;
    outcome.state = domain::PackageState::FetchFailed;
    outcome.error = domain::SyncError{domain::ErrorKind::NotFound, "HTTP 404"};
    return outcome;
}

domain::PackageRecord Record(const std::string& name, const std::string& link) {
    domain::PackageRecord record;
    record.name = name;
    if (!link.empty()) record.remoteLink = link;
    return record;
}

constexpr std::uintmax_t kMB = 1024 * 1024;

} // namespace

static void TestSummarize() {
    auto report = RunReporter::Summarize("download", "/project",
                                         {Succeeded("A", 10 * kMB), Succeeded("B", 20 * kMB), Failed("C")}, 4.0);
    assert(report.totalCount == 3);
    assert(report.successCount == 2);
    assert(report.failureCount == 1);
    assert(report.totalSizeBytes == 30 * kMB);
    assert(std::fabs(report.totalSizeMB() - 30.0) < 1e-9);
    assert(report.artifacts.size() == 2);
    assert(report.workflow == "download" && report.projectPath == "/project");

    auto mbps = RunReporter::ThroughputMbps(report.totalSizeBytes, report.elapsedSeconds);
    assert(mbps && std::fabs(*mbps - 60.0) < 1e-9 && "30 MB in 4 s is 60 Mbit/s");
    assert(!RunReporter::ThroughputMbps(0, 4.0));
    assert(!RunReporter::ThroughputMbps(30 * kMB, 0.0));
}

static void TestJsonShape() {
    auto report = RunReporter::Summarize("sync", "/project", {Succeeded("A", kMB + kMB / 3), Failed("C")}, 1.23456);
    auto j = RunReporter::ToJson(report);

    assert(j["workflow"] == "sync");
    assert(j["project_path"] == "/project");
    assert(j.contains("timestamp") && j.contains("platform"));
    assert(j["elapsed_seconds"].get<double>() == 1.23);
    assert(j["statistics"]["total"] == 2);
    assert(j["statistics"]["success"] == 1);
    assert(j["statistics"]["failed"] == 1);
    assert(j["statistics"]["total_size_mb"].get<double>() == 1.33);
    assert(j["files"].size() == 1);
    assert(j["packages"][0]["state"] == "verified" && !j["packages"][0].contains("error"));
    assert(j["packages"][1]["state"] == "fetch_failed");
    assert(j["packages"][1]["error"] == "NotFoundError: HTTP 404");
}

static void TestWriteNeverOverwrites() {
    ScratchDir scratch("reporter_write");
    std::ostringstream out, err;
    infrastructure::Logger logger(out, err);

    auto report = RunReporter::Summarize("download", "/project", {Succeeded("A", 500)}, 1.0);
    auto first = RunReporter::Write(report, scratch.path(), "download_report", logger);
    auto second = RunReporter::Write(report, scratch.path(), "download_report", logger);
    assert(first && second);
    assert(*first != *second && "second report in the same second gets a new name");
    assert(fs::exists(*first) && fs::exists(*second));
    assert(first->filename().string().rfind("download_report_", 0) == 0);
    assert(first->extension() == ".json");

    auto parsed = nlohmann::json::parse(ReadFile(*first));
    assert(parsed["statistics"]["total"] == 1);
    assert(out.str().find("Generated report: " + first->filename().string()) != std::string::npos);
}

static void TestCatalog() {
    std::vector<domain::PackageRecord> records = {
        Record("LeartesStudios/Zeta", "https://drive.google.com/file/d/Z/view"),
        Record("MusicPack", "https://drive.google.com/file/d/M/view"),
        Record("LeartesStudios/Alpha", "https://drive.google.com/file/d/A/view"),
        Record("LeartesStudiosFan", "https://drive.google.com/file/d/F/view"),
        Record("Unlinked", ""),
        Record("FolderLink", "https://drive.google.com/drive/u/0/my-drive"),
    };

    auto catalog = RunReporter::BuildCatalog(records, "LeartesStudios");
    assert(catalog.size() == 2);
    const auto& vendor = catalog.at("LeartesStudios");
    assert(vendor.size() == 2);
    assert(vendor[0].name == "LeartesStudios/Alpha" && vendor[1].name == "LeartesStudios/Zeta");
    const auto& thirdParty = catalog.at("Third Party");
    assert(thirdParty.size() == 2 && "records without a resolvable link are left out");
    assert(thirdParty[0].name == "LeartesStudiosFan" && thirdParty[1].name == "MusicPack");

    const std::string expected =
        "# Package Downloads\n\n"
        "Generated: 2026-10-17 09:30:00\n\n"
        "\n## LeartesStudios\n\n"
        "- [LeartesStudios/Alpha](https://drive.google.com/file/d/A/view)\n"
        "- [LeartesStudios/Zeta](https://drive.google.com/file/d/Z/view)\n"
        "\n## Third Party\n\n"
        "- [LeartesStudiosFan](https://drive.google.com/file/d/F/view)\n"
        "- [MusicPack](https://drive.google.com/file/d/M/view)\n";
    assert(RunReporter::RenderCatalog(catalog, "2026-10-17 09:30:00") == expected);

    assert(RunReporter::RenderCatalog({}, "now") == "# Package Downloads\n\nGenerated: now\n\n");
}

int main() {
    std::cout << "[Test] RunReporter..." << std::endl;
    TestSummarize();
    TestJsonShape();
    TestWriteNeverOverwrites();
    TestCatalog();
    std::cout << "[PASS] RunReporter" << std::endl;
    return 0;
}
