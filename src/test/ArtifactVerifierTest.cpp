#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <iostream>
#include <sstream>

#include "application/VerifyWorkflow.hpp"
#include "infrastructure/ArtifactVerifier.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/ScanWarningPageDetector.hpp"
#include "TestSupport.hpp"

namespace fs = std::filesystem;
using bundlesync::infrastructure::ArtifactVerifier;
using bundlesync::infrastructure::Logger;
using bundlesync::test::FakeExternalTool;
using bundlesync::test::FakeHttpTransport;
using bundlesync::test::ScratchDir;
using bundlesync::test::WriteFile;

static void TestSizeThreshold() {
    ScratchDir scratch("verifier_threshold");
    const fs::path cache = scratch.path();
    WriteFile(cache / "Small.unitypackage", std::string(100, 's'));
    WriteFile(cache / "Good.unitypackage", std::string(101, 'g'));
    WriteFile(cache / "Empty.unitypackage", "");
    WriteFile(cache / "download_report_20260101_000000.json", "{}");

    std::ostringstream out, err;
    Logger logger(out, err);
    ArtifactVerifier verifier(logger);

    auto report = verifier.verify(cache);
    assert(report.valid.size() == 1);
    assert(report.valid[0].filename() == "Good.unitypackage" && "101 bytes is valid");
    assert(report.corrupted.size() == 2);
    assert(report.corrupted[0].filename() == "Empty.unitypackage");
    assert(report.corrupted[1].filename() == "Small.unitypackage" && "100 bytes is corrupted");
    assert(report.unverifiable.empty());

    assert(fs::exists(cache / "Small.unitypackage") && "verify never deletes");
    assert(err.str().find("Package too small, might be corrupted: Small.unitypackage") != std::string::npos);
}

static void TestPurgeCorrupted() {
    ScratchDir scratch("verifier_purge");
    const fs::path cache = scratch.path();
    WriteFile(cache / "Bad.unitypackage", "tiny");
    WriteFile(cache / "Fine.unitypackage", std::string(4096, 'f'));

    std::ostringstream out, err;
    Logger logger(out, err);
    ArtifactVerifier verifier(logger);

    auto report = verifier.verify(cache);
    assert(verifier.purgeCorrupted(report) == 1);
    assert(!fs::exists(cache / "Bad.unitypackage"));
    assert(fs::exists(cache / "Fine.unitypackage"));

    auto again = verifier.verify(cache);
    assert(again.corrupted.empty() && again.valid.size() == 1);
}

static void TestUnreadableArtifactIsUnverifiable() {
    ScratchDir scratch("verifier_unreadable");
    const fs::path cache = scratch.path();
    WriteFile(cache / "Good.unitypackage", std::string(2048, 'g'));
    WriteFile(cache / "Bad.unitypackage", "tiny");
    fs::create_symlink("gone.unitypackage", cache / "Dangling.unitypackage");

    std::ostringstream out, err;
    Logger logger(out, err);
    ArtifactVerifier verifier(logger);

    auto report = verifier.verify(cache);
    assert(report.valid.size() == 1 && report.valid[0].filename() == "Good.unitypackage");
    assert(report.corrupted.size() == 1 && report.corrupted[0].filename() == "Bad.unitypackage");
    assert(report.unverifiable.size() == 1 && report.unverifiable[0].filename() == "Dangling.unitypackage");
    assert(err.str().find("Could not verify Dangling.unitypackage") != std::string::npos);

    assert(verifier.purgeCorrupted(report) == 1);
    assert(fs::is_symlink(cache / "Dangling.unitypackage") && "purge leaves unverifiable entries alone");
}

static void TestMissingCache() {
    std::ostringstream out, err;
    Logger logger(out, err);
    ArtifactVerifier verifier(logger);

    auto report = verifier.verify(fs::temp_directory_path() / "bundlesync_verifier_absent");
    assert(report.valid.empty() && report.corrupted.empty() && report.unverifiable.empty());
}

static void TestVerifyWorkflowExitCodes() {
    ScratchDir scratch("verifier_workflow");
    const fs::path downloads = scratch.path() / "PackageDownloads";
    WriteFile(downloads / "Bad.unitypackage", "tiny");
    WriteFile(downloads / "Fine.unitypackage", std::string(4096, 'f'));

    std::ostringstream out, err;
    Logger logger(out, err);
    FakeHttpTransport http;
    FakeExternalTool tools;
    bundlesync::infrastructure::ScanWarningPageDetector detector;
    bundlesync::application::WorkflowContext ctx{logger, bundlesync::infrastructure::ProjectLayout(scratch.path()),
                                                 http, tools, detector};

    bundlesync::application::VerifyWorkflow workflow(ctx);
    assert(workflow.run({}) == 1 && "corrupted artifact left in place");
    assert(fs::exists(downloads / "Bad.unitypackage"));
    assert(out.str().find("1 valid, 1 corrupted, 0 unverifiable") != std::string::npos);

    bundlesync::application::VerifyOptions purge;
    purge.purgeCorrupted = true;
    assert(workflow.run(purge) == 0);
    assert(!fs::exists(downloads / "Bad.unitypackage"));
    assert(workflow.run({}) == 0);
}

int main() {
    std::cout << "[Test] ArtifactVerifier..." << std::endl;
    TestSizeThreshold();
    TestPurgeCorrupted();
    TestUnreadableArtifactIsUnverifiable();
    TestMissingCache();
    TestVerifyWorkflowExitCodes();
    std::cout << "[PASS] ArtifactVerifier" << std::endl;
    return 0;
}
