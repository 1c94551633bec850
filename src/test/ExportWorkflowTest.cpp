#undef NDEBUG
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>

#include "application/ExportWorkflow.hpp"
#include "infrastructure/EditorExporter.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/ScanWarningPageDetector.hpp"
#include "infrastructure/SyncLedgerStore.hpp"
#include "TestSupport.hpp"

namespace fs = std::filesystem;
using namespace bundlesync;
using bundlesync::test::FakeExternalTool;
using bundlesync::test::FakeHttpTransport;
using bundlesync::test::ReadFile;
using bundlesync::test::ScratchDir;
using bundlesync::test::WriteFile;

namespace {

struct ExportFixture {
    explicit ExportFixture(const std::string& name)
        : scratch(name), logger(out, err),
          ctx{logger, infrastructure::ProjectLayout(scratch.path()), http, tools, detector} {
        editor = scratch.path() / "bin" / "Unity";
        WriteFile(editor, "#!/bin/sh\n");
        WriteFile(packages() / "Forest" / "DownloadInstructions.txt", "Export with Unity first.\n");
        WriteFile(packages() / "Forest" / "Trees" / "oak.fbx", std::string(2048, 't'));
        WriteFile(packages() / "Broken" / "DownloadInstructions.txt", "Export with Unity first.\n");
    }

    fs::path packages() const { return scratch.path() / "Assets" / "Packages"; }

    // Editor writes the archive for every package except "Broken"; gdrive is signed in.
    void scriptTools() {
        tools.available = {editor.string(), "pgrep", "gdrive"};
        const fs::path exports = ctx.layout.exportsDir();
        const fs::path script = ctx.layout.editorScriptPath();
        tools.handler = [this, exports, script](const domain::ToolInvocation& call) {
            if (call.program == "pgrep") return test::ToolExit(1);
            if (call.program == "gdrive" && call.arguments[0] == "account") return test::ToolOk("user@example.com\n");
            if (call.program == "gdrive") return test::ToolOk("Id: UP_" + fs::path(call.arguments.back()).stem().string() + "\n");

            scriptSeenDuringExport = fs::exists(script);
            const std::string source = ReadFile(script);
            if (source.find("Assets/Packages/Broken") != std::string::npos) {
                return test::ToolExit(1, "compile error");
            }
            WriteFile(exports / "Forest.unitypackage", std::string(4096, 'u'));
            return test::ToolOk();
        };
    }

    ScratchDir scratch;
    std::ostringstream out;
    std::ostringstream err;
    infrastructure::Logger logger;
    FakeHttpTransport http;
    FakeExternalTool tools;
    infrastructure::ScanWarningPageDetector detector;
    application::WorkflowContext ctx;
    fs::path editor;
    bool scriptSeenDuringExport = false;
};

} // namespace

static void TestLocateEditor() {
    ScratchDir scratch("export_locate");
    const fs::path real = scratch.path() / "Unity";
    WriteFile(real, "");

    using infrastructure::EditorExporter;
    assert(EditorExporter::LocateEditor(real, {}) == real && "explicit path wins");
    assert(EditorExporter::LocateEditor(scratch.path() / "missing", {scratch.path() / "nope", real}) == real &&
           "candidates searched in order");
}

static void TestExportScript() {
    auto script = infrastructure::EditorExporter::RenderExportScript("Assets/Packages/Forest", "/p/PackageExports/Forest.unitypackage");
    assert(script.find("public class PackageExporter") != std::string::npos);
    assert(script.find("string packagePath = \"Assets/Packages/Forest\";") != std::string::npos);
    assert(script.find("string outputPath = \"/p/PackageExports/Forest.unitypackage\";") != std::string::npos);
    assert(script.find("ExportPackageOptions.Recurse | ExportPackageOptions.IncludeDependencies") != std::string::npos);
}

static void TestExportAndUpload() {
    ExportFixture f("export_run");
    f.scriptTools();

    application::ExportOptions options;
    options.editorPath = f.editor;
    application::ExportWorkflow workflow(f.ctx, {});
    assert(workflow.run(options) == 1 && "one package failed to export");

    assert(f.scriptSeenDuringExport && "editor script present while the editor runs");
    assert(!fs::exists(f.ctx.layout.editorScriptPath()) && "editor script removed afterwards");

    const auto& report = *workflow.lastReport();
    assert(report.workflow == "export" && report.totalCount == 2);
    assert(report.packages[0].packageName == "Broken");
    assert(report.packages[0].state == domain::PackageState::ExportFailed);
    assert(report.packages[0].error->message.find("compile error") != std::string::npos);
    assert(report.packages[1].state == domain::PackageState::Uploaded);
    assert(f.tools.callsTo("gdrive", "files") == 1);

    assert(workflow.lastReportPath() && workflow.lastReportPath()->filename().string().rfind("manifest_", 0) == 0);

    auto ledger = infrastructure::SyncLedgerStore::Load(f.ctx.layout.ledgerPath(), f.logger);
    assert(ledger.entries.at("Forest").remoteFileId == "UP_Forest");
    assert(ledger.lastExportAt.has_value());
    assert(ledger.packagesToExport.size() == 2);
    assert(ReadFile(f.packages() / "Forest" / "DownloadInstructions.txt").find("UP_Forest") != std::string::npos);
}

static void TestSkipUpload() {
    ExportFixture f("export_skip_upload");
    f.scriptTools();

    application::ExportOptions options;
    options.editorPath = f.editor;
    options.packages = {"Forest"};
    options.skipUpload = true;
    application::ExportWorkflow workflow(f.ctx, {});
    assert(workflow.run(options) == 0);
    assert(f.tools.callsTo("gdrive") == 0);
    assert(workflow.lastReport()->packages[0].state == domain::PackageState::Exported);
    assert(workflow.lastReport()->totalSizeBytes == 4096);
}

static void TestStaleArchiveIsNotSuccess() {
    ExportFixture f("export_stale_archive");
    f.scriptTools();
    const fs::path stale = f.ctx.layout.exportsDir() / "Broken.unitypackage";
    WriteFile(stale, std::string(8192, 'o'));

    application::ExportOptions options;
    options.editorPath = f.editor;
    options.packages = {"Broken"};
    options.skipUpload = true;
    application::ExportWorkflow workflow(f.ctx, {});
    assert(workflow.run(options) == 1);
    assert(workflow.lastReport()->packages[0].state == domain::PackageState::ExportFailed);
    assert(!fs::exists(stale) && "archive from an earlier run is cleared before exporting");
}

static void TestPreconditions() {
    ExportFixture running("export_editor_running");
    running.tools.available = {running.editor.string(), "pgrep"};
    running.tools.handler = [](const domain::ToolInvocation&) { return test::ToolOk("4242\n"); };

    application::ExportOptions options;
    options.editorPath = running.editor;
    options.skipUpload = true;
    application::ExportWorkflow busy(running.ctx, {});
    assert(busy.run(options) == 1);
    assert(busy.lastReport()->packages[0].error->kind == domain::ErrorKind::Precondition);

    ExportFixture noEditor("export_no_editor");
    application::ExportOptions missing;
    missing.editorPath = noEditor.scratch.path() / "nowhere" / "Unity";
    application::ExportWorkflow workflow(noEditor.ctx, {});
    if (!std::getenv("UNITY_PATH")) {
        assert(workflow.run(missing) == 2);
        assert(noEditor.err.str().find("Unity editor not found") != std::string::npos);
    }

    application::ExportOptions dryRun;
    dryRun.dryRun = true;
    assert(workflow.run(dryRun) == 0 && "dry run needs no editor");
    assert(noEditor.out.str().find("Forest (0.00 MB)") != std::string::npos);
}

int main() {
    std::cout << "[Test] ExportWorkflow..." << std::endl;
    TestLocateEditor();
    TestExportScript();
    TestExportAndUpload();
    TestSkipUpload();
    TestStaleArchiveIsNotSuccess();
    TestPreconditions();
    std::cout << "[PASS] ExportWorkflow" << std::endl;
    return 0;
}
