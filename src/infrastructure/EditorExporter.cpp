/**
 * @file EditorExporter.cpp
 * @brief Implementation of EditorExporter.
 */

#include "infrastructure/EditorExporter.hpp"

#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <system_error>

#include "domain/PackageConventions.hpp"
#include "infrastructure/AtomicFileWriter.hpp"

namespace bundlesync::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr const char* kComponent = "EditorExporter";
constexpr int kExportTimeoutSeconds = 300;

// Removes the temporary editor script when the export attempt ends.
class ScriptGuard {
public:
    explicit ScriptGuard(fs::path path) : m_path(std::move(path)) {}
    ~ScriptGuard() {
        std::error_code ec;
        fs::remove(m_path, ec);
    }
    ScriptGuard(const ScriptGuard&) = delete;
    ScriptGuard& operator=(const ScriptGuard&) = delete;

private:
    fs::path m_path;
};

std::string FormatMB(std::uintmax_t bytes) {
    std::ostringstream ss;
    ss.setf(std::ios::fixed);
    ss.precision(2);
    ss << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
    return ss.str();
}

} // namespace

EditorExporter::EditorExporter(const ProjectLayout& layout, domain::ExternalTool& tools, Logger& logger,
                               const fs::path& editorPath)
    : m_layout(layout), m_tools(tools), m_logger(logger), m_editorPath(editorPath) {}

std::vector<fs::path> EditorExporter::DefaultInstallLocations() {
#if defined(_WIN32)
    return {
        "C:/Program Files/Unity/Hub/Editor/6000.0.26f1/Editor/Unity.exe",
        "C:/Program Files/Unity/Hub/Editor/6000.0.37f1/Editor/Unity.exe",
        "C:/Program Files/Unity/Editor/Unity.exe",
    };
#elif defined(__APPLE__)
    return {
        "/Applications/Unity/Hub/Editor/6000.0.26f1/Unity.app/Contents/MacOS/Unity",
        "/Applications/Unity/Hub/Editor/6000.0.37f1/Unity.app/Contents/MacOS/Unity",
        "/Applications/Unity/Unity.app/Contents/MacOS/Unity",
    };
#else
    std::vector<fs::path> candidates = {"/opt/Unity/Editor/Unity"};
    const char* home = std::getenv("HOME");
    if (home && *home) {
        candidates.push_back(fs::path(home) / "Unity" / "Hub" / "Editor" / "6000.0.26f1" / "Editor" / "Unity");
    }
    return candidates;
#endif
}

std::optional<fs::path> EditorExporter::LocateEditor(const std::optional<fs::path>& explicitPath,
                                                     const std::vector<fs::path>& candidates) {
    std::error_code ec;
    if (explicitPath && fs::exists(*explicitPath, ec)) {
        return explicitPath;
    }
    for (const auto& candidate : candidates) {
        if (fs::exists(candidate, ec)) {
            return candidate;
        }
    }
    const char* fromEnv = std::getenv("UNITY_PATH");
    if (fromEnv && *fromEnv && fs::exists(fromEnv, ec)) {
        return fs::path(fromEnv);
    }
    return std::nullopt;
}

std::string EditorExporter::RenderExportScript(const std::string& packageAssetPath, const std::string& outputPath) {
    std::stringstream ss;
    ss << "using UnityEngine;\n"
       << "using UnityEditor;\n"
       << "using System.IO;\n\n"
       << "public class PackageExporter\n"
       << "{\n"
       << "    public static void ExportPackage()\n"
       << "    {\n"
       << "        string packagePath = \"" << packageAssetPath << "\";\n"
       << "        string outputPath = \"" << outputPath << "\";\n\n"
       << "        if (!Directory.Exists(packagePath))\n"
       << "        {\n"
       << "            Debug.LogError($\"Package path does not exist: {packagePath}\");\n"
       << "            EditorApplication.Exit(1);\n"
       << "            return;\n"
       << "        }\n\n"
       << "        string outputDir = Path.GetDirectoryName(outputPath);\n"
       << "        if (!Directory.Exists(outputDir))\n"
       << "        {\n"
       << "            Directory.CreateDirectory(outputDir);\n"
       << "        }\n\n"
       << "        try\n"
       << "        {\n"
       << "            AssetDatabase.ExportPackage(packagePath, outputPath,\n"
       << "                ExportPackageOptions.Recurse | ExportPackageOptions.IncludeDependencies);\n"
       << "            Debug.Log($\"Successfully exported package to: {outputPath}\");\n"
       << "            EditorApplication.Exit(0);\n"
       << "        }\n"
       << "        catch (System.Exception e)\n"
       << "        {\n"
       << "            Debug.LogError($\"Failed to export package: {e.Message}\");\n"
       << "            EditorApplication.Exit(1);\n"
       << "        }\n"
       << "    }\n"
       << "}\n";
    return ss.str();
}

bool EditorExporter::isEditorRunning() {
#if defined(_WIN32)
    auto result = m_tools.run({"tasklist", {"/FI", "IMAGENAME eq Unity.exe"}, 30});
    return result.output.find("Unity.exe") != std::string::npos;
#else
    auto result = m_tools.run({"pgrep", {"-f", "Unity"}, 30});
    return result.succeeded();
#endif
}

domain::Result<fs::path> EditorExporter::exportPackage(const fs::path& packageDir, const std::string& outputStem) {
    using PathResult = domain::Result<fs::path>;

    if (isEditorRunning()) {
        return PathResult::Fail(domain::ErrorKind::Precondition,
                                "Unity is currently running. Close it before exporting packages.");
    }

    const fs::path output = m_layout.exportsDir() / (outputStem + domain::kArtifactExtension);
    const fs::path assetPath = packageDir.lexically_relative(m_layout.root());

    // Success is judged by the output appearing, so an archive from an earlier run must not linger.
    std::error_code staleEc;
    fs::remove(output, staleEc);
    if (staleEc) {
        return PathResult::Fail(domain::ErrorKind::WriteFailed,
                                "Cannot remove previous export " + output.string() + ": " + staleEc.message());
    }

    std::string error;
    const fs::path scriptPath = m_layout.editorScriptPath();
    if (!AtomicFileWriter::Write(scriptPath, RenderExportScript(assetPath.generic_string(), output.generic_string()), error)) {
        return PathResult::Fail(domain::ErrorKind::WriteFailed, error);
    }
    ScriptGuard guard(scriptPath);

    domain::ToolInvocation invocation;
    invocation.program = m_editorPath.string();
    invocation.arguments = {
        "-batchmode",
        "-projectPath", m_layout.root().string(),
        "-executeMethod", "PackageExporter.ExportPackage",
        "-logFile", (m_layout.exportsDir() / ("export_" + outputStem + ".log")).string(),
        "-quit"
    };
    invocation.timeoutSeconds = kExportTimeoutSeconds;

    m_logger.info(kComponent, "Exporting " + assetPath.generic_string() + " to " + output.filename().string());
    auto result = m_tools.run(invocation);

    if (result.timedOut) {
        return PathResult::Fail(domain::ErrorKind::Timeout, "Export timed out for " + assetPath.generic_string());
    }

    std::error_code ec;
    if (fs::is_regular_file(output, ec)) {
        auto size = fs::file_size(output, ec);
        m_logger.info(kComponent, "Successfully exported: " + output.filename().string() + " (" + FormatMB(ec ? 0 : size) + ")");
        return PathResult::Ok(output);
    }

    std::string reason = "Export failed for " + assetPath.generic_string();
    if (!result.output.empty()) {
        reason += ": " + result.output;
    }
    return PathResult::Fail(domain::ErrorKind::ExportFailed, reason);
}

} // namespace bundlesync::infrastructure
