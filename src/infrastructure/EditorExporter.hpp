/**
 * @file EditorExporter.hpp
 * @brief Produces package artifacts by running the editor in batch mode.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "domain/ExternalTool.hpp"
#include "domain/SyncError.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/ProjectLayout.hpp"

namespace bundlesync::infrastructure {

/**
 * @class EditorExporter
 * @brief Drives an unattended editor export for one package at a time.
 *
 * For each export a small editor script is dropped into the project, the editor is run with
 * -batchmode and a timeout, and the script is removed again whatever the outcome.
 */
class EditorExporter {
public:
    EditorExporter(const ProjectLayout& layout, domain::ExternalTool& tools, Logger& logger,
                   const std::filesystem::path& editorPath);

    /**
     * @brief Resolves the editor binary.
     *
     * Order: @p explicitPath, then the known install locations for this platform, then the
     * UNITY_PATH environment variable.
     */
    static std::optional<std::filesystem::path> LocateEditor(const std::optional<std::filesystem::path>& explicitPath,
                                                             const std::vector<std::filesystem::path>& candidates);

    /** @brief Known install locations for the current platform. */
    static std::vector<std::filesystem::path> DefaultInstallLocations();

    /** @brief Editor-side script performing the export of @p packageAssetPath to @p outputPath. */
    static std::string RenderExportScript(const std::string& packageAssetPath, const std::string& outputPath);

    /** @brief True if an editor process is already running (exports would conflict). */
    bool isEditorRunning();

    /**
     * @brief Exports @p packageDir to "<exports>/<outputStem>.unitypackage".
     * @return Path of the exported artifact.
     */
    domain::Result<std::filesystem::path> exportPackage(const std::filesystem::path& packageDir,
                                                        const std::string& outputStem);

private:
    const ProjectLayout& m_layout;
    domain::ExternalTool& m_tools;
    Logger& m_logger;
    std::filesystem::path m_editorPath;
};

} // namespace bundlesync::infrastructure
