/**
 * @file ExportWorkflow.hpp
 * @brief Exports packages from the editor, writes a manifest and optionally publishes them.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "application/WorkflowContext.hpp"
#include "domain/RunReport.hpp"

namespace bundlesync::application {

struct ExportOptions {
    std::vector<std::string> packages;
    bool dryRun = false;
    std::optional<std::filesystem::path> editorPath;
    bool skipUpload = false;
};

class ExportWorkflow {
public:
    /**
     * @param installLocations Editor install locations searched after the explicit path.
     */
    ExportWorkflow(WorkflowContext& context, std::vector<std::filesystem::path> installLocations);

    /** @return Process exit code. */
    int run(const ExportOptions& options);

    const std::optional<domain::RunReport>& lastReport() const { return m_lastReport; }
    const std::optional<std::filesystem::path>& lastReportPath() const { return m_lastReportPath; }

    /** @brief Total size of the regular files below @p dir. Unreadable entries are skipped. */
    static std::uintmax_t DirectorySize(const std::filesystem::path& dir);

private:
    WorkflowContext& m_ctx;
    std::vector<std::filesystem::path> m_installLocations;
    std::optional<domain::RunReport> m_lastReport;
    std::optional<std::filesystem::path> m_lastReportPath;
};

} // namespace bundlesync::application
