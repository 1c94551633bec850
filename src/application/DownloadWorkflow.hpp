/**
 * @file DownloadWorkflow.hpp
 * @brief Fetches every linked package into the download cache and verifies the result.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "application/WorkflowContext.hpp"
#include "domain/PackageConventions.hpp"
#include "domain/RunReport.hpp"

namespace bundlesync::application {

struct DownloadOptions {
    std::vector<std::string> packages;   ///< Name filter; empty means every linked package.
    bool verifyOnly = false;
    std::uintmax_t maxSizeBytes = domain::kDefaultMaxArtifactBytes;
};

class DownloadWorkflow {
public:
    explicit DownloadWorkflow(WorkflowContext& context);

    /** @return Process exit code. */
    int run(const DownloadOptions& options);

    const std::optional<domain::RunReport>& lastReport() const { return m_lastReport; }
    const std::optional<std::filesystem::path>& lastReportPath() const { return m_lastReportPath; }

private:
    int verifyExisting();

    WorkflowContext& m_ctx;
    std::optional<domain::RunReport> m_lastReport;
    std::optional<std::filesystem::path> m_lastReportPath;
};

} // namespace bundlesync::application
