/**
 * @file SyncWorkflow.hpp
 * @brief Publishes packages that have no remote link yet and records their new links.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "application/WorkflowContext.hpp"
#include "domain/RunReport.hpp"

namespace bundlesync::application {

struct SyncOptions {
    std::vector<std::string> packages;
    bool dryRun = false;
    bool usePlaceholders = true;
    bool listOnly = false;
};

/**
 * @class SyncWorkflow
 * @brief For every link-less package: find or build an artifact, upload it, rewrite the
 * pointer file and record the mapping. Packages that already have a link are left alone.
 */
class SyncWorkflow {
public:
    explicit SyncWorkflow(WorkflowContext& context);

    /** @return 0 iff every selected package succeeded. */
    int run(const SyncOptions& options);

    const std::optional<domain::RunReport>& lastReport() const { return m_lastReport; }
    const std::optional<std::filesystem::path>& lastReportPath() const { return m_lastReportPath; }

private:
    WorkflowContext& m_ctx;
    std::optional<domain::RunReport> m_lastReport;
    std::optional<std::filesystem::path> m_lastReportPath;
};

} // namespace bundlesync::application
