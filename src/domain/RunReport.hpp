/**
 * @file RunReport.hpp
 * @brief Per-package outcomes and the aggregated report of one run.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "domain/FetchedArtifact.hpp"
#include "domain/PackageState.hpp"
#include "domain/SyncError.hpp"

namespace bundlesync::domain {

/**
 * @struct PackageOutcome
 * @brief Final state of one package within a run, folded into the report by the run loop.
 */
struct PackageOutcome {
    std::string packageName;
    PackageState state = PackageState::Discovered;
    std::optional<FetchedArtifact> artifact;
    std::optional<SyncError> error;

    bool succeeded() const { return IsSuccessfulState(state); }
};

struct RunReport {
    std::string workflow;          ///< "download", "sync" or "export".
    std::string timestamp;         ///< ISO-8601 local time of summarization.
    std::string platform;
    std::string projectPath;
    std::size_t totalCount = 0;
    std::size_t successCount = 0;
    std::size_t failureCount = 0;
    std::uintmax_t totalSizeBytes = 0;
    double elapsedSeconds = 0.0;
    std::vector<std::string> artifacts;   ///< Paths of the artifacts produced or reused.
    std::vector<PackageOutcome> packages;

    double totalSizeMB() const { return static_cast<double>(totalSizeBytes) / (1024.0 * 1024.0); }
};

} // namespace bundlesync::domain
