/**
 * @file RunReporter.hpp
 * @brief Turns per-package outcomes into report files and the package catalog page.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "domain/PackageRecord.hpp"
#include "domain/RunReport.hpp"
#include "infrastructure/Logger.hpp"

namespace bundlesync::application {

struct CatalogItem {
    std::string name;
    std::string link;
};

/// Category name -> items. std::map keeps categories in alphabetical order.
using Catalog = std::map<std::string, std::vector<CatalogItem>>;

class RunReporter {
public:
    /**
     * @brief Folds the outcomes of one run into a report.
     * Sizes of successful artifacts are summed; every outcome counts towards the total.
     */
    static domain::RunReport Summarize(const std::string& workflow,
                                       const std::string& projectPath,
                                       const std::vector<domain::PackageOutcome>& outcomes,
                                       double elapsedSeconds);

    static nlohmann::json ToJson(const domain::RunReport& report);

    /**
     * @brief Writes "<dir>/<prefix>_<YYYYmmdd_HHMMSS>.json", adding "_<n>" if that name is taken.
     * @return The written path, or nullopt (logged) if the write failed.
     */
    static std::optional<std::filesystem::path> Write(const domain::RunReport& report,
                                                      const std::filesystem::path& dir,
                                                      const std::string& prefix,
                                                      infrastructure::Logger& logger);

    /** @brief Megabits per second, only when both @p bytes and @p seconds are nonzero. */
    static std::optional<double> ThroughputMbps(std::uintmax_t bytes, double seconds);

    /** @brief Groups linked records under the vendor category or "Third Party". Items sorted by name. */
    static Catalog BuildCatalog(const std::vector<domain::PackageRecord>& records, const std::string& vendorDirectory);

    static std::string RenderCatalog(const Catalog& catalog, const std::string& generatedAt);

    static bool WriteCatalog(const Catalog& catalog, const std::filesystem::path& target, infrastructure::Logger& logger);
};

} // namespace bundlesync::application
