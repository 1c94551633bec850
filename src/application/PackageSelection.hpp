#pragma once

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include "domain/PackageConventions.hpp"
#include "domain/PackageRecord.hpp"
#include "infrastructure/Logger.hpp"

namespace bundlesync::application {

/**
 * @brief Keeps the records whose canonical name is listed in @p names.
 * An empty filter keeps everything. Discovery order is preserved.
 */
inline std::vector<domain::PackageRecord> SelectPackages(const std::vector<domain::PackageRecord>& records,
                                                         const std::vector<std::string>& names) {
    if (names.empty()) return records;

    std::vector<domain::PackageRecord> selected;
    for (const auto& record : records) {
        if (std::find(names.begin(), names.end(), record.name) != names.end()) {
            selected.push_back(record);
        }
    }
    return selected;
}

/**
 * @brief Artifact stems for every discovered record, so a filter never changes which file a package maps to.
 * Logs a warning for each selected record whose stem had to be suffixed.
 */
inline std::map<std::string, std::string> ArtifactStemsFor(const std::vector<domain::PackageRecord>& discovered,
                                                           const std::vector<domain::PackageRecord>& selected,
                                                           infrastructure::Logger& log,
                                                           const std::string& component) {
    auto stems = domain::AssignArtifactStems(discovered);
    for (const auto& record : selected) {
        const std::string& stem = stems.at(record.name);
        if (stem != domain::ToArtifactStem(record.name)) {
            log.warn(component, "Artifact name of " + record.name + " collides with another package, using " +
                                    stem + domain::kArtifactExtension);
        }
    }
    return stems;
}

} // namespace bundlesync::application
