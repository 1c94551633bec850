/**
 * @file PackageRecord.hpp
 * @brief Domain entity describing a package discovered through its pointer file.
 */

#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bundlesync::domain {

/**
 * @struct PackageRecord
 * @brief One discovered package. Immutable for the duration of a run.
 */
struct PackageRecord {
    std::string name;                        ///< Canonical, hierarchy-derived name (e.g. "Vendor/Sub").
    std::filesystem::path sourcePath;        ///< Directory containing the pointer file.
    std::filesystem::path packageRoot;       ///< Directory that makes up the package.
    std::filesystem::path pointerFilePath;   ///< Full path of the pointer file.
    std::optional<std::string> remoteLink;   ///< First remote link found in the pointer file.

    bool hasLink() const { return remoteLink.has_value(); }
};

/**
 * @brief Converts a canonical package name into a file-safe artifact stem.
 * "Vendor/Sub Pack" becomes "Vendor_Sub_Pack".
 */
inline std::string ToArtifactStem(const std::string& packageName) {
    std::string stem = packageName;
    for (char& c : stem) {
        if (c == '/' || c == ' ') c = '_';
    }
    return stem;
}

/**
 * @brief Assigns every record a distinct artifact stem, keyed by canonical name.
 *
 * The first record (in discovery order) to claim a stem keeps it. Later records whose names
 * flatten to the same stem get "_2", "_3", ... appended, skipping any stem already in use.
 */
inline std::map<std::string, std::string> AssignArtifactStems(const std::vector<PackageRecord>& records) {
    std::map<std::string, std::string> stems;
    std::set<std::string> taken;
    std::vector<const PackageRecord*> colliding;

    for (const auto& record : records) {
        const std::string stem = ToArtifactStem(record.name);
        if (taken.insert(stem).second) {
            stems[record.name] = stem;
        } else {
            colliding.push_back(&record);
        }
    }

    for (const PackageRecord* record : colliding) {
        const std::string base = ToArtifactStem(record->name);
        std::string candidate;
        for (int suffix = 2;; ++suffix) {
            candidate = base + "_" + std::to_string(suffix);
            if (taken.insert(candidate).second) break;
        }
        stems[record->name] = candidate;
    }
    return stems;
}

} // namespace bundlesync::domain
