/**
 * @file PointerFileLocator.hpp
 * @brief Scanner for pointer files below the project's package roots.
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "domain/PackageRecord.hpp"
#include "infrastructure/Logger.hpp"

namespace bundlesync::infrastructure {

/**
 * @class PointerFileLocator
 * @brief Infrastructure adapter that turns pointer files on disk into PackageRecords.
 */
class PointerFileLocator {
public:
    PointerFileLocator(Logger& logger,
                       std::string pointerFileName = "DownloadInstructions.txt",
                       std::string vendorDirectory = "LeartesStudios");

    /**
     * @brief Recursively scans every root for pointer files.
     *
     * Roots that do not exist are skipped. Within a root, pointer files are visited in sorted
     * path order. Records are deduplicated by canonical name across all roots; the first one wins.
     * Files without a remote link still produce a record (with no link).
     *
     * @return One record per distinct package, in discovery order.
     */
    std::vector<domain::PackageRecord> discover(const std::vector<std::filesystem::path>& roots) const;

    /**
     * @brief Canonical name for a pointer file.
     *
     * Ordinarily the parent directory name. Below the vendor directory the name is
     * "<vendor>/<first sub-directory>", or just "<vendor>" when the pointer file sits
     * directly in the vendor directory.
     */
    static std::string DeriveCanonicalName(const std::filesystem::path& pointerFile, const std::string& vendorDirectory);

    /** @brief Directory making up the package named by DeriveCanonicalName(). */
    static std::filesystem::path DerivePackageRoot(const std::filesystem::path& pointerFile, const std::string& vendorDirectory);

private:
    std::vector<std::filesystem::path> findPointerFiles(const std::filesystem::path& root) const;

    Logger& m_logger;
    std::string m_pointerFileName;
    std::string m_vendorDirectory;
};

} // namespace bundlesync::infrastructure
