/**
 * @file ArtifactVerifier.hpp
 * @brief Gross-corruption checks over the artifact cache.
 */

#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "infrastructure/Logger.hpp"

namespace bundlesync::infrastructure {

/**
 * @struct VerificationReport
 * @brief Classification of every artifact found in the cache.
 */
struct VerificationReport {
    std::vector<std::filesystem::path> valid;
    std::vector<std::filesystem::path> corrupted;     ///< At or below the size threshold.
    std::vector<std::filesystem::path> unverifiable;  ///< Could not be stat'd.
};

class ArtifactVerifier {
public:
    ArtifactVerifier(Logger& logger,
                     std::string extension = ".unitypackage",
                     std::uintmax_t minimumBytes = 100);

    /**
     * @brief Classifies every artifact in @p cacheDir. Nothing is deleted.
     * Paths in each list are sorted.
     */
    VerificationReport verify(const std::filesystem::path& cacheDir) const;

    /**
     * @brief Deletes the files listed as corrupted.
     * @return Number of files actually removed.
     */
    std::size_t purgeCorrupted(const VerificationReport& report) const;

private:
    Logger& m_logger;
    std::string m_extension;
    std::uintmax_t m_minimumBytes;
};

} // namespace bundlesync::infrastructure
