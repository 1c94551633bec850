/**
 * @file FetchedArtifact.hpp
 * @brief Domain entity for an artifact materialized in the local cache.
 */

#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace bundlesync::domain {

/**
 * @enum SourceMethod
 * @brief How an artifact reached the cache.
 */
enum class SourceMethod {
    Network,      ///< Primary in-process HTTP path.
    ExternalTool, ///< Fallback download utility.
    Cache         ///< Already present; nothing was transferred.
};

inline std::string SourceMethodToString(SourceMethod method) {
    switch (method) {
        case SourceMethod::Network: return "network";
        case SourceMethod::ExternalTool: return "external_tool";
        case SourceMethod::Cache: return "cache";
    }
    return "unknown";
}

/**
 * @struct FetchedArtifact
 * @brief Record of a file owned by the cache directory. Never mutated after creation.
 */
struct FetchedArtifact {
    std::string packageName;
    std::filesystem::path localPath;
    std::uintmax_t sizeBytes = 0;
    SourceMethod sourceMethod = SourceMethod::Network;

    /// Same file, same size. How the artifact was obtained is not part of its identity.
    bool operator==(const FetchedArtifact& other) const {
        return packageName == other.packageName && localPath == other.localPath &&
               sizeBytes == other.sizeBytes;
    }
};

} // namespace bundlesync::domain
