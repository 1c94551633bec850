/**
 * @file PackageConventions.hpp
 * @brief Project-wide naming conventions and limits for package handling.
 */

#pragma once
#include <cstdint>

namespace bundlesync::domain {

constexpr const char* kPointerFileName = "DownloadInstructions.txt";
constexpr const char* kArtifactExtension = ".unitypackage";
constexpr const char* kVendorDirectory = "LeartesStudios";
constexpr const char* kThirdPartyCategory = "Third Party";

/// Artifacts at or below this size are treated as truncated.
constexpr std::uintmax_t kMinArtifactBytes = 100;

constexpr std::uintmax_t kBytesPerGB = 1024ull * 1024ull * 1024ull;
constexpr std::uintmax_t kDefaultMaxArtifactBytes = 5ull * kBytesPerGB;

/// Some hosts reject requests with an empty or library-default identity.
constexpr const char* kClientIdentity =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36";

} // namespace bundlesync::domain
