/**
 * @file PackageState.hpp
 * @brief Lifecycle states a package moves through across download, export and sync.
 */

#pragma once
#include <string>

namespace bundlesync::domain {

enum class PackageState {
    Discovered,
    HasLink,
    NoLink,
    NeedsExport,
    Exported,
    Uploaded,
    AlreadySynced,
    Verified,
    Corrupted,
    FetchFailed,
    ExportFailed,
    UploadFailed,
    Skipped
};

inline std::string PackageStateToString(PackageState state) {
    switch (state) {
        case PackageState::Discovered: return "discovered";
        case PackageState::HasLink: return "has_link";
        case PackageState::NoLink: return "no_link";
        case PackageState::NeedsExport: return "needs_export";
        case PackageState::Exported: return "exported";
        case PackageState::Uploaded: return "uploaded";
        case PackageState::AlreadySynced: return "already_synced";
        case PackageState::Verified: return "verified";
        case PackageState::Corrupted: return "corrupted";
        case PackageState::FetchFailed: return "fetch_failed";
        case PackageState::ExportFailed: return "export_failed";
        case PackageState::UploadFailed: return "upload_failed";
        case PackageState::Skipped: return "skipped";
    }
    return "unknown";
}

/** @brief True for the states that count as a successful outcome in a run report. */
inline bool IsSuccessfulState(PackageState state) {
    return state == PackageState::Verified || state == PackageState::Exported ||
           state == PackageState::Uploaded || state == PackageState::AlreadySynced ||
           state == PackageState::HasLink;
}

} // namespace bundlesync::domain
