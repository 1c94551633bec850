/**
 * @file LedgerDocument.hpp
 * @brief Typed form of the persisted synchronization ledger.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bundlesync::domain {

/**
 * @struct LedgerEntry
 * @brief Current remote mapping of one package. Replaced wholesale on resync.
 */
struct LedgerEntry {
    std::string packageName;
    std::string remoteFileId;
    std::string remoteLink;
    std::string updatedAt; ///< ISO-8601 local time.

    /// Persisted fields this version does not model, as JSON text. Dropped when the entry is replaced.
    std::map<std::string, std::string> extras;

    bool operator==(const LedgerEntry& other) const {
        return packageName == other.packageName && remoteFileId == other.remoteFileId &&
               remoteLink == other.remoteLink && updatedAt == other.updatedAt && extras == other.extras;
    }
};

/**
 * @struct LedgerDocument
 * @brief Ledger state. Default member values are the hard-coded defaults applied before
 * any persisted keys are merged on top.
 */
struct LedgerDocument {
    std::string remoteFolder = "BundleSync_Packages";
    std::optional<std::string> remoteFolderId;    ///< Upload parent; "root" when unset.
    std::optional<std::string> lastSyncAt;
    std::optional<std::string> lastDownloadAt;
    std::optional<std::string> lastExportAt;
    bool autoUpdateInstructions = true;
    std::vector<std::string> packagesToExport;
    std::map<std::string, LedgerEntry> entries;

    /// Unknown top-level keys, and known keys whose persisted value had an unexpected type,
    /// kept as serialized JSON text so they survive a save.
    std::map<std::string, std::string> extras;

    /// Mappings whose persisted value is not an object, kept verbatim until the package is resynced.
    std::map<std::string, std::string> rawEntries;

    std::string uploadParent() const { return remoteFolderId.value_or("root"); }
};

} // namespace bundlesync::domain
