/**
 * @file SyncLedgerStore.cpp
 * @brief Implementation of SyncLedgerStore.
 */

#include "infrastructure/SyncLedgerStore.hpp"
#include <exception>
#include <fstream>
#include <system_error>
#include <utility>
#include <vector>
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/Timestamps.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace bundlesync::infrastructure {

namespace {

constexpr const char* kComponent = "SyncLedger";

constexpr const char* kKeyFolder = "google_drive_folder";
constexpr const char* kKeyFolderId = "google_drive_folder_id";
constexpr const char* kKeyLastSync = "last_sync";
constexpr const char* kKeyLastDownload = "last_download";
constexpr const char* kKeyLastExport = "last_export";
constexpr const char* kKeyAutoUpdate = "auto_update_instructions";
constexpr const char* kKeyPackagesToExport = "packages_to_export";
constexpr const char* kKeyMappings = "package_mappings";

constexpr const char* kEntryFileId = "file_id";
constexpr const char* kEntryLink = "link";
constexpr const char* kEntryUpdated = "updated";

// A known key with an unexpected type keeps its default in memory; the persisted value
// is parked in extras and written back unchanged unless the field is assigned later.
void KeepMistyped(domain::LedgerDocument& doc, const std::string& key, const json& value,
                  const char* expected, Logger& logger) {
    logger.warn(kComponent, "Unexpected type for '" + key + "' in ledger (expected " + expected +
                                "), using the default and keeping the stored value");
    doc.extras[key] = value.dump();
}

void MergeOptionalString(domain::LedgerDocument& doc, const json& value, const std::string& key,
                         std::optional<std::string>& field, Logger& logger) {
    if (value.is_null()) {
        field.reset();
    } else if (value.is_string()) {
        field = value.get<std::string>();
    } else {
        KeepMistyped(doc, key, value, "string or null", logger);
    }
}

json OptionalToJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

domain::LedgerEntry EntryFromJson(const std::string& name, const json& obj) {
    domain::LedgerEntry entry;
    entry.packageName = name;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        const std::string& field = it.key();
        std::string* target = nullptr;
        if (field == kEntryFileId) target = &entry.remoteFileId;
        else if (field == kEntryLink) target = &entry.remoteLink;
        else if (field == kEntryUpdated) target = &entry.updatedAt;

        if (target && it.value().is_string()) {
            *target = it.value().get<std::string>();
        } else {
            entry.extras[field] = it.value().dump();
        }
    }
    return entry;
}

json EntryToJson(const domain::LedgerEntry& entry) {
    json obj = json::object();
    for (const auto& [field, text] : entry.extras) {
        obj[field] = json::parse(text);
    }
    auto put = [&](const char* field, const std::string& value) {
        if (value.empty() && entry.extras.count(field)) return;
        obj[field] = value;
    };
    put(kEntryFileId, entry.remoteFileId);
    put(kEntryLink, entry.remoteLink);
    put(kEntryUpdated, entry.updatedAt);
    return obj;
}

} // namespace

domain::LedgerDocument SyncLedgerStore::Defaults() {
    return domain::LedgerDocument{};
}

domain::LedgerDocument SyncLedgerStore::MergeOverDefaults(const json& persisted, Logger& logger) {
    domain::LedgerDocument doc = Defaults();
    if (!persisted.is_object()) {
        return doc;
    }

    for (auto it = persisted.begin(); it != persisted.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();

        if (key == kKeyFolder) {
            if (value.is_string()) doc.remoteFolder = value.get<std::string>();
            else KeepMistyped(doc, key, value, "string", logger);
        } else if (key == kKeyFolderId) {
            MergeOptionalString(doc, value, key, doc.remoteFolderId, logger);
        } else if (key == kKeyLastSync) {
            MergeOptionalString(doc, value, key, doc.lastSyncAt, logger);
        } else if (key == kKeyLastDownload) {
            MergeOptionalString(doc, value, key, doc.lastDownloadAt, logger);
        } else if (key == kKeyLastExport) {
            MergeOptionalString(doc, value, key, doc.lastExportAt, logger);
        } else if (key == kKeyAutoUpdate) {
            if (value.is_boolean()) doc.autoUpdateInstructions = value.get<bool>();
            else KeepMistyped(doc, key, value, "boolean", logger);
        } else if (key == kKeyPackagesToExport) {
            std::vector<std::string> names;
            bool allStrings = value.is_array();
            if (allStrings) {
                for (const auto& item : value) {
                    if (!item.is_string()) {
                        allStrings = false;
                        break;
                    }
                    names.push_back(item.get<std::string>());
                }
            }
            if (!allStrings) {
                KeepMistyped(doc, key, value, "array of strings", logger);
                continue;
            }
            doc.packagesToExport = std::move(names);
        } else if (key == kKeyMappings) {
            if (!value.is_object()) {
                KeepMistyped(doc, key, value, "object", logger);
                continue;
            }
            doc.entries.clear();
            doc.rawEntries.clear();
            for (auto entryIt = value.begin(); entryIt != value.end(); ++entryIt) {
                if (!entryIt.value().is_object()) {
                    logger.warn(kComponent, "Mapping for " + entryIt.key() + " is not an object, keeping it as stored");
                    doc.rawEntries[entryIt.key()] = entryIt.value().dump();
                    continue;
                }
                doc.entries[entryIt.key()] = EntryFromJson(entryIt.key(), entryIt.value());
            }
        } else {
            doc.extras[key] = value.dump();
        }
    }
    return doc;
}

domain::LedgerDocument SyncLedgerStore::Load(const fs::path& path, Logger& logger) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        logger.debug(kComponent, "No ledger at " + path.string() + ", using defaults");
        return Defaults();
    }

    try {
        std::ifstream f(path);
        if (!f.is_open()) {
            logger.warn(kComponent, "Cannot open " + path.string() + ", using defaults");
            return Defaults();
        }
        json j = json::parse(f);
        if (!j.is_object()) {
            logger.warn(kComponent, "Invalid config file (not an object), using defaults");
            return Defaults();
        }
        return MergeOverDefaults(j, logger);
    } catch (const json::exception& e) {
        logger.warn(kComponent, std::string("Invalid config file, using defaults: ") + e.what());
    }
    return Defaults();
}

json SyncLedgerStore::ToJson(const domain::LedgerDocument& doc) {
    const domain::LedgerDocument defaults = Defaults();
    json j = json::object();

    for (const auto& [key, text] : doc.extras) {
        j[key] = json::parse(text);
    }

    // A field still at its default does not replace a stored value of an unexpected type.
    auto put = [&](const char* key, const json& value, bool atDefault) {
        if (atDefault && doc.extras.count(key)) return;
        j[key] = value;
    };

    put(kKeyFolder, doc.remoteFolder, doc.remoteFolder == defaults.remoteFolder);
    put(kKeyFolderId, OptionalToJson(doc.remoteFolderId), !doc.remoteFolderId);
    put(kKeyLastSync, OptionalToJson(doc.lastSyncAt), !doc.lastSyncAt);
    put(kKeyLastDownload, OptionalToJson(doc.lastDownloadAt), !doc.lastDownloadAt);
    put(kKeyLastExport, OptionalToJson(doc.lastExportAt), !doc.lastExportAt);
    put(kKeyAutoUpdate, doc.autoUpdateInstructions, doc.autoUpdateInstructions == defaults.autoUpdateInstructions);
    put(kKeyPackagesToExport, doc.packagesToExport, doc.packagesToExport.empty());

    json mappings = json::object();
    for (const auto& [name, text] : doc.rawEntries) {
        mappings[name] = json::parse(text);
    }
    for (const auto& [name, entry] : doc.entries) {
        mappings[name] = EntryToJson(entry);
    }
    put(kKeyMappings, mappings, doc.entries.empty() && doc.rawEntries.empty());
    return j;
}

std::string SyncLedgerStore::Serialize(const domain::LedgerDocument& doc) {
    return ToJson(doc).dump(2) + "\n";
}

bool SyncLedgerStore::Save(const fs::path& path, const domain::LedgerDocument& doc, Logger& logger) {
    std::string content;
    try {
        content = Serialize(doc);
    } catch (const json::exception& e) {
        logger.error(kComponent, std::string("Cannot serialize ledger: ") + e.what());
        return false;
    }

    std::string error;
    if (!AtomicFileWriter::Write(path, content, error)) {
        logger.error(kComponent, "Cannot write ledger: " + error);
        return false;
    }
    logger.debug(kComponent, "Saved ledger to " + path.string());
    return true;
}

void SyncLedgerStore::UpsertEntry(domain::LedgerDocument& doc,
                                  const std::string& packageName,
                                  const std::string& remoteFileId,
                                  const std::string& remoteLink) {
    UpsertEntry(doc, packageName, remoteFileId, remoteLink, Timestamps::NowIso8601());
}

void SyncLedgerStore::UpsertEntry(domain::LedgerDocument& doc,
                                  const std::string& packageName,
                                  const std::string& remoteFileId,
                                  const std::string& remoteLink,
                                  const std::string& updatedAt) {
    doc.rawEntries.erase(packageName);
    doc.entries[packageName] = domain::LedgerEntry{packageName, remoteFileId, remoteLink, updatedAt, {}};
}

} // namespace bundlesync::infrastructure
