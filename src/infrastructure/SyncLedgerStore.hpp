/**
 * @file SyncLedgerStore.hpp
 * @brief Static utility for loading/saving the synchronization ledger (package_sync_config.json).
 *
 * Keeps all JSON handling for the ledger in one place. Loading never fails: a missing or
 * unreadable file yields the defaults, and persisted values are merged over the defaults
 * one field at a time so documents written by older versions pick up new fields.
 */

#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

#include "domain/LedgerDocument.hpp"
#include "infrastructure/Logger.hpp"

namespace bundlesync::infrastructure {

class SyncLedgerStore {
public:
    /** @brief The hard-coded default document, with no entries. */
    static domain::LedgerDocument Defaults();

    /**
     * @brief Reads the ledger at @p path.
     * @return Defaults when the file is missing or not a JSON object; otherwise the persisted
     *         values merged over the defaults.
     */
    static domain::LedgerDocument Load(const std::filesystem::path& path, Logger& logger);

    /**
     * @brief Atomically writes the full document (sorted keys, 2-space indent, trailing newline).
     * @return False if the file could not be written; the failure is logged.
     */
    static bool Save(const std::filesystem::path& path, const domain::LedgerDocument& doc, Logger& logger);

    /**
     * @brief Applies each top-level key of @p persisted over the defaults.
     * A known key with the wrong type keeps its default in memory (and logs a warning); its stored value
     * goes to extras with the unknown keys and is written back until the field is assigned.
     */
    static domain::LedgerDocument MergeOverDefaults(const nlohmann::json& persisted, Logger& logger);

    static nlohmann::json ToJson(const domain::LedgerDocument& doc);

    /** @brief Exact bytes written by Save(). */
    static std::string Serialize(const domain::LedgerDocument& doc);

    /** @brief Replaces the entry for @p packageName wholesale, stamped with the current time. */
    static void UpsertEntry(domain::LedgerDocument& doc,
                            const std::string& packageName,
                            const std::string& remoteFileId,
                            const std::string& remoteLink);

    static void UpsertEntry(domain::LedgerDocument& doc,
                            const std::string& packageName,
                            const std::string& remoteFileId,
                            const std::string& remoteLink,
                            const std::string& updatedAt);
};

} // namespace bundlesync::infrastructure
