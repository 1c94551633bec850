#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

#include "infrastructure/Logger.hpp"
#include "infrastructure/SyncLedgerStore.hpp"
#include "TestSupport.hpp"

namespace fs = std::filesystem;
using bundlesync::domain::LedgerDocument;
using bundlesync::infrastructure::Logger;
using bundlesync::infrastructure::SyncLedgerStore;
using bundlesync::test::ReadFile;
using bundlesync::test::ScratchDir;
using bundlesync::test::WriteFile;

static void TestMissingAndCorruptFilesYieldDefaults() {
    ScratchDir scratch("ledger_defaults");
    std::ostringstream out, err;
    Logger logger(out, err);

    auto missing = SyncLedgerStore::Load(scratch.path() / "absent.json", logger);
    assert(missing.entries.empty());
    assert(missing.remoteFolder == "BundleSync_Packages");
    assert(!missing.remoteFolderId && missing.uploadParent() == "root");
    assert(missing.autoUpdateInstructions);

    WriteFile(scratch.path() / "corrupt.json", "{ \"google_drive_folder\": ");
    auto corrupt = SyncLedgerStore::Load(scratch.path() / "corrupt.json", logger);
    assert(corrupt.entries.empty() && corrupt.remoteFolder == "BundleSync_Packages");
    assert(err.str().find("Invalid config file") != std::string::npos && "parse failure is logged");

    WriteFile(scratch.path() / "array.json", "[1, 2, 3]");
    auto array = SyncLedgerStore::Load(scratch.path() / "array.json", logger);
    assert(array.entries.empty() && array.extras.empty());
}

static void TestRoundTripIsFixedPoint() {
    ScratchDir scratch("ledger_roundtrip");
    std::ostringstream out, err;
    Logger logger(out, err);
    const fs::path path = scratch.path() / ".bundlesync" / "package_sync_config.json";

    LedgerDocument doc = SyncLedgerStore::Defaults();
    doc.remoteFolderId = "folder-42";
    doc.lastSyncAt = "2026-10-17T09:30:00";
    doc.packagesToExport = {"LeartesStudios/Environment", "MusicPack"};
    SyncLedgerStore::UpsertEntry(doc, "MusicPack", "MUSIC", "https://drive.google.com/file/d/MUSIC/view?usp=sharing",
                                 "2026-10-17T09:29:00");
    SyncLedgerStore::UpsertEntry(doc, "LeartesStudios/Environment", "ENV", "https://drive.google.com/file/d/ENV/view",
                                 "2026-10-17T09:28:00");

    assert(SyncLedgerStore::Save(path, doc, logger));
    const std::string firstBytes = ReadFile(path);
    assert(!firstBytes.empty() && firstBytes.back() == '\n');

    auto loaded = SyncLedgerStore::Load(path, logger);
    assert(loaded.entries.size() == 2);
    assert(loaded.entries.at("MusicPack") == doc.entries.at("MusicPack"));
    assert(loaded.uploadParent() == "folder-42");

    assert(SyncLedgerStore::Save(path, loaded, logger));
    assert(ReadFile(path) == firstBytes && "save(load(p)) is a byte-level fixed point");

    // Keys are written sorted.
    auto json = nlohmann::json::parse(firstBytes);
    assert(json.begin().key() == "auto_update_instructions");
    assert(json["package_mappings"]["MusicPack"]["file_id"] == "MUSIC");
}

static void TestUnknownKeysAndFieldDefaults() {
    ScratchDir scratch("ledger_merge");
    std::ostringstream out, err;
    Logger logger(out, err);
    const fs::path path = scratch.path() / "package_sync_config.json";

    WriteFile(path, R"({
  "google_drive_folder": 17,
  "last_sync": "2025-01-01T00:00:00",
  "custom_section": {"owner": "build-bot", "retries": [1, 2]},
  "package_mappings": {
    "Pack": {"file_id": "P1", "link": "https://drive.google.com/file/d/P1/view", "updated": "2025-01-01T00:00:00"}
  }
})");

    auto doc = SyncLedgerStore::Load(path, logger);
    assert(doc.remoteFolder == "BundleSync_Packages" && "wrong type keeps the default");
    assert(err.str().find("google_drive_folder") != std::string::npos && "type mismatch is logged");
    assert(doc.lastSyncAt && *doc.lastSyncAt == "2025-01-01T00:00:00");
    assert(doc.autoUpdateInstructions && "absent key keeps the default");
    assert(doc.entries.size() == 1 && doc.entries.at("Pack").remoteFileId == "P1");
    assert(doc.extras.count("custom_section") == 1);

    assert(SyncLedgerStore::Save(path, doc, logger));
    auto saved = nlohmann::json::parse(ReadFile(path));
    assert(saved["custom_section"]["owner"] == "build-bot" && "unknown keys survive a save");
    assert(saved["custom_section"]["retries"].size() == 2);
    assert(saved["google_drive_folder"] == 17 && "stored value of an unexpected type is written back");
}

static void TestMistypedValuesSurviveSave() {
    ScratchDir scratch("ledger_mistyped");
    std::ostringstream out, err;
    Logger logger(out, err);
    const fs::path path = scratch.path() / "package_sync_config.json";

    WriteFile(path, R"({
  "google_drive_folder": 42,
  "packages_to_export": ["Pack", 7],
  "package_mappings": {
    "Pack": {"file_id": "P1", "link": "https://drive.google.com/file/d/P1/view", "updated": "2025-01-01T00:00:00", "size_mb": 12.5},
    "Odd": "legacy-string"
  }
})");

    auto doc = SyncLedgerStore::Load(path, logger);
    assert(doc.remoteFolder == "BundleSync_Packages");
    assert(doc.packagesToExport.empty());
    assert(doc.entries.size() == 1 && doc.entries.at("Pack").remoteFileId == "P1");
    assert(doc.entries.at("Pack").extras.count("size_mb") == 1);
    assert(doc.rawEntries.count("Odd") == 1);
    assert(err.str().find("Odd") != std::string::npos);

    assert(SyncLedgerStore::Save(path, doc, logger));
    const std::string firstBytes = ReadFile(path);
    auto saved = nlohmann::json::parse(firstBytes);
    assert(saved["google_drive_folder"] == 42);
    assert(saved["packages_to_export"].size() == 2 && saved["packages_to_export"][1] == 7);
    assert(saved["package_mappings"]["Pack"]["size_mb"].get<double>() == 12.5);
    assert(saved["package_mappings"]["Pack"]["file_id"] == "P1");
    assert(saved["package_mappings"]["Odd"] == "legacy-string");

    assert(SyncLedgerStore::Save(path, SyncLedgerStore::Load(path, logger), logger));
    assert(ReadFile(path) == firstBytes && "preserved values stay stable across saves");

    // Assigned fields replace the stored value; a resynced mapping replaces the raw one.
    doc.remoteFolder = "Shared";
    SyncLedgerStore::UpsertEntry(doc, "Odd", "ODD", "https://drive.google.com/file/d/ODD/view", "2026-10-17T09:30:00");
    SyncLedgerStore::UpsertEntry(doc, "Pack", "P2", "https://drive.google.com/file/d/P2/view", "2026-10-17T09:30:00");
    assert(doc.rawEntries.empty());
    assert(SyncLedgerStore::Save(path, doc, logger));
    saved = nlohmann::json::parse(ReadFile(path));
    assert(saved["google_drive_folder"] == "Shared");
    assert(saved["package_mappings"]["Odd"]["file_id"] == "ODD");
    assert(!saved["package_mappings"]["Pack"].contains("size_mb") && "replaced entry starts fresh");
}

static void TestUpsertReplacesWholesale() {
    LedgerDocument doc;
    SyncLedgerStore::UpsertEntry(doc, "Pack", "OLD", "https://drive.google.com/file/d/OLD/view", "2025-01-01T00:00:00");
    SyncLedgerStore::UpsertEntry(doc, "Pack", "NEW", "https://drive.google.com/file/d/NEW/view");

    assert(doc.entries.size() == 1);
    const auto& entry = doc.entries.at("Pack");
    assert(entry.remoteFileId == "NEW");
    assert(entry.remoteLink == "https://drive.google.com/file/d/NEW/view");
    assert(entry.updatedAt != "2025-01-01T00:00:00" && entry.updatedAt.size() == 19 && "stamped with current time");
}

int main() {
    std::cout << "[Test] SyncLedgerStore..." << std::endl;
    TestMissingAndCorruptFilesYieldDefaults();
    TestRoundTripIsFixedPoint();
    TestUnknownKeysAndFieldDefaults();
    TestMistypedValuesSurviveSave();
    TestUpsertReplacesWholesale();
    std::cout << "[PASS] SyncLedgerStore" << std::endl;
    return 0;
}
