/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"
#include <chrono>
#include <fstream>
#include <system_error>

namespace bundlesync::infrastructure {

namespace fs = std::filesystem;

bool AtomicFileWriter::Write(const fs::path& target, const std::string& content, std::string& error) {
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = target;
    tempPath += "." + std::to_string(ticks) + ".tmp";

    // 1. Ensure directory exists
    std::error_code ec;
    if (target.has_parent_path() && !fs::exists(target.parent_path(), ec)) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            error = "cannot create directory " + target.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    // 2. Write to temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            error = "cannot open temp file " + tempPath.string();
            return false;
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        ofs.flush();
        if (ofs.fail()) {
            error = "write failed for " + tempPath.string();
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    // 3. Atomic rename
    fs::rename(tempPath, target, ec);
    if (ec) {
        error = "rename to " + target.string() + " failed: " + ec.message();
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return false;
    }
    return true;
}

} // namespace bundlesync::infrastructure
