/**
 * @file PointerFileLocator.cpp
 * @brief Implementation of the PointerFileLocator.
 */

#include "infrastructure/PointerFileLocator.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>
#include <system_error>
#include "domain/LinkExtractor.hpp"

namespace fs = std::filesystem;

namespace bundlesync::infrastructure {

namespace {

constexpr const char* kComponent = "Locator";

// Index of the vendor component within the pointer file's path, or npos.
size_t FindVendorIndex(const std::vector<std::string>& parts, const std::string& vendorDirectory) {
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i] == vendorDirectory) return i;
    }
    return std::string::npos;
}

std::vector<std::string> SplitPath(const fs::path& p) {
    std::vector<std::string> parts;
    for (const auto& part : p) {
        parts.push_back(part.string());
    }
    return parts;
}

} // namespace

PointerFileLocator::PointerFileLocator(Logger& logger, std::string pointerFileName, std::string vendorDirectory)
    : m_logger(logger), m_pointerFileName(std::move(pointerFileName)), m_vendorDirectory(std::move(vendorDirectory)) {}

std::string PointerFileLocator::DeriveCanonicalName(const fs::path& pointerFile, const std::string& vendorDirectory) {
    auto parts = SplitPath(pointerFile);
    size_t vendorIdx = FindVendorIndex(parts, vendorDirectory);
    if (vendorIdx != std::string::npos) {
        // parts.size() - 1 is the pointer file itself.
        if (vendorIdx + 1 < parts.size() - 1) {
            return vendorDirectory + "/" + parts[vendorIdx + 1];
        }
        return vendorDirectory;
    }
    return pointerFile.parent_path().filename().string();
}

fs::path PointerFileLocator::DerivePackageRoot(const fs::path& pointerFile, const std::string& vendorDirectory) {
    auto parts = SplitPath(pointerFile);
    size_t vendorIdx = FindVendorIndex(parts, vendorDirectory);
    if (vendorIdx == std::string::npos) {
        return pointerFile.parent_path();
    }

    size_t last = (vendorIdx + 1 < parts.size() - 1) ? vendorIdx + 1 : vendorIdx;
    fs::path root;
    for (size_t i = 0; i <= last; ++i) {
        root /= parts[i];
    }
    return root;
}

std::vector<fs::path> PointerFileLocator::findPointerFiles(const fs::path& root) const {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return files;
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        m_logger.warn(kComponent, "Cannot scan " + root.string() + ": " + ec.message());
        return files;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            m_logger.warn(kComponent, "Error while scanning " + root.string() + ": " + ec.message());
            break;
        }
        // Anything but a directory is kept, so unreadable entries (dangling links) are reported by discover().
        std::error_code typeEc;
        if (it->path().filename() == m_pointerFileName && !it->is_directory(typeEc)) {
            files.push_back(it->path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::vector<domain::PackageRecord> PointerFileLocator::discover(const std::vector<fs::path>& roots) const {
    std::vector<domain::PackageRecord> records;
    std::set<std::string> seen;

    for (const auto& root : roots) {
        for (const auto& pointerFile : findPointerFiles(root)) {
            std::ifstream in(pointerFile);
            if (!in.is_open()) {
                m_logger.warn(kComponent, "Error reading " + pointerFile.string() + ": cannot open file");
                continue;
            }
            std::stringstream buffer;
            buffer << in.rdbuf();
            if (in.bad()) {
                m_logger.warn(kComponent, "Error reading " + pointerFile.string() + ": read failed");
                continue;
            }

            // Names are derived below the search root so directories above it never count.
            fs::path relative = pointerFile.lexically_relative(root);
            domain::PackageRecord record;
            if (relative.has_parent_path()) {
                record.name = DeriveCanonicalName(relative, m_vendorDirectory);
                record.packageRoot = root / DerivePackageRoot(relative, m_vendorDirectory);
            } else {
                record.name = root.filename().string();
                record.packageRoot = root;
            }
            if (!seen.insert(record.name).second) {
                m_logger.debug(kComponent, "Skipping duplicate package " + record.name + " at " + pointerFile.string());
                continue;
            }
            record.sourcePath = pointerFile.parent_path();
            record.pointerFilePath = pointerFile;
            record.remoteLink = domain::LinkExtractor::FindFirstRemoteLink(buffer.str());

            m_logger.debug(kComponent, "Found " + record.name + (record.hasLink() ? " (linked)" : " (no link)"));
            records.push_back(std::move(record));
        }
    }

    return records;
}

} // namespace bundlesync::infrastructure
