#include "infrastructure/ProjectLayout.hpp"
#include <system_error>

namespace bundlesync::infrastructure {

namespace fs = std::filesystem;

ProjectLayout::ProjectLayout(const fs::path& projectRoot) {
    std::error_code ec;
    fs::path absolute = fs::absolute(projectRoot, ec);
    m_root = ec ? projectRoot : absolute.lexically_normal();
}

fs::path ProjectLayout::packagesDir() const {
    return m_root / "Assets" / "Packages";
}

fs::path ProjectLayout::audioDir() const {
    return m_root / "Assets" / "Audio";
}

fs::path ProjectLayout::downloadsDir() const {
    return m_root / "PackageDownloads";
}

fs::path ProjectLayout::exportsDir() const {
    return m_root / "PackageExports";
}

fs::path ProjectLayout::ledgerPath() const {
    return m_root / ".bundlesync" / "package_sync_config.json";
}

fs::path ProjectLayout::catalogPath() const {
    return m_root / "PACKAGE_DOWNLOADS.md";
}

fs::path ProjectLayout::editorScriptPath() const {
    return m_root / "Assets" / "Editor" / "PackageExporter.cs";
}

std::vector<fs::path> ProjectLayout::searchRoots() const {
    return {packagesDir(), audioDir()};
}

bool ProjectLayout::HasProjectStructure() const {
    std::error_code ec;
    for (const auto& root : searchRoots()) {
        if (fs::is_directory(root, ec)) return true;
    }
    return false;
}

bool ProjectLayout::EnsureWorkFolders() const {
    std::error_code ec;
    fs::create_directories(downloadsDir(), ec);
    if (ec) return false;
    fs::create_directories(exportsDir(), ec);
    return !ec;
}

} // namespace bundlesync::infrastructure
