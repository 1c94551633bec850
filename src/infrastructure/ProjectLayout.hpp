// ProjectLayout Header
#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace bundlesync::infrastructure {

/**
 * @class ProjectLayout
 * @brief Well-known locations inside a project checkout.
 */
class ProjectLayout {
public:
    explicit ProjectLayout(const std::filesystem::path& projectRoot);

    const std::filesystem::path& root() const { return m_root; }

    std::filesystem::path packagesDir() const;
    std::filesystem::path audioDir() const;
    std::filesystem::path downloadsDir() const;
    std::filesystem::path exportsDir() const;
    std::filesystem::path ledgerPath() const;
    std::filesystem::path catalogPath() const;
    std::filesystem::path editorScriptPath() const;

    /** @brief Roots scanned for pointer files, in search order. */
    std::vector<std::filesystem::path> searchRoots() const;

    /** @brief True if at least one search root exists. */
    bool HasProjectStructure() const;

    /** @brief Creates the download and export directories. */
    bool EnsureWorkFolders() const;

private:
    std::filesystem::path m_root;
};

} // namespace bundlesync::infrastructure
