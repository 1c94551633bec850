#pragma once

#include <filesystem>
#include <string>

#include "domain/ExternalTool.hpp"
#include "domain/SyncError.hpp"
#include "infrastructure/Logger.hpp"

namespace bundlesync::infrastructure {

/**
 * @class PlaceholderPackager
 * @brief Builds a stand-in artifact (a gzip tar holding a README) for packages that have
 * not been exported from the editor yet.
 */
class PlaceholderPackager {
public:
    PlaceholderPackager(domain::ExternalTool& tools, Logger& logger);

    /**
     * @brief Writes "<exportDir>/<stem>.unitypackage" for @p packageName.
     * @return Path of the created archive.
     */
    domain::Result<std::filesystem::path> create(const std::filesystem::path& exportDir,
                                                 const std::string& packageName,
                                                 const std::string& stem);

private:
    domain::ExternalTool& m_tools;
    Logger& m_logger;
};

} // namespace bundlesync::infrastructure
