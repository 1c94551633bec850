#include "infrastructure/PlaceholderPackager.hpp"
#include <system_error>
#include "domain/PackageConventions.hpp"
#include "infrastructure/AtomicFileWriter.hpp"

namespace fs = std::filesystem;

namespace bundlesync::infrastructure {

namespace {
constexpr const char* kComponent = "PlaceholderPackager";
constexpr const char* kArchiveTool = "tar";
constexpr int kArchiveTimeoutSeconds = 120;
}

PlaceholderPackager::PlaceholderPackager(domain::ExternalTool& tools, Logger& logger)
    : m_tools(tools), m_logger(logger) {}

domain::Result<fs::path> PlaceholderPackager::create(const fs::path& exportDir,
                                                     const std::string& packageName,
                                                     const std::string& stem) {
    using PathResult = domain::Result<fs::path>;

    if (!m_tools.isAvailable(kArchiveTool)) {
        return PathResult::Fail(domain::ErrorKind::MissingTool, "tar not found, cannot build placeholder package");
    }

    const fs::path output = exportDir / (stem + domain::kArtifactExtension);
    const fs::path staging = exportDir / (".placeholder_" + stem);

    m_logger.info(kComponent, "Creating placeholder for " + packageName);

    std::string error;
    if (!AtomicFileWriter::Write(staging / "README.txt",
                                 "Placeholder for " + packageName + "\nExport with Unity to get actual package\n",
                                 error)) {
        return PathResult::Fail(domain::ErrorKind::WriteFailed, error);
    }

    auto result = m_tools.run({kArchiveTool, {"-czf", output.string(), "-C", staging.string(), "README.txt"},
                               kArchiveTimeoutSeconds});

    std::error_code ec;
    fs::remove_all(staging, ec);

    if (!result.succeeded()) {
        fs::remove(output, ec);
        return PathResult::Fail(domain::ErrorKind::ExportFailed, "tar failed: " + result.output);
    }
    if (!fs::is_regular_file(output, ec)) {
        return PathResult::Fail(domain::ErrorKind::ExportFailed, "tar produced no archive at " + output.string());
    }
    return PathResult::Ok(output);
}

} // namespace bundlesync::infrastructure
