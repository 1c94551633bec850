#pragma once

#include <filesystem>
#include <string>

namespace bundlesync::infrastructure {

/**
 * @class PointerFileWriter
 * @brief Rewrites a package's pointer file so it carries a freshly published link.
 */
class PointerFileWriter {
public:
    /** @brief Full pointer-file text for a package. */
    static std::string Render(const std::string& link, const std::string& packageName, const std::string& updatedAt);

    /**
     * @brief Atomically replaces @p pointerFile with the rendered text.
     * @param error Receives the reason on failure.
     */
    static bool Rewrite(const std::filesystem::path& pointerFile,
                        const std::string& link,
                        const std::string& packageName,
                        std::string& error);
};

} // namespace bundlesync::infrastructure
