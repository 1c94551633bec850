/**
 * @file AtomicFileWriter.hpp
 * @brief Synchronous temp-then-rename file writes.
 */

#pragma once
#include <filesystem>
#include <string>

namespace bundlesync::infrastructure {

/**
 * @class AtomicFileWriter
 * @brief Writes a file so that readers only ever see the old content or the complete new content.
 *
 * The content is written to "<target>.<ticks>.tmp" in the same directory and renamed over
 * the target. On any failure the temp file is removed and the target is left untouched.
 */
class AtomicFileWriter {
public:
    /**
     * @brief Writes @p content to @p target, creating parent directories as needed.
     * @param error Receives a description of the failure, if any.
     * @return True if the target now holds exactly @p content.
     */
    static bool Write(const std::filesystem::path& target, const std::string& content, std::string& error);
};

} // namespace bundlesync::infrastructure
