/**
 * @file ExternalTool.hpp
 * @brief Interface for invoking external command-line utilities.
 */

#pragma once

#include <string>
#include <vector>

namespace bundlesync::domain {

/**
 * @struct ToolInvocation
 * @brief A single process launch. Arguments are passed verbatim, never shell-interpreted.
 */
struct ToolInvocation {
    std::string program;
    std::vector<std::string> arguments;
    int timeoutSeconds = 0; ///< 0 means no limit.
};

/**
 * @struct ToolResult
 * @brief Exit status and combined stdout/stderr of a finished process.
 */
struct ToolResult {
    int exitCode = -1;
    std::string output;
    bool launched = false;
    bool timedOut = false;

    bool succeeded() const { return launched && !timedOut && exitCode == 0; }
};

/**
 * @class ExternalTool
 * @brief Capability used by the fetcher, uploader, exporter and packager to reach the host's
 * utilities. The real adapter spawns processes; tests supply a scripted fake.
 */
class ExternalTool {
public:
    virtual ~ExternalTool() = default;

    /** @brief Whether @p program can be resolved on the host. */
    virtual bool isAvailable(const std::string& program) = 0;

    /** @brief Runs the process to completion (or timeout). */
    virtual ToolResult run(const ToolInvocation& invocation) = 0;
};

} // namespace bundlesync::domain
