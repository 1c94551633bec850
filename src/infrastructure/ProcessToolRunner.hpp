/**
 * @file ProcessToolRunner.hpp
 * @brief ExternalTool adapter that launches host processes through the shell.
 */

#pragma once

#include "domain/ExternalTool.hpp"

namespace bundlesync::infrastructure {

/**
 * @class ProcessToolRunner
 * @brief Runs utilities with popen, capturing combined stdout/stderr.
 *
 * Arguments are single-quoted before reaching the shell. A positive timeout is enforced by
 * wrapping the command in coreutils @c timeout; exit status 124 is reported as a timeout.
 */
class ProcessToolRunner : public domain::ExternalTool {
public:
    bool isAvailable(const std::string& program) override;
    domain::ToolResult run(const domain::ToolInvocation& invocation) override;

    /** @brief Quotes one argument for a POSIX shell. */
    static std::string ShellQuote(const std::string& arg);
};

} // namespace bundlesync::infrastructure
