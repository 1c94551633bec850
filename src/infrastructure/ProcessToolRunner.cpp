#include "infrastructure/ProcessToolRunner.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <sys/wait.h>

namespace bundlesync::infrastructure {

namespace {

constexpr int kTimeoutExitStatus = 124;

bool HasTimeoutUtility() {
    static const bool available = std::system("command -v timeout >/dev/null 2>&1") == 0;
    return available;
}

} // namespace

std::string ProcessToolRunner::ShellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

bool ProcessToolRunner::isAvailable(const std::string& program) {
    // An explicit path (e.g. an editor binary) only needs to exist.
    if (program.find('/') != std::string::npos) {
        std::error_code ec;
        return std::filesystem::exists(program, ec);
    }
    std::string cmd = "command -v " + ShellQuote(program) + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

domain::ToolResult ProcessToolRunner::run(const domain::ToolInvocation& invocation) {
    domain::ToolResult result;

    std::stringstream cmd;
    bool wrapped = invocation.timeoutSeconds > 0 && HasTimeoutUtility();
    if (wrapped) {
        cmd << "timeout " << invocation.timeoutSeconds << " ";
    }
    cmd << ShellQuote(invocation.program);
    for (const auto& arg : invocation.arguments) {
        cmd << " " << ShellQuote(arg);
    }
    cmd << " 2>&1";

    FILE* pipe = popen(cmd.str().c_str(), "r");
    if (!pipe) {
        result.output = "popen failed to start command";
        return result;
    }
    result.launched = true;

    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        result.output.append(buffer);
    }
    int status = pclose(pipe);

    if (status == -1) {
        result.exitCode = -1;
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else {
        result.exitCode = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    // The shell reports 127 when the program itself cannot be found.
    if (result.exitCode == 127) {
        result.launched = false;
    }
    if (wrapped && result.exitCode == kTimeoutExitStatus) {
        result.timedOut = true;
    }
    return result;
}

} // namespace bundlesync::infrastructure
