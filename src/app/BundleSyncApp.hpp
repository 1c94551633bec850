/**
 * @file BundleSyncApp.hpp
 * @brief Command-line front end for BundleSync.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace bundlesync::app {

/**
 * @struct CommandLine
 * @brief Parsed invocation: one subcommand plus its options.
 */
struct CommandLine {
    std::string command;                  ///< download, sync, export, verify or catalog.
    std::filesystem::path projectPath;    ///< Defaults to the working directory.
    std::vector<std::string> packages;
    std::optional<std::uintmax_t> maxSizeBytes;
    std::optional<std::filesystem::path> unityPath;
    bool verifyOnly = false;
    bool dryRun = false;
    bool noPlaceholders = false;
    bool listOnly = false;
    bool skipUpload = false;
    bool purgeCorrupted = false;
    bool verbose = false;
    bool help = false;
};

/**
 * @class BundleSyncApp
 * @brief Owns the logger and the production adapters for one invocation and dispatches to a workflow.
 */
class BundleSyncApp {
public:
    explicit BundleSyncApp(std::ostream& out = std::cout, std::ostream& err = std::cerr);

    /**
     * @brief Parses @p argc/@p argv and runs the selected workflow.
     * @return 0 success, 1 package failures, 2 setup failure, 64 usage error.
     */
    int Run(int argc, char** argv);

    /**
     * @brief Parses the arguments that follow the program name.
     * @param error Receives the reason when nullopt is returned.
     */
    static std::optional<CommandLine> ParseArguments(const std::vector<std::string>& args, std::string& error);

    static std::string Usage();

private:
    int Dispatch(const CommandLine& cmd);

    std::ostream& m_out;
    std::ostream& m_err;
};

} // namespace bundlesync::app
