/**
 * @file BundleSyncApp.cpp
 * @brief Implementation of the BundleSyncApp class.
 */

#include "app/BundleSyncApp.hpp"

#include <cmath>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "application/CatalogWorkflow.hpp"
#include "application/DownloadWorkflow.hpp"
#include "application/ExitCodes.hpp"
#include "application/ExportWorkflow.hpp"
#include "application/SyncWorkflow.hpp"
#include "application/VerifyWorkflow.hpp"
#include "application/WorkflowContext.hpp"
#include "domain/PackageConventions.hpp"
#include "infrastructure/EditorExporter.hpp"
#include "infrastructure/HttplibTransport.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/ProcessToolRunner.hpp"
#include "infrastructure/ScanWarningPageDetector.hpp"

#ifndef BUNDLESYNC_VERSION
#define BUNDLESYNC_VERSION "dev"
#endif

namespace bundlesync::app {

namespace {

const std::set<std::string> kCommands = {"download", "sync", "export", "verify", "catalog"};

// Returns the option that is not valid for cmd.command, if any.
std::optional<std::string> FindMisplacedOption(const CommandLine& cmd) {
    const std::string& c = cmd.command;
    if (cmd.verifyOnly && c != "download") return std::string("--verify-only");
    if (cmd.maxSizeBytes && c != "download") return std::string("--max-size");
    if (cmd.dryRun && c != "sync" && c != "export") return std::string("--dry-run");
    if (cmd.noPlaceholders && c != "sync") return std::string("--no-placeholders");
    if (cmd.listOnly && c != "sync") return std::string("--list-only");
    if (cmd.unityPath && c != "export") return std::string("--unity-path");
    if (cmd.skipUpload && c != "export") return std::string("--skip-upload");
    if (cmd.purgeCorrupted && c != "verify") return std::string("--purge-corrupted");
    if (!cmd.packages.empty() && (c == "verify" || c == "catalog")) return std::string("--packages");
    return std::nullopt;
}

} // namespace

BundleSyncApp::BundleSyncApp(std::ostream& out, std::ostream& err) : m_out(out), m_err(err) {}

std::string BundleSyncApp::Usage() {
    std::stringstream ss;
    ss << "BundleSync " << BUNDLESYNC_VERSION << "\n"
       << "Usage: bundlesync <download|sync|export|verify|catalog> [options]\n\n"
       << "Commands:\n"
       << "  download   Fetch every linked package into PackageDownloads/\n"
       << "  sync       Upload packages without a link and update their pointer files\n"
       << "  export     Export packages from the Unity editor in batch mode\n"
       << "  verify     Check downloaded packages for corruption\n"
       << "  catalog    Regenerate PACKAGE_DOWNLOADS.md\n\n"
       << "Options:\n"
       << "  --project-path <dir>   Project root (default: current directory)\n"
       << "  --packages <name>...   Only process the named packages\n"
       << "  --verify-only          download: only verify existing downloads\n"
       << "  --max-size <GB>        download: maximum artifact size (default: 5)\n"
       << "  --dry-run              sync, export: show what would be done\n"
       << "  --no-placeholders      sync: do not create placeholder packages\n"
       << "  --list-only            sync: only regenerate the package list\n"
       << "  --unity-path <file>    export: editor binary (or set UNITY_PATH)\n"
       << "  --skip-upload          export: do not upload exported packages\n"
       << "  --purge-corrupted      verify: delete corrupted packages\n"
       << "  --verbose              Debug logging\n"
       << "  --help                 Show this help\n";
    return ss.str();
}

std::optional<CommandLine> BundleSyncApp::ParseArguments(const std::vector<std::string>& args, std::string& error) {
    CommandLine cmd;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto takeValue = [&](std::string& value) {
            if (i + 1 >= args.size() || args[i + 1].rfind("--", 0) == 0) {
                error = arg + " requires a value";
                return false;
            }
            value = args[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else if (arg == "--project-path") {
            std::string value;
            if (!takeValue(value)) return std::nullopt;
            cmd.projectPath = value;
        } else if (arg == "--packages") {
            while (i + 1 < args.size() && args[i + 1].rfind("--", 0) != 0) {
                cmd.packages.push_back(args[++i]);
            }
            if (cmd.packages.empty()) {
                error = "--packages requires at least one name";
                return std::nullopt;
            }
        } else if (arg == "--max-size") {
            std::string value;
            if (!takeValue(value)) return std::nullopt;
            double gigabytes = 0.0;
            try {
                std::size_t used = 0;
                gigabytes = std::stod(value, &used);
                if (used != value.size()) throw std::invalid_argument(value);
            } catch (const std::invalid_argument&) {
                error = "--max-size expects a number, got '" + value + "'";
                return std::nullopt;
            } catch (const std::out_of_range&) {
                error = "--max-size out of range: " + value;
                return std::nullopt;
            }
            if (!std::isfinite(gigabytes)) {
                error = "--max-size must be a finite number";
                return std::nullopt;
            }
            if (gigabytes <= 0.0) {
                error = "--max-size must be positive";
                return std::nullopt;
            }
            const double bytesPerGB = static_cast<double>(domain::kBytesPerGB);
            if (gigabytes >= static_cast<double>(std::numeric_limits<std::uintmax_t>::max()) / bytesPerGB) {
                error = "--max-size too large: " + value;
                return std::nullopt;
            }
            const auto bytes = static_cast<std::uintmax_t>(gigabytes * bytesPerGB);
            if (bytes == 0) {
                error = "--max-size too small: " + value;
                return std::nullopt;
            }
            cmd.maxSizeBytes = bytes;
        } else if (arg == "--unity-path") {
            std::string value;
            if (!takeValue(value)) return std::nullopt;
            cmd.unityPath = std::filesystem::path(value);
        } else if (arg == "--verify-only") {
            cmd.verifyOnly = true;
        } else if (arg == "--dry-run") {
            cmd.dryRun = true;
        } else if (arg == "--no-placeholders") {
            cmd.noPlaceholders = true;
        } else if (arg == "--list-only") {
            cmd.listOnly = true;
        } else if (arg == "--skip-upload") {
            cmd.skipUpload = true;
        } else if (arg == "--purge-corrupted") {
            cmd.purgeCorrupted = true;
        } else if (arg == "--verbose") {
            cmd.verbose = true;
        } else if (arg.rfind("-", 0) == 0) {
            error = "Unknown option: " + arg;
            return std::nullopt;
        } else if (cmd.command.empty()) {
            if (!kCommands.count(arg)) {
                error = "Unknown command: " + arg;
                return std::nullopt;
            }
            cmd.command = arg;
        } else {
            error = "Unexpected argument: " + arg;
            return std::nullopt;
        }
    }

    if (cmd.help) return cmd;

    if (cmd.command.empty()) {
        error = "Missing command";
        return std::nullopt;
    }
    if (auto misplaced = FindMisplacedOption(cmd)) {
        error = *misplaced + " is not valid for '" + cmd.command + "'";
        return std::nullopt;
    }
    if (cmd.projectPath.empty()) {
        std::error_code ec;
        cmd.projectPath = std::filesystem::current_path(ec);
        if (ec) {
            error = "Cannot determine the current directory: " + ec.message();
            return std::nullopt;
        }
    }
    return cmd;
}

int BundleSyncApp::Run(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    std::string error;
    auto cmd = ParseArguments(args, error);
    if (!cmd) {
        m_err << "bundlesync: " << error << "\n\n" << Usage();
        return application::kExitUsage;
    }
    if (cmd->help) {
        m_out << Usage();
        return application::kExitSuccess;
    }
    return Dispatch(*cmd);
}

int BundleSyncApp::Dispatch(const CommandLine& cmd) {
    infrastructure::Logger logger(m_out, m_err,
                                  cmd.verbose ? infrastructure::LogLevel::Debug : infrastructure::LogLevel::Info);
    infrastructure::ProcessToolRunner tools;
    infrastructure::HttplibTransport http;
    infrastructure::ScanWarningPageDetector detector;

    application::WorkflowContext context{logger, infrastructure::ProjectLayout(cmd.projectPath), http, tools, detector};
    logger.debug("BundleSyncApp", "Project: " + context.layout.root().string());

    if (cmd.command == "download") {
        application::DownloadOptions options;
        options.packages = cmd.packages;
        options.verifyOnly = cmd.verifyOnly;
        options.maxSizeBytes = cmd.maxSizeBytes.value_or(domain::kDefaultMaxArtifactBytes);
        return application::DownloadWorkflow(context).run(options);
    }
    if (cmd.command == "sync") {
        application::SyncOptions options;
        options.packages = cmd.packages;
        options.dryRun = cmd.dryRun;
        options.usePlaceholders = !cmd.noPlaceholders;
        options.listOnly = cmd.listOnly;
        return application::SyncWorkflow(context).run(options);
    }
    if (cmd.command == "export") {
        application::ExportOptions options;
        options.packages = cmd.packages;
        options.dryRun = cmd.dryRun;
        options.editorPath = cmd.unityPath;
        options.skipUpload = cmd.skipUpload;
        return application::ExportWorkflow(context, infrastructure::EditorExporter::DefaultInstallLocations()).run(options);
    }
    if (cmd.command == "verify") {
        application::VerifyOptions options;
        options.purgeCorrupted = cmd.purgeCorrupted;
        return application::VerifyWorkflow(context).run(options);
    }
    return application::CatalogWorkflow(context).run();
}

} // namespace bundlesync::app
