#pragma once

namespace bundlesync::application {

constexpr int kExitSuccess = 0;
constexpr int kExitPackageFailure = 1;   ///< At least one package ended in a failure state.
constexpr int kExitSetupFailure = 2;     ///< Missing project structure, tool or authentication.
constexpr int kExitUsage = 64;

} // namespace bundlesync::application
