#include "application/VerifyWorkflow.hpp"

#include "application/ExitCodes.hpp"
#include "infrastructure/ArtifactVerifier.hpp"

namespace bundlesync::application {

namespace {
constexpr const char* kComponent = "Verify";
}

VerifyWorkflow::VerifyWorkflow(WorkflowContext& context) : m_ctx(context) {}

int VerifyWorkflow::run(const VerifyOptions& options) {
    auto& log = m_ctx.logger;
    infrastructure::ArtifactVerifier verifier(log);
    auto report = verifier.verify(m_ctx.layout.downloadsDir());

    log.info(kComponent, std::to_string(report.valid.size()) + " valid, " +
                             std::to_string(report.corrupted.size()) + " corrupted, " +
                             std::to_string(report.unverifiable.size()) + " unverifiable");

    std::size_t remaining = report.corrupted.size();
    if (options.purgeCorrupted && remaining > 0) {
        remaining -= verifier.purgeCorrupted(report);
        if (remaining > 0) {
            log.warn(kComponent, std::to_string(remaining) + " corrupted packages could not be removed");
        }
    }

    return remaining == 0 ? kExitSuccess : kExitPackageFailure;
}

} // namespace bundlesync::application
