#pragma once

#include "application/WorkflowContext.hpp"

namespace bundlesync::application {

struct VerifyOptions {
    bool purgeCorrupted = false;
};

/**
 * @class VerifyWorkflow
 * @brief Reports on the download cache and optionally deletes corrupted artifacts.
 */
class VerifyWorkflow {
public:
    explicit VerifyWorkflow(WorkflowContext& context);

    /** @return 0 when no corrupted artifact remains in the cache, 1 otherwise. */
    int run(const VerifyOptions& options);

private:
    WorkflowContext& m_ctx;
};

} // namespace bundlesync::application
