#pragma once

#include "application/WorkflowContext.hpp"

namespace bundlesync::application {

/**
 * @class CatalogWorkflow
 * @brief Regenerates the human-readable package list (PACKAGE_DOWNLOADS.md) from the pointer files.
 */
class CatalogWorkflow {
public:
    explicit CatalogWorkflow(WorkflowContext& context);

    /** @return Process exit code. */
    int run();

    /** @brief Discovers packages and writes the catalog. */
    bool regenerate();

private:
    WorkflowContext& m_ctx;
};

} // namespace bundlesync::application
