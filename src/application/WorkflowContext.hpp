/**
 * @file WorkflowContext.hpp
 * @brief Collaborators shared by every workflow of a run.
 */

#pragma once

#include "domain/ConfirmationPageDetector.hpp"
#include "domain/ExternalTool.hpp"
#include "domain/HttpTransport.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/ProjectLayout.hpp"

namespace bundlesync::application {

/**
 * @struct WorkflowContext
 * @brief Non-owning view of the run's services. The entry point owns them and outlives the workflows.
 */
struct WorkflowContext {
    infrastructure::Logger& logger;
    infrastructure::ProjectLayout layout;
    domain::HttpTransport& http;
    domain::ExternalTool& tools;
    const domain::ConfirmationPageDetector& detector;
};

} // namespace bundlesync::application
