#include "application/CatalogWorkflow.hpp"

#include <cstddef>
#include <string>

#include "application/ExitCodes.hpp"
#include "application/RunReporter.hpp"
#include "domain/PackageConventions.hpp"
#include "infrastructure/PointerFileLocator.hpp"

namespace bundlesync::application {

namespace {
constexpr const char* kComponent = "Catalog";
}

CatalogWorkflow::CatalogWorkflow(WorkflowContext& context) : m_ctx(context) {}

bool CatalogWorkflow::regenerate() {
    infrastructure::PointerFileLocator locator(m_ctx.logger);
    auto records = locator.discover(m_ctx.layout.searchRoots());
    auto catalog = RunReporter::BuildCatalog(records, domain::kVendorDirectory);

    std::size_t linked = 0;
    for (const auto& [category, items] : catalog) linked += items.size();
    m_ctx.logger.debug(kComponent, std::to_string(linked) + " of " + std::to_string(records.size()) + " packages have links");

    return RunReporter::WriteCatalog(catalog, m_ctx.layout.catalogPath(), m_ctx.logger);
}

int CatalogWorkflow::run() {
    if (!m_ctx.layout.HasProjectStructure()) {
        m_ctx.logger.error(kComponent, "No package folders under " + m_ctx.layout.root().string());
        return kExitSetupFailure;
    }
    return regenerate() ? kExitSuccess : kExitSetupFailure;
}

} // namespace bundlesync::application
