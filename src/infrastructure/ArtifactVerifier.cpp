#include "infrastructure/ArtifactVerifier.hpp"
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace bundlesync::infrastructure {

namespace {
constexpr const char* kComponent = "Verifier";
}

ArtifactVerifier::ArtifactVerifier(Logger& logger, std::string extension, std::uintmax_t minimumBytes)
    : m_logger(logger), m_extension(std::move(extension)), m_minimumBytes(minimumBytes) {}

VerificationReport ArtifactVerifier::verify(const fs::path& cacheDir) const {
    VerificationReport report;

    std::error_code ec;
    if (!fs::is_directory(cacheDir, ec)) {
        return report;
    }

    std::vector<fs::path> candidates;
    for (fs::directory_iterator it(cacheDir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == m_extension) {
            candidates.push_back(it->path());
        }
    }
    if (ec) {
        m_logger.warn(kComponent, "Error while listing " + cacheDir.string() + ": " + ec.message());
    }
    std::sort(candidates.begin(), candidates.end());

    for (const auto& file : candidates) {
        std::error_code statEc;
        auto size = fs::file_size(file, statEc);
        if (statEc) {
            m_logger.warn(kComponent, "Could not verify " + file.filename().string() + ": " + statEc.message());
            report.unverifiable.push_back(file);
            continue;
        }
        if (size > m_minimumBytes) {
            report.valid.push_back(file);
        } else {
            m_logger.warn(kComponent, "Package too small, might be corrupted: " + file.filename().string());
            report.corrupted.push_back(file);
        }
    }

    return report;
}

std::size_t ArtifactVerifier::purgeCorrupted(const VerificationReport& report) const {
    std::size_t removed = 0;
    for (const auto& file : report.corrupted) {
        std::error_code ec;
        if (fs::remove(file, ec)) {
            ++removed;
            m_logger.info(kComponent, "Removed corrupted package: " + file.filename().string());
        } else if (ec) {
            m_logger.warn(kComponent, "Could not remove " + file.filename().string() + ": " + ec.message());
        }
    }
    return removed;
}

} // namespace bundlesync::infrastructure
