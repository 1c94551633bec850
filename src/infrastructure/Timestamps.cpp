#include "infrastructure/Timestamps.hpp"
#include <chrono>
#include <ctime>

namespace bundlesync::infrastructure {

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

std::string FormatNow(const char* format) {
    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = ToLocalTime(tt);
    char buf[64];
    std::strftime(buf, sizeof(buf), format, &tm);
    return buf;
}

} // namespace

std::string Timestamps::NowIso8601() {
    return FormatNow("%Y-%m-%dT%H:%M:%S");
}

std::string Timestamps::NowCompact() {
    return FormatNow("%Y%m%d_%H%M%S");
}

std::string Timestamps::NowHuman() {
    return FormatNow("%Y-%m-%d %H:%M:%S");
}

std::string Timestamps::PlatformName() {
#if defined(_WIN32)
    return "Windows";
#elif defined(__APPLE__)
    return "Darwin";
#else
    return "Linux";
#endif
}

} // namespace bundlesync::infrastructure
