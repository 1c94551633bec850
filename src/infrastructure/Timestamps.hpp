// Timestamps Header
#pragma once
#include <string>

namespace bundlesync::infrastructure {

class Timestamps {
public:
    /** @brief "2026-10-17T14:03:09" (local time). Used in the ledger and reports. */
    static std::string NowIso8601();

    /** @brief "20261017_140309". Used as a filename suffix. */
    static std::string NowCompact();

    /** @brief "2026-10-17 14:03:09". Used in log lines and generated text files. */
    static std::string NowHuman();

    /** @brief Host operating system family ("Linux", "Darwin", "Windows"). */
    static std::string PlatformName();
};

} // namespace bundlesync::infrastructure
