/**
 * @file Logger.hpp
 * @brief Console logger handed explicitly to every component of a run.
 */

#pragma once

#include <iostream>
#include <string>

namespace bundlesync::infrastructure {

enum class LogLevel { Debug, Info, Warning, Error };

/**
 * @class Logger
 * @brief Writes "<time> - LEVEL - [Component] message" lines.
 *
 * Debug/info go to the output stream, warnings/errors to the error stream. The entry
 * point owns the instance and passes it by reference; there is no global logger.
 */
class Logger {
public:
    explicit Logger(std::ostream& out = std::cout, std::ostream& err = std::cerr,
                    LogLevel minLevel = LogLevel::Info);

    void setMinLevel(LogLevel level) { m_minLevel = level; }

    void debug(const std::string& component, const std::string& message);
    void info(const std::string& component, const std::string& message);
    void warn(const std::string& component, const std::string& message);
    void error(const std::string& component, const std::string& message);

private:
    void write(LogLevel level, const std::string& component, const std::string& message);

    std::ostream& m_out;
    std::ostream& m_err;
    LogLevel m_minLevel;
};

} // namespace bundlesync::infrastructure
