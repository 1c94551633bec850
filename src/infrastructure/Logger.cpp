#include "infrastructure/Logger.hpp"
#include "infrastructure/Timestamps.hpp"

namespace bundlesync::infrastructure {

namespace {

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

} // namespace

Logger::Logger(std::ostream& out, std::ostream& err, LogLevel minLevel)
    : m_out(out), m_err(err), m_minLevel(minLevel) {}

void Logger::debug(const std::string& component, const std::string& message) {
    write(LogLevel::Debug, component, message);
}

void Logger::info(const std::string& component, const std::string& message) {
    write(LogLevel::Info, component, message);
}

void Logger::warn(const std::string& component, const std::string& message) {
    write(LogLevel::Warning, component, message);
}

void Logger::error(const std::string& component, const std::string& message) {
    write(LogLevel::Error, component, message);
}

void Logger::write(LogLevel level, const std::string& component, const std::string& message) {
    if (level < m_minLevel) return;

    std::ostream& os = (level >= LogLevel::Warning) ? m_err : m_out;
    os << Timestamps::NowHuman() << " - " << LevelName(level) << " - [" << component << "] "
       << message << std::endl;
}

} // namespace bundlesync::infrastructure
