#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace rentledger {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    uint64_t timestamp;
};

// Process-wide log sink. Lines go to the console (ERROR and above on
// stderr) and, once init() has been called, to a size-rotated file.
class Logger {
public:
    static void init(const std::string& path);
    static void shutdown();

    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool parseLevel(const std::string& name, LogLevel& out);
    static const char* levelName(LogLevel level);

    static void enableConsole(bool enable);
    // Keeps at most maxFiles rotated copies (path.1 ... path.N).
    static void setRotation(uint64_t maxBytes, uint32_t maxFiles);

    static void trace(const std::string& msg);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void fatal(const std::string& msg);
    static void log(LogLevel level, const std::string& category, const std::string& msg);

    static void flush();
    static std::vector<LogEntry> recent(size_t count = 50);

    static void setShowAddresses(bool show);
    static bool showAddresses();
    // Shortens holder and role addresses unless full addresses are enabled.
    static std::string redactAddress(const std::string& address);
};

#define LOG_TRACE(msg) rentledger::utils::Logger::trace(msg)
#define LOG_DEBUG(msg) do { if (rentledger::utils::Logger::getLevel() <= rentledger::utils::LogLevel::DEBUG) rentledger::utils::Logger::debug(msg); } while(0)
#define LOG_INFO(msg) rentledger::utils::Logger::info(msg)
#define LOG_WARN(msg) rentledger::utils::Logger::warn(msg)
#define LOG_ERROR(msg) rentledger::utils::Logger::error(msg)
#define LOG_CAT(level, category, msg) rentledger::utils::Logger::log(level, category, msg)

}
}
