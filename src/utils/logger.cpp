#include "utils/logger.h"
#include <algorithm>
#include <cctype>
#include <atomic>
#include <cstdlib>
#include <cstddef>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>

namespace rentledger {
namespace utils {

namespace {

struct Sink {
    std::mutex mtx;
    std::ofstream file;
    std::string path;
    bool console = true;
    uint64_t maxBytes = 8 * 1024 * 1024;
    uint32_t maxFiles = 3;
    std::deque<LogEntry> recent;
    size_t recentLimit = 500;
};

Sink& sink() {
    static Sink s;
    return s;
}

std::atomic<int> minLevel{static_cast<int>(LogLevel::INFO)};
std::atomic<bool> fullAddresses{false};

// Caller holds the sink mutex.
void rotateFiles(Sink& s) {
    if (s.path.empty()) return;
    s.file.close();
    std::error_code ec;
    if (s.maxFiles == 0) {
        std::filesystem::remove(s.path, ec);
    } else {
        std::filesystem::remove(s.path + "." + std::to_string(s.maxFiles), ec);
        for (uint32_t i = s.maxFiles; i > 1; --i) {
            std::string from = s.path + "." + std::to_string(i - 1);
            if (std::filesystem::exists(from, ec)) {
                std::filesystem::rename(from, s.path + "." + std::to_string(i), ec);
            }
        }
        std::filesystem::rename(s.path, s.path + ".1", ec);
    }
    s.file.open(s.path, std::ios::app);
}

void writeLine(LogLevel level, const std::string& category, const std::string& msg) {
    if (static_cast<int>(level) < minLevel.load() || level == LogLevel::OFF) return;

    time_t now = std::time(nullptr);
    std::tm tmNow{};
    localtime_r(&now, &tmNow);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tmNow);

    std::ostringstream line;
    line << stamp << " [" << Logger::levelName(level) << "]";
    if (!category.empty()) line << " [" << category << "]";
    line << " " << msg << "\n";
    std::string text = line.str();

    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.console) {
        std::ostream& out = level >= LogLevel::ERROR ? std::cerr : std::cout;
        out << text;
    }
    if (s.file.is_open()) {
        s.file << text;
        s.file.flush();
        if (static_cast<uint64_t>(s.file.tellp()) > s.maxBytes) rotateFiles(s);
    }

    s.recent.push_back(LogEntry{level, category, msg, static_cast<uint64_t>(now)});
    if (s.recent.size() > s.recentLimit) s.recent.pop_front();
}

}

void Logger::init(const std::string& path) {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.file.is_open()) s.file.close();
    s.path = path;

    std::error_code ec;
    std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
    s.file.open(path, std::ios::app);

    const char* env = std::getenv("RENTLEDGER_LOG_FULL_ADDRESSES");
    if (env && (std::string(env) == "1" || std::string(env) == "true")) fullAddresses = true;
}

void Logger::shutdown() {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.file.is_open()) {
        s.file.flush();
        s.file.close();
    }
    s.path.clear();
}

void Logger::setLevel(LogLevel level) {
    minLevel = static_cast<int>(level);
}

LogLevel Logger::getLevel() {
    return static_cast<LogLevel>(minLevel.load());
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "trace") out = LogLevel::TRACE;
    else if (n == "debug") out = LogLevel::DEBUG;
    else if (n == "info") out = LogLevel::INFO;
    else if (n == "warn" || n == "warning") out = LogLevel::WARN;
    else if (n == "error") out = LogLevel::ERROR;
    else if (n == "fatal") out = LogLevel::FATAL;
    else if (n == "off") out = LogLevel::OFF;
    else return false;
    return true;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "OFF  ";
    }
}

void Logger::enableConsole(bool enable) {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.console = enable;
}

void Logger::setRotation(uint64_t maxBytes, uint32_t maxFiles) {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.maxBytes = maxBytes;
    s.maxFiles = maxFiles;
}

void Logger::trace(const std::string& msg) { writeLine(LogLevel::TRACE, "", msg); }
void Logger::debug(const std::string& msg) { writeLine(LogLevel::DEBUG, "", msg); }
void Logger::info(const std::string& msg) { writeLine(LogLevel::INFO, "", msg); }
void Logger::warn(const std::string& msg) { writeLine(LogLevel::WARN, "", msg); }
void Logger::error(const std::string& msg) { writeLine(LogLevel::ERROR, "", msg); }
void Logger::fatal(const std::string& msg) { writeLine(LogLevel::FATAL, "", msg); }

void Logger::log(LogLevel level, const std::string& category, const std::string& msg) {
    writeLine(level, category, msg);
}

void Logger::flush() {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.file.is_open()) s.file.flush();
}

std::vector<LogEntry> Logger::recent(size_t count) {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    size_t start = s.recent.size() > count ? s.recent.size() - count : 0;
    return std::vector<LogEntry>(s.recent.begin() + static_cast<std::ptrdiff_t>(start), s.recent.end());
}

void Logger::setShowAddresses(bool show) {
    fullAddresses = show;
}

bool Logger::showAddresses() {
    return fullAddresses;
}

std::string Logger::redactAddress(const std::string& address) {
    if (fullAddresses) return address;
    if (address.size() <= 10) return "[REDACTED_ADDR]";
    return address.substr(0, 6) + "..." + address.substr(address.size() - 4);
}

}
}
