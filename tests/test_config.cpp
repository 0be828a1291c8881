#include "utils/config.h"
#include "utils/logger.h"
#include "infrastructure/error_handling.h"
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace rentledger;
using namespace rentledger::utils;

static std::filesystem::path makeTempDir(const std::string& name) {
    auto uniq = std::to_string(static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
    auto dir = std::filesystem::temp_directory_path() / ("rentledger_" + name + "_" + uniq);
    std::filesystem::create_directories(dir);
    return dir;
}

static void testDefaults() {
    Config& cfg = Config::instance();
    cfg.reset();
    LedgerConfig ledger = cfg.getLedgerConfig();
    assert(ledger.propertyId == 0);
    assert(ledger.gracePeriod == 30ULL * 24 * 60 * 60);
    assert(ledger.dustPolicy == "carry");
    assert(ledger.dbFile == "ledger.db");
    assert(ledger.dataDir == cfg.getDataDir());

    LogConfig log = cfg.getLogConfig();
    assert(log.level == "info");
    assert(log.file == "rentledger.log");
    assert(log.console);
    assert(log.maxFileSize == 8ULL * 1024 * 1024);
    assert(log.maxFiles == 3);
    assert(!log.showAddresses);
}

static void testLoadFile() {
    auto dir = makeTempDir("config");
    auto path = (dir / "rentledger.conf").string();
    {
        std::ofstream out(path);
        out << "# property settings\n";
        out << "ledger.property_id = 17\n";
        out << "ledger.grace_period=3600\n";
        out << "ledger.dust_policy = sweep\n";
        out << "\n";
        out << "log.level=debug\n";
        out << "log.console = off\n";
        out << "log.max_files = 7\n";
        out << "log.show_addresses = yes\n";
        out << "not a setting\n";
        out << "ledger.tags = a, b ,,c\n";
    }

    Config& cfg = Config::instance();
    cfg.reset();
    assert(cfg.load(path));
    assert(cfg.getConfigPath() == path);

    LedgerConfig ledger = cfg.getLedgerConfig();
    assert(ledger.propertyId == 17);
    assert(ledger.gracePeriod == 3600);
    assert(ledger.dustPolicy == "sweep");
    LogConfig log = cfg.getLogConfig();
    assert(log.level == "debug");
    assert(!log.console);
    assert(log.maxFiles == 7);
    assert(log.showAddresses);

    auto tags = cfg.getList("ledger.tags");
    assert(tags.size() == 3);
    assert(tags[1] == "b");
    assert(!cfg.has("not a setting"));

    assert(!cfg.load((dir / "missing.conf").string()));
    std::filesystem::remove_all(dir);
}

static void testTypedGetters() {
    Config& cfg = Config::instance();
    cfg.reset();
    cfg.set("x.count", 42);
    cfg.set("x.big", static_cast<uint64_t>(18000000000000000000ULL));
    cfg.set("x.neg", static_cast<int64_t>(-5));
    cfg.set("x.flag", true);
    cfg.set("x.word", "hello");

    assert(cfg.getInt("x.count") == 42);
    assert(cfg.getUInt64("x.big") == 18000000000000000000ULL);
    assert(cfg.getInt64("x.neg") == -5);
    assert(cfg.getUInt64("x.neg", 9) == 9);
    assert(cfg.getBool("x.flag"));
    cfg.set("x.accent", "\xC3\xA9t\xC3\xA9");
    assert(!cfg.getBool("x.accent"));
    assert(cfg.getInt("x.word", 3) == 3);
    assert(cfg.getString("x.missing", "def") == "def");

    auto keys = cfg.keys("x.");
    assert(keys.size() == 6);
    assert(keys.front() == "x.accent");

    cfg.remove("x.word");
    assert(!cfg.has("x.word"));
    cfg.reset();
    assert(!cfg.has("x.count"));
    assert(cfg.has("ledger.dust_policy"));
}

static void testSaveAndReload() {
    auto dir = makeTempDir("config_save");
    auto path = (dir / "saved.conf").string();
    Config& cfg = Config::instance();
    cfg.reset();

    LedgerConfig ledger = cfg.getLedgerConfig();
    ledger.propertyId = 99;
    ledger.dustPolicy = "sweep";
    cfg.setLedgerConfig(ledger);
    assert(cfg.save(path));

    cfg.reset();
    assert(cfg.getLedgerConfig().propertyId == 0);
    assert(cfg.load(path));
    assert(cfg.getLedgerConfig().propertyId == 99);
    assert(cfg.getLedgerConfig().dustPolicy == "sweep");
    std::filesystem::remove_all(dir);
}

static void testChangeCallback() {
    Config& cfg = Config::instance();
    cfg.reset();
    std::string lastKey;
    cfg.onChange([&lastKey](const std::string& key) { lastKey = key; });
    cfg.set("ledger.db_file", "other.db");
    assert(lastKey == "ledger.db_file");
    cfg.onChange(nullptr);
    cfg.reset();
}

static void testLoggerLevels() {
    LogLevel level;
    assert(Logger::parseLevel("WARNING", level) && level == LogLevel::WARN);
    assert(Logger::parseLevel("off", level) && level == LogLevel::OFF);
    assert(!Logger::parseLevel("loud", level));
    assert(!Logger::parseLevel("d\xC9" "bug", level));

    std::string address = "0x" + std::string(36, '0') + "beef";
    Logger::setShowAddresses(false);
    assert(Logger::redactAddress(address) == "0x0000...beef");
    assert(Logger::redactAddress("short") == "[REDACTED_ADDR]");
    Logger::setShowAddresses(true);
    assert(Logger::redactAddress(address) == address);
    Logger::setShowAddresses(false);
    assert(std::string(Logger::levelName(LogLevel::ERROR)) == "ERROR");
}

static void testLoggerWritesFile() {
    auto dir = makeTempDir("log");
    auto path = (dir / "logs" / "test.log").string();
    Logger::init(path);
    Logger::enableConsole(false);
    Logger::setLevel(LogLevel::INFO);

    LOG_CAT(LogLevel::INFO, "ledger", "round 0 finalized");
    Logger::log(LogLevel::DEBUG, "ledger", "hidden below level");
    Logger::flush();

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    std::string contents = ss.str();
    assert(contents.find("[ledger] round 0 finalized") != std::string::npos);
    assert(contents.find("hidden below level") == std::string::npos);

    auto recent = Logger::recent(1);
    assert(recent.size() == 1);
    assert(recent[0].category == "ledger");
    assert(recent[0].level == LogLevel::INFO);

    Logger::shutdown();
    Logger::enableConsole(true);
    std::filesystem::remove_all(dir);
}

static void testLoggerRotates() {
    auto dir = makeTempDir("rotate");
    auto path = (dir / "ledger.log").string();
    Logger::init(path);
    Logger::enableConsole(false);
    Logger::setLevel(LogLevel::INFO);
    Logger::setRotation(256, 2);

    for (int i = 0; i < 40; ++i) {
        Logger::info("deposit recorded for round " + std::to_string(i));
    }
    Logger::flush();
    assert(std::filesystem::exists(path));
    assert(std::filesystem::exists(path + ".1"));
    assert(std::filesystem::exists(path + ".2"));
    assert(!std::filesystem::exists(path + ".3"));
    assert(std::filesystem::file_size(path) <= 256 + 128);

    Logger::shutdown();
    Logger::setRotation(8 * 1024 * 1024, 3);
    Logger::enableConsole(true);
    std::filesystem::remove_all(dir);
}

static void testErrorHandler() {
    ErrorHandler& handler = ErrorHandler::instance();
    handler.clearErrors();
    int seen = 0;
    handler.setHandler([&seen](const Error&) { seen++; });

    handler.handle(makeError(ErrorCode::UNAUTHORIZED, "only the owner may close a round", "closeRound"));
    handler.handle(makeError(ErrorCode::UNAUTHORIZED, "only the operator may finalize a round"));
    handler.handle(makeError(ErrorCode::TRANSFER_FAILED, "insufficient custody"));

    assert(seen == 3);
    assert(handler.getErrorCount() == 3);
    assert(handler.getErrorCount(ErrorCode::UNAUTHORIZED) == 2);
    assert(handler.getLastError().code == ErrorCode::TRANSFER_FAILED);
    assert(handler.getRecentErrors(2).size() == 2);
    assert(std::string(errorCodeName(ErrorCode::GRACE_PERIOD_ACTIVE)) == "GracePeriodActive");

    handler.setHandler(nullptr);
    handler.clearErrors();
    assert(handler.getErrorCount() == 0);
}

int main() {
    std::cout << "Running config tests...\n";
    testDefaults();
    testLoadFile();
    testTypedGetters();
    testSaveAndReload();
    testChangeCallback();
    testLoggerLevels();
    testLoggerWritesFile();
    testLoggerRotates();
    testErrorHandler();
    std::cout << "All config tests passed!\n";
    return 0;
}
