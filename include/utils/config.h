#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace rentledger {
namespace utils {

struct LedgerConfig {
    uint64_t propertyId = 0;
    uint64_t gracePeriod = 30ULL * 24 * 60 * 60;
    std::string dustPolicy = "carry";
    std::string dataDir;
    std::string dbFile = "ledger.db";
};

struct LogConfig {
    std::string level = "info";
    std::string file = "rentledger.log";
    bool console = true;
    uint64_t maxFileSize = 8ULL * 1024 * 1024;
    uint32_t maxFiles = 3;
    bool showAddresses = false;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& path);
    bool save(const std::string& path);
    bool loadDefaults();
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    uint64_t getUInt64(const std::string& key, uint64_t def = 0) const;
    bool getBool(const std::string& key, bool def = false) const;
    std::vector<std::string> getList(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, uint64_t value);
    void set(const std::string& key, bool value);

    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys(const std::string& prefix = "") const;

    LedgerConfig getLedgerConfig() const;
    LogConfig getLogConfig() const;
    void setLedgerConfig(const LedgerConfig& config);

    void onChange(std::function<void(const std::string&)> callback);

    std::string getDataDir() const;
    std::string getConfigPath() const;
    void setDataDir(const std::string& path);

    size_t size() const;

private:
    Config();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
