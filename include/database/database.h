#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace rentledger {
namespace database {

class WriteBatch {
public:
    WriteBatch();
    ~WriteBatch();
    void put(const std::string& key, const std::vector<uint8_t>& value);
    void del(const std::string& key);
    void delPrefix(const std::string& prefix);
    void clear();
    size_t size() const;
private:
    friend class Database;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Key/value store on a single sqlite table. Writes made between
// beginTransaction() and commitTransaction() land together or not at all.
class Database {
public:
    Database();
    ~Database();

    bool open(const std::string& path);
    void close();
    bool isOpen() const;

    bool put(const std::string& key, const std::vector<uint8_t>& value);
    bool put(const std::string& key, const std::string& value);
    std::vector<uint8_t> get(const std::string& key) const;
    std::string getString(const std::string& key) const;
    bool del(const std::string& key);
    bool exists(const std::string& key) const;

    // Applies every put and delete of the batch atomically. Joins an outer
    // transaction when one is already open.
    bool write(WriteBatch& batch);

    void forEach(const std::string& prefix, std::function<bool(const std::string&, const std::vector<uint8_t>&)> fn) const;
    std::vector<std::string> keys(const std::string& prefix = "") const;
    size_t count(const std::string& prefix = "") const;

    std::string getPath() const;
    std::string lastError() const;

    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();
    bool inTransaction() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
