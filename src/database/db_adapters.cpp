#include "database/db_adapters.h"
#include "utils/serialize.h"
#include "utils/logger.h"
#include <stdexcept>

namespace rentledger {
namespace database {

using core::Address;
using core::AddressUtil;

static const char* PREFIX_SHARES = "shares:";
static const char* KEY_SUPPLY = "supply:shares";
static const char* PREFIX_BALANCE = "balance:";
static const char* KEY_CUSTODY = "vault:custody";

static uint64_t readAmount(const Database& db, const std::string& key) {
    auto data = db.get(key);
    if (data.empty()) return 0;
    try {
        utils::ByteBuffer buf(data);
        return buf.readUint64();
    } catch (const std::runtime_error&) {
        LOG_ERROR("unreadable amount under " + key);
        return 0;
    }
}

static std::vector<uint8_t> encodeAmount(uint64_t value) {
    utils::ByteBuffer buf;
    buf.writeUint64(value);
    return buf.data();
}

static void stageAmount(WriteBatch& batch, const std::string& key, uint64_t value) {
    if (value == 0) {
        batch.del(key);
    } else {
        batch.put(key, encodeAmount(value));
    }
}

static Result<void> commit(Database& db, WriteBatch& batch, const std::string& what) {
    if (!db.write(batch)) {
        return makeError(ErrorCode::DATABASE_ERROR, what + " failed: " + db.lastError());
    }
    return {};
}

DatabaseShareRegistry::DatabaseShareRegistry(Database& db, const Address& tokenAddress)
    : db_(db), token_(AddressUtil::normalize(tokenAddress)) {}

Address DatabaseShareRegistry::tokenAddress() const {
    return token_;
}

uint64_t DatabaseShareRegistry::balanceOf(const Address& holder) const {
    return readAmount(db_, PREFIX_SHARES + AddressUtil::normalize(holder));
}

uint64_t DatabaseShareRegistry::totalShares() const {
    return readAmount(db_, KEY_SUPPLY);
}

std::vector<Address> DatabaseShareRegistry::holders() const {
    std::vector<Address> result;
    size_t skip = std::string(PREFIX_SHARES).size();
    for (const auto& key : db_.keys(PREFIX_SHARES)) {
        result.push_back(key.substr(skip));
    }
    return result;
}

Result<void> DatabaseShareRegistry::mint(const Address& holder, uint64_t amount) {
    RENTLEDGER_CHECK(AddressUtil::isValid(holder), ErrorCode::INVALID_ADDRESS, "share holder address cannot be zero");
    RENTLEDGER_CHECK(amount > 0, ErrorCode::INVALID_AMOUNT, "mint amount must be greater than zero");
    uint64_t balance = balanceOf(holder);
    uint64_t supply = totalShares();
    RENTLEDGER_CHECK(UINT64_MAX - supply >= amount, ErrorCode::INVALID_AMOUNT, "share supply would overflow");

    WriteBatch batch;
    stageAmount(batch, PREFIX_SHARES + AddressUtil::normalize(holder), balance + amount);
    stageAmount(batch, KEY_SUPPLY, supply + amount);
    return commit(db_, batch, "share mint");
}

Result<void> DatabaseShareRegistry::burn(const Address& holder, uint64_t amount) {
    RENTLEDGER_CHECK(amount > 0, ErrorCode::INVALID_AMOUNT, "burn amount must be greater than zero");
    uint64_t balance = balanceOf(holder);
    RENTLEDGER_CHECK(balance >= amount, ErrorCode::INVALID_AMOUNT, "holder does not have enough shares");

    WriteBatch batch;
    stageAmount(batch, PREFIX_SHARES + AddressUtil::normalize(holder), balance - amount);
    stageAmount(batch, KEY_SUPPLY, totalShares() - amount);
    return commit(db_, batch, "share burn");
}

Result<void> DatabaseShareRegistry::transfer(const Address& from, const Address& to, uint64_t amount) {
    RENTLEDGER_CHECK(AddressUtil::isValid(to), ErrorCode::INVALID_ADDRESS, "share recipient address cannot be zero");
    RENTLEDGER_CHECK(amount > 0, ErrorCode::INVALID_AMOUNT, "transfer amount must be greater than zero");
    if (AddressUtil::equals(from, to)) return {};
    uint64_t fromBalance = balanceOf(from);
    RENTLEDGER_CHECK(fromBalance >= amount, ErrorCode::INVALID_AMOUNT, "holder does not have enough shares");

    WriteBatch batch;
    stageAmount(batch, PREFIX_SHARES + AddressUtil::normalize(from), fromBalance - amount);
    stageAmount(batch, PREFIX_SHARES + AddressUtil::normalize(to), balanceOf(to) + amount);
    return commit(db_, batch, "share transfer");
}

DatabaseVault::DatabaseVault(Database& db, const Address& assetAddress)
    : db_(db), asset_(AddressUtil::normalize(assetAddress)) {}

Address DatabaseVault::assetAddress() const {
    return asset_;
}

uint64_t DatabaseVault::balanceOf(const Address& account) const {
    return readAmount(db_, PREFIX_BALANCE + AddressUtil::normalize(account));
}

uint64_t DatabaseVault::custody() const {
    return readAmount(db_, KEY_CUSTODY);
}

Result<void> DatabaseVault::credit(const Address& account, uint64_t amount) {
    RENTLEDGER_CHECK(AddressUtil::isValid(account), ErrorCode::INVALID_ADDRESS, "account address cannot be zero");
    RENTLEDGER_CHECK(amount > 0, ErrorCode::INVALID_AMOUNT, "credit amount must be greater than zero");
    uint64_t balance = balanceOf(account);
    RENTLEDGER_CHECK(UINT64_MAX - balance >= amount, ErrorCode::INVALID_AMOUNT, "account balance would overflow");

    WriteBatch batch;
    stageAmount(batch, PREFIX_BALANCE + AddressUtil::normalize(account), balance + amount);
    return commit(db_, batch, "credit");
}

Result<void> DatabaseVault::transferIn(const Address& from, uint64_t amount) {
    uint64_t balance = balanceOf(from);
    if (balance < amount) {
        return makeError(ErrorCode::TRANSFER_FAILED,
                         "insufficient balance: have " + std::to_string(balance) +
                         ", need " + std::to_string(amount));
    }
    uint64_t held = custody();
    RENTLEDGER_CHECK(UINT64_MAX - held >= amount, ErrorCode::TRANSFER_FAILED, "vault custody would overflow");

    WriteBatch batch;
    stageAmount(batch, PREFIX_BALANCE + AddressUtil::normalize(from), balance - amount);
    stageAmount(batch, KEY_CUSTODY, held + amount);
    auto res = commit(db_, batch, "transfer in");
    if (res.failed()) return makeError(ErrorCode::TRANSFER_FAILED, res.error().message);
    return {};
}

Result<void> DatabaseVault::transferOut(const Address& to, uint64_t amount) {
    RENTLEDGER_CHECK(AddressUtil::isValid(to), ErrorCode::TRANSFER_FAILED, "cannot transfer to the zero address");
    uint64_t held = custody();
    if (held < amount) {
        return makeError(ErrorCode::TRANSFER_FAILED,
                         "insufficient custody: have " + std::to_string(held) +
                         ", need " + std::to_string(amount));
    }
    uint64_t balance = balanceOf(to);
    RENTLEDGER_CHECK(UINT64_MAX - balance >= amount, ErrorCode::TRANSFER_FAILED, "recipient balance would overflow");

    WriteBatch batch;
    stageAmount(batch, KEY_CUSTODY, held - amount);
    stageAmount(batch, PREFIX_BALANCE + AddressUtil::normalize(to), balance + amount);
    auto res = commit(db_, batch, "transfer out");
    if (res.failed()) return makeError(ErrorCode::TRANSFER_FAILED, res.error().message);
    return {};
}

}
}
