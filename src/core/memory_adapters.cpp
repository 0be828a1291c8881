#include "core/memory_adapters.h"

namespace rentledger {
namespace core {

InMemoryShareRegistry::InMemoryShareRegistry(const Address& tokenAddress)
    : token_(AddressUtil::normalize(tokenAddress)) {}

Address InMemoryShareRegistry::tokenAddress() const {
    return token_;
}

uint64_t InMemoryShareRegistry::balanceOf(const Address& holder) const {
    auto it = balances_.find(AddressUtil::normalize(holder));
    return it != balances_.end() ? it->second : 0;
}

uint64_t InMemoryShareRegistry::totalShares() const {
    if (pinnedTotal_) return total_;
    uint64_t sum = 0;
    for (const auto& entry : balances_) sum += entry.second;
    return sum;
}

std::vector<Address> InMemoryShareRegistry::holders() const {
    std::vector<Address> result;
    for (const auto& entry : balances_) result.push_back(entry.first);
    return result;
}

void InMemoryShareRegistry::setBalance(const Address& holder, uint64_t balance) {
    Address key = AddressUtil::normalize(holder);
    if (balance == 0) {
        balances_.erase(key);
    } else {
        balances_[key] = balance;
    }
}

void InMemoryShareRegistry::setTotalShares(uint64_t total) {
    pinnedTotal_ = true;
    total_ = total;
}

void InMemoryShareRegistry::clearTotalShares() {
    pinnedTotal_ = false;
    total_ = 0;
}

InMemoryVault::InMemoryVault(const Address& assetAddress)
    : asset_(AddressUtil::normalize(assetAddress)) {}

Address InMemoryVault::assetAddress() const {
    return asset_;
}

Result<void> InMemoryVault::transferIn(const Address& from, uint64_t amount) {
    if (failIn_) return makeError(ErrorCode::TRANSFER_FAILED, "transfer in refused");
    Address key = AddressUtil::normalize(from);
    uint64_t balance = balanceOf(key);
    if (balance < amount) {
        return makeError(ErrorCode::TRANSFER_FAILED, "insufficient balance");
    }
    balances_[key] = balance - amount;
    custody_ += amount;
    inCount_++;
    return {};
}

Result<void> InMemoryVault::transferOut(const Address& to, uint64_t amount) {
    if (failOut_) return makeError(ErrorCode::TRANSFER_FAILED, "transfer out refused");
    if (custody_ < amount) {
        return makeError(ErrorCode::TRANSFER_FAILED, "insufficient custody");
    }
    Address key = AddressUtil::normalize(to);
    uint64_t balance = balanceOf(key);
    if (UINT64_MAX - balance < amount) {
        return makeError(ErrorCode::TRANSFER_FAILED, "recipient balance would overflow");
    }
    custody_ -= amount;
    balances_[key] = balance + amount;
    outCount_++;
    auto hook = outHook_;
    if (hook) hook(key, amount);
    if (!failAfterHookTo_.empty() && key == failAfterHookTo_) {
        balances_[key] -= amount;
        custody_ += amount;
        outCount_--;
        return makeError(ErrorCode::TRANSFER_FAILED, "transfer out reverted by recipient");
    }
    return {};
}

void InMemoryVault::credit(const Address& account, uint64_t amount) {
    balances_[AddressUtil::normalize(account)] += amount;
}

uint64_t InMemoryVault::balanceOf(const Address& account) const {
    auto it = balances_.find(AddressUtil::normalize(account));
    return it != balances_.end() ? it->second : 0;
}

}
}
