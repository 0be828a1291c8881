#pragma once

#include "core/adapters.h"
#include <map>
#include <functional>
#include <cstdint>

namespace rentledger {
namespace core {

// Registry held entirely in memory. totalShares defaults to the sum of the
// balances; setTotalShares pins it to an explicit value instead.
class InMemoryShareRegistry : public ShareRegistry {
public:
    explicit InMemoryShareRegistry(const Address& tokenAddress);

    Address tokenAddress() const override;
    uint64_t balanceOf(const Address& holder) const override;
    uint64_t totalShares() const override;
    std::vector<Address> holders() const override;

    void setBalance(const Address& holder, uint64_t balance);
    void setTotalShares(uint64_t total);
    void clearTotalShares();

private:
    Address token_;
    std::map<Address, uint64_t> balances_;
    bool pinnedTotal_ = false;
    uint64_t total_ = 0;
};

// Vault held entirely in memory. Transfers can be made to fail on demand,
// and a hook runs inside transferOut after the funds have moved, where a
// receiving party could call back into the ledger. A recipient marked with
// failTransferOutAfterHook sees the hook run and then the transfer undone.
class InMemoryVault : public StableVault {
public:
    explicit InMemoryVault(const Address& assetAddress);

    Address assetAddress() const override;
    Result<void> transferIn(const Address& from, uint64_t amount) override;
    Result<void> transferOut(const Address& to, uint64_t amount) override;

    void credit(const Address& account, uint64_t amount);
    uint64_t balanceOf(const Address& account) const;
    uint64_t custody() const { return custody_; }

    void failTransferIn(bool fail) { failIn_ = fail; }
    void failTransferOut(bool fail) { failOut_ = fail; }
    void failTransferOutAfterHook(const Address& to) { failAfterHookTo_ = AddressUtil::normalize(to); }
    void onTransferOut(std::function<void(const Address&, uint64_t)> hook) { outHook_ = hook; }

    size_t transferInCount() const { return inCount_; }
    size_t transferOutCount() const { return outCount_; }

private:
    Address asset_;
    std::map<Address, uint64_t> balances_;
    uint64_t custody_ = 0;
    bool failIn_ = false;
    bool failOut_ = false;
    Address failAfterHookTo_;
    std::function<void(const Address&, uint64_t)> outHook_;
    size_t inCount_ = 0;
    size_t outCount_ = 0;
};

}
}
