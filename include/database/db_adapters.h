#pragma once

#include "core/adapters.h"
#include "database/database.h"
#include "infrastructure/error_handling.h"
#include <vector>
#include <cstdint>

namespace rentledger {
namespace database {

// Share registry kept in the ledger's own database:
//   shares:<holder>   holder balance
//   supply:shares     total issued shares
class DatabaseShareRegistry : public core::ShareRegistry {
public:
    DatabaseShareRegistry(Database& db, const core::Address& tokenAddress);

    core::Address tokenAddress() const override;
    uint64_t balanceOf(const core::Address& holder) const override;
    uint64_t totalShares() const override;
    std::vector<core::Address> holders() const override;

    Result<void> mint(const core::Address& holder, uint64_t amount);
    Result<void> burn(const core::Address& holder, uint64_t amount);
    Result<void> transfer(const core::Address& from, const core::Address& to, uint64_t amount);

private:
    Database& db_;
    core::Address token_;
};

// Settlement asset ledger kept in the same database:
//   balance:<address>  spendable balance of an account
//   vault:custody      amount held on behalf of the distributor
class DatabaseVault : public core::StableVault {
public:
    DatabaseVault(Database& db, const core::Address& assetAddress);

    core::Address assetAddress() const override;
    Result<void> transferIn(const core::Address& from, uint64_t amount) override;
    Result<void> transferOut(const core::Address& to, uint64_t amount) override;

    uint64_t balanceOf(const core::Address& account) const;
    uint64_t custody() const;
    // Credits an external account, standing in for an inbound bank or
    // on-chain transfer.
    Result<void> credit(const core::Address& account, uint64_t amount);

private:
    Database& db_;
    core::Address asset_;
};

}
}
