#pragma once

#include "core/address.h"
#include "infrastructure/error_handling.h"
#include <vector>
#include <cstdint>

namespace rentledger {
namespace core {

// Read-only view of the property's share registry. All three queries must
// describe the same point in time when called back to back during a
// snapshot.
class ShareRegistry {
public:
    virtual ~ShareRegistry() = default;

    virtual Address tokenAddress() const = 0;
    virtual uint64_t balanceOf(const Address& holder) const = 0;
    virtual uint64_t totalShares() const = 0;
    virtual std::vector<Address> holders() const = 0;
};

// Custody of the settlement asset. A failed transfer must leave no partial
// effect behind; the ledger relies on that to roll itself back.
class StableVault {
public:
    virtual ~StableVault() = default;

    virtual Address assetAddress() const = 0;
    virtual Result<void> transferIn(const Address& from, uint64_t amount) = 0;
    virtual Result<void> transferOut(const Address& to, uint64_t amount) = 0;
};

}
}
