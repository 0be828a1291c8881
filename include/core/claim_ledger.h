#pragma once

#include "core/address.h"
#include "core/adapters.h"
#include "infrastructure/error_handling.h"
#include <map>
#include <set>
#include <functional>
#include <cstdint>

namespace rentledger {
namespace core {

// Claim records keyed by (round, holder). A record is set before the payout
// leaves the vault and cleared again only if that same payout fails.
class ClaimLedger {
public:
    struct Effects {
        std::function<void()> apply;
        std::function<void()> revert;
    };

    bool isClaimed(uint64_t roundId, const Address& holder) const;
    size_t claimCount(uint64_t roundId) const;
    std::set<Address> claimedHolders(uint64_t roundId) const;
    const std::map<uint64_t, std::set<Address>>& records() const { return records_; }

    // Marks the claim, applies the caller's bookkeeping, then pays through
    // the vault. A reentrant claim for the same key made from inside the
    // transfer sees the record already set. On transfer failure the
    // bookkeeping is reverted and the record cleared.
    Result<uint64_t> payout(uint64_t roundId, const Address& holder, uint64_t entitlement,
                            StableVault& vault, const Effects& effects);

    // Loads a persisted record without paying anything.
    void restore(uint64_t roundId, const Address& holder);

private:
    std::map<uint64_t, std::set<Address>> records_;
};

}
}
