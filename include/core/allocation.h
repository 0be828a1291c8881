#pragma once

#include "core/address.h"
#include "core/adapters.h"
#include "infrastructure/error_handling.h"
#include <map>
#include <string>
#include <cstdint>

namespace rentledger {
namespace core {

enum class DustPolicy : uint8_t {
    CARRY_FORWARD = 0,
    SWEEP_TO_TREASURY = 1
};

const char* dustPolicyToString(DustPolicy policy);
bool parseDustPolicy(const std::string& name, DustPolicy& out);

// Holder balances captured once at finalization. Zero balances are not kept.
struct ShareSnapshot {
    std::map<Address, uint64_t> balances;
    uint64_t totalShares = 0;
    uint64_t takenAt = 0;

    uint64_t balanceOf(const Address& holder) const;
    uint64_t sumOfBalances() const;
};

struct Allocation {
    std::map<Address, uint64_t> entitlements;
    uint64_t pool = 0;
    uint64_t totalEntitled = 0;
    uint64_t remainder = 0;
};

class AllocationCalculator {
public:
    // floor(pool * shareBalance / totalShares) with a 128-bit intermediate.
    static Result<uint64_t> entitlementFor(uint64_t pool, uint64_t shareBalance, uint64_t totalShares);

    // Entitlements for every holder in the snapshot. Holders whose share
    // rounds down to zero are left out. pool == totalEntitled + remainder.
    static Result<Allocation> allocate(uint64_t pool, const ShareSnapshot& snapshot);

    static Result<ShareSnapshot> captureSnapshot(const ShareRegistry& registry, uint64_t timestamp);
};

}
}
