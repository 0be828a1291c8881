#include "core/allocation.h"
#include <algorithm>
#include <cctype>

namespace rentledger {
namespace core {

const char* dustPolicyToString(DustPolicy policy) {
    switch (policy) {
        case DustPolicy::CARRY_FORWARD: return "carry";
        case DustPolicy::SWEEP_TO_TREASURY: return "sweep";
        default: return "unknown";
    }
}

bool parseDustPolicy(const std::string& name, DustPolicy& out) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "carry" || n == "carry-forward") {
        out = DustPolicy::CARRY_FORWARD;
        return true;
    }
    if (n == "sweep" || n == "sweep-to-treasury") {
        out = DustPolicy::SWEEP_TO_TREASURY;
        return true;
    }
    return false;
}

uint64_t ShareSnapshot::balanceOf(const Address& holder) const {
    auto it = balances.find(AddressUtil::normalize(holder));
    return it != balances.end() ? it->second : 0;
}

uint64_t ShareSnapshot::sumOfBalances() const {
    unsigned __int128 sum = 0;
    for (const auto& [holder, balance] : balances) sum += balance;
    if (sum > UINT64_MAX) return UINT64_MAX;
    return static_cast<uint64_t>(sum);
}

Result<uint64_t> AllocationCalculator::entitlementFor(uint64_t pool, uint64_t shareBalance, uint64_t totalShares) {
    RENTLEDGER_CHECK(totalShares != 0, ErrorCode::DIVISION_BY_ZERO, "total shares outstanding is zero");
    RENTLEDGER_CHECK(shareBalance <= totalShares, ErrorCode::INVALID_SNAPSHOT,
                     "share balance exceeds total shares");
    unsigned __int128 numerator = static_cast<unsigned __int128>(pool) * static_cast<unsigned __int128>(shareBalance);
    return static_cast<uint64_t>(numerator / totalShares);
}

Result<Allocation> AllocationCalculator::allocate(uint64_t pool, const ShareSnapshot& snapshot) {
    RENTLEDGER_CHECK(snapshot.totalShares != 0, ErrorCode::DIVISION_BY_ZERO, "total shares outstanding is zero");

    unsigned __int128 sumShares = 0;
    for (const auto& [holder, balance] : snapshot.balances) sumShares += balance;
    RENTLEDGER_CHECK(sumShares <= snapshot.totalShares, ErrorCode::INVALID_SNAPSHOT,
                     "holder balances sum to more than total shares");

    Allocation alloc;
    alloc.pool = pool;
    for (const auto& [holder, balance] : snapshot.balances) {
        auto share = entitlementFor(pool, balance, snapshot.totalShares);
        if (share.failed()) return share.error();
        if (share.value() == 0) continue;
        alloc.entitlements[holder] = share.value();
        alloc.totalEntitled += share.value();
    }
    // Each term is floored and the share fractions sum to at most one.
    alloc.remainder = pool - alloc.totalEntitled;
    return alloc;
}

Result<ShareSnapshot> AllocationCalculator::captureSnapshot(const ShareRegistry& registry, uint64_t timestamp) {
    ShareSnapshot snap;
    snap.takenAt = timestamp;
    snap.totalShares = registry.totalShares();
    RENTLEDGER_CHECK(snap.totalShares != 0, ErrorCode::DIVISION_BY_ZERO, "total shares outstanding is zero");

    for (const auto& holder : registry.holders()) {
        if (!AddressUtil::isValid(holder)) continue;
        uint64_t balance = registry.balanceOf(holder);
        if (balance == 0) continue;
        snap.balances[AddressUtil::normalize(holder)] = balance;
    }

    RENTLEDGER_CHECK(snap.sumOfBalances() <= snap.totalShares, ErrorCode::INVALID_SNAPSHOT,
                     "holder balances sum to more than total shares");
    return snap;
}

}
}
