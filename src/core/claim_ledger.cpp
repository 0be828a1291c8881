#include "core/claim_ledger.h"

namespace rentledger {
namespace core {

bool ClaimLedger::isClaimed(uint64_t roundId, const Address& holder) const {
    auto it = records_.find(roundId);
    if (it == records_.end()) return false;
    return it->second.count(AddressUtil::normalize(holder)) > 0;
}

size_t ClaimLedger::claimCount(uint64_t roundId) const {
    auto it = records_.find(roundId);
    return it != records_.end() ? it->second.size() : 0;
}

std::set<Address> ClaimLedger::claimedHolders(uint64_t roundId) const {
    auto it = records_.find(roundId);
    if (it == records_.end()) return {};
    return it->second;
}

Result<uint64_t> ClaimLedger::payout(uint64_t roundId, const Address& holder, uint64_t entitlement,
                                     StableVault& vault, const Effects& effects) {
    Address key = AddressUtil::normalize(holder);
    RENTLEDGER_CHECK(!isClaimed(roundId, key), ErrorCode::ALREADY_CLAIMED,
                     "round " + std::to_string(roundId) + " already claimed by holder");
    RENTLEDGER_CHECK(entitlement > 0, ErrorCode::NO_ENTITLEMENT,
                     "holder has no entitlement in round " + std::to_string(roundId));

    records_[roundId].insert(key);
    if (effects.apply) effects.apply();

    auto transfer = vault.transferOut(key, entitlement);
    if (transfer.failed()) {
        if (effects.revert) effects.revert();
        auto it = records_.find(roundId);
        if (it != records_.end()) {
            it->second.erase(key);
            if (it->second.empty()) records_.erase(it);
        }
        return makeError(ErrorCode::TRANSFER_FAILED,
                         "payout transfer failed: " + transfer.error().message);
    }
    return entitlement;
}

void ClaimLedger::restore(uint64_t roundId, const Address& holder) {
    records_[roundId].insert(AddressUtil::normalize(holder));
}

}
}
