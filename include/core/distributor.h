#pragma once

#include "core/address.h"
#include "core/adapters.h"
#include "core/allocation.h"
#include "core/events.h"
#include "core/role_guard.h"
#include "infrastructure/error_handling.h"
#include <map>
#include <set>
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace rentledger {
namespace core {

enum class RoundState : uint8_t {
    EMPTY = 0,
    FUNDED = 1,
    FINALIZED = 2,
    CLOSED = 3
};

const char* roundStateToString(RoundState state);

struct RoundRecord {
    uint64_t id = 0;
    RoundState state = RoundState::EMPTY;
    uint64_t deposited = 0;
    uint64_t carriedIn = 0;
    ShareSnapshot snapshot;
    uint64_t totalEntitled = 0;
    uint64_t remainder = 0;
    uint64_t claimedAmount = 0;
    uint64_t entitledHolders = 0;
    uint64_t claimedHolders = 0;
    uint64_t finalizedAt = 0;
    uint64_t closedAt = 0;
    uint64_t sweptAmount = 0;

    uint64_t pool() const { return deposited + carriedIn; }
    uint64_t unclaimed() const { return totalEntitled - claimedAmount; }
};

struct DistributorParams {
    uint64_t propertyId = 0;
    Address owner;
    Address treasury;
    Address operatorAddress;
    uint64_t gracePeriod = 30ULL * 24 * 60 * 60;
    DustPolicy dustPolicy = DustPolicy::CARRY_FORWARD;
};

// Everything needed to rebuild a distributor. The last round is always the
// open (Empty or Funded) one.
struct LedgerState {
    uint64_t propertyId = 0;
    Address registryAddress;
    Address assetAddress;
    uint64_t gracePeriod = 0;
    DustPolicy dustPolicy = DustPolicy::CARRY_FORWARD;
    RoleSet roles;
    std::vector<RoundRecord> rounds;
    std::map<uint64_t, std::set<Address>> claims;
    uint64_t totalDeposited = 0;
    uint64_t totalPaidOut = 0;
    uint64_t nextEventSequence = 0;
};

struct LedgerTotals {
    uint64_t totalDeposited = 0;
    uint64_t totalPaidOut = 0;
    uint64_t carriedRemainder = 0;
    uint64_t fundsHeld = 0;
};

// Rental income distribution ledger for one property. Rounds are funded by
// the treasury or operator, finalized by the operator against a share
// snapshot, and then claimed pro rata by holders. Every operation either
// applies completely or leaves the ledger exactly as it was.
class YieldDistributor {
public:
    using Clock = std::function<uint64_t()>;

    static Result<std::unique_ptr<YieldDistributor>> create(
        const DistributorParams& params,
        std::shared_ptr<ShareRegistry> registry,
        std::shared_ptr<StableVault> vault);

    static Result<std::unique_ptr<YieldDistributor>> restore(
        const LedgerState& state,
        std::shared_ptr<ShareRegistry> registry,
        std::shared_ptr<StableVault> vault);

    ~YieldDistributor();

    Result<void> deposit(const Address& caller, uint64_t amount);
    Result<void> depositFromRentalWallet(const Address& caller, uint64_t amount);
    Result<uint64_t> finalizeRound(const Address& caller);
    Result<uint64_t> claim(const Address& holder, uint64_t roundId);
    Result<uint64_t> closeRound(const Address& caller, uint64_t roundId);

    Result<void> setTreasury(const Address& caller, const Address& treasury);
    Result<void> setOperator(const Address& caller, const Address& operatorAddress);
    Result<void> setRentalWallet(const Address& caller, const Address& wallet);
    Result<void> proposeOwner(const Address& caller, const Address& nominee);
    Result<void> acceptOwnership(const Address& caller);

    uint64_t propertyId() const;
    Address registryAddress() const;
    Address assetAddress() const;
    uint64_t gracePeriod() const;
    DustPolicy dustPolicy() const;

    uint64_t currentRoundId() const;
    Result<RoundState> roundState(uint64_t roundId) const;
    Result<RoundRecord> round(uint64_t roundId) const;
    Result<uint64_t> entitlementOf(uint64_t roundId, const Address& holder) const;
    Result<bool> isClaimed(uint64_t roundId, const Address& holder) const;
    LedgerTotals totals() const;
    RoleSet roles() const;

    LedgerState state() const;
    // Events emitted by this instance since it was created or restored.
    std::vector<LedgerEvent> events() const;

    void onEvent(std::function<void(const LedgerEvent&)> callback);
    void setClock(Clock clock);

private:
    YieldDistributor();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
