#include "core/distributor.h"
#include "core/claim_ledger.h"
#include "utils/logger.h"
#include <mutex>
#include <ctime>

namespace rentledger {
namespace core {

const char* roundStateToString(RoundState state) {
    switch (state) {
        case RoundState::EMPTY: return "Empty";
        case RoundState::FUNDED: return "Funded";
        case RoundState::FINALIZED: return "Finalized";
        case RoundState::CLOSED: return "Closed";
        default: return "Unknown";
    }
}

static bool safeAddU64(uint64_t a, uint64_t b, uint64_t& out) {
    if (UINT64_MAX - a < b) return false;
    out = a + b;
    return true;
}

static Error reject(const char* op, Error err) {
    utils::Logger::log(utils::LogLevel::WARN, "ledger",
                       std::string(op) + " rejected: " + errorCodeName(err.code) + ": " + err.message);
    err.context = op;
    ErrorHandler::instance().handle(err);
    return err;
}

struct YieldDistributor::Impl {
    uint64_t propertyId = 0;
    uint64_t gracePeriod = 0;
    DustPolicy dustPolicy = DustPolicy::CARRY_FORWARD;
    std::shared_ptr<ShareRegistry> registry;
    std::shared_ptr<StableVault> vault;
    Address registryAddress;
    Address assetAddress;

    RoleGuard guard;
    std::vector<RoundRecord> rounds;
    ClaimLedger claims;
    uint64_t totalDeposited = 0;
    uint64_t totalPaidOut = 0;
    uint64_t nextEventSequence = 0;

    // Non-zero while an adapter call is in flight. Lifecycle operations are
    // refused during that window; claims rely on their own ordering.
    int externalDepth = 0;
    // Payouts per round whose vault transfer has not returned yet. A round
    // only closes once none of its claims are still in flight.
    std::map<uint64_t, uint32_t> claimsInFlight;

    std::vector<LedgerEvent> events;
    std::function<void(const LedgerEvent&)> eventCallback;
    Clock clock;
    mutable std::recursive_mutex mtx;

    uint64_t now() const { return clock ? clock() : static_cast<uint64_t>(std::time(nullptr)); }
    RoundRecord& openRound() { return rounds.back(); }

    const RoundRecord* findRound(uint64_t roundId) const {
        if (roundId >= rounds.size()) return nullptr;
        return &rounds[roundId];
    }

    void emit(LedgerEvent ev) {
        ev.sequence = nextEventSequence++;
        ev.timestamp = now();
        events.push_back(ev);
        if (eventCallback) eventCallback(ev);
    }

    void emitRoleChange(const RoleChange& change) {
        LedgerEvent ev;
        ev.type = LedgerEventType::ROLE_CHANGED;
        ev.role = change.role;
        ev.oldAddress = change.oldAddress;
        ev.newAddress = change.newAddress;
        emit(ev);
        utils::Logger::log(utils::LogLevel::INFO, "roles",
                           std::string(roleToString(change.role)) + " changed from " +
                           utils::Logger::redactAddress(change.oldAddress) + " to " +
                           utils::Logger::redactAddress(change.newAddress));
    }

    Result<void> fund(const char* op, const Address& payer, uint64_t amount);
};

YieldDistributor::YieldDistributor() : impl_(std::make_unique<Impl>()) {}
YieldDistributor::~YieldDistributor() = default;

Result<std::unique_ptr<YieldDistributor>> YieldDistributor::create(
    const DistributorParams& params,
    std::shared_ptr<ShareRegistry> registry,
    std::shared_ptr<StableVault> vault) {
    if (!registry || !AddressUtil::isValid(registry->tokenAddress())) {
        return reject("create", makeError(ErrorCode::INVALID_ADDRESS, "property token address cannot be zero"));
    }
    if (!vault || !AddressUtil::isValid(vault->assetAddress())) {
        return reject("create", makeError(ErrorCode::INVALID_ADDRESS, "settlement asset address cannot be zero"));
    }
    auto guard = RoleGuard::create(params.owner, params.treasury, params.operatorAddress);
    if (guard.failed()) return reject("create", guard.error());

    std::unique_ptr<YieldDistributor> dist(new YieldDistributor());
    Impl& d = *dist->impl_;
    d.propertyId = params.propertyId;
    d.gracePeriod = params.gracePeriod;
    d.dustPolicy = params.dustPolicy;
    d.registryAddress = AddressUtil::normalize(registry->tokenAddress());
    d.assetAddress = AddressUtil::normalize(vault->assetAddress());
    d.registry = std::move(registry);
    d.vault = std::move(vault);
    d.guard = guard.value();

    RoundRecord first;
    first.id = 0;
    d.rounds.push_back(first);

    utils::Logger::log(utils::LogLevel::INFO, "ledger",
                       "distributor created for property " + std::to_string(d.propertyId) +
                       " (dust policy " + dustPolicyToString(d.dustPolicy) + ")");
    return std::move(dist);
}

Result<std::unique_ptr<YieldDistributor>> YieldDistributor::restore(
    const LedgerState& state,
    std::shared_ptr<ShareRegistry> registry,
    std::shared_ptr<StableVault> vault) {
    if (!registry || !AddressUtil::equals(registry->tokenAddress(), state.registryAddress)) {
        return reject("restore", makeError(ErrorCode::INVALID_ADDRESS, "share registry does not match persisted ledger"));
    }
    if (!vault || !AddressUtil::equals(vault->assetAddress(), state.assetAddress)) {
        return reject("restore", makeError(ErrorCode::INVALID_ADDRESS, "settlement asset does not match persisted ledger"));
    }
    auto guard = RoleGuard::fromRoles(state.roles);
    if (guard.failed()) return reject("restore", guard.error());

    if (state.rounds.empty()) {
        return reject("restore", makeError(ErrorCode::DATABASE_ERROR, "persisted ledger has no open round"));
    }
    for (size_t i = 0; i < state.rounds.size(); ++i) {
        const auto& r = state.rounds[i];
        bool last = i + 1 == state.rounds.size();
        bool open = r.state == RoundState::EMPTY || r.state == RoundState::FUNDED;
        if (r.id != i || open != last || r.claimedAmount > r.totalEntitled) {
            return reject("restore", makeError(ErrorCode::DATABASE_ERROR,
                                               "persisted round " + std::to_string(i) + " is inconsistent"));
        }
    }
    if (state.totalPaidOut > state.totalDeposited) {
        return reject("restore", makeError(ErrorCode::DATABASE_ERROR, "persisted payouts exceed deposits"));
    }
    for (const auto& [roundId, holders] : state.claims) {
        if (roundId >= state.rounds.size()) {
            return reject("restore", makeError(ErrorCode::DATABASE_ERROR,
                                               "persisted claims reference missing round " + std::to_string(roundId)));
        }
        const auto& r = state.rounds[roundId];
        for (const auto& holder : holders) {
            auto share = AllocationCalculator::entitlementFor(r.pool(), r.snapshot.balanceOf(holder),
                                                              r.snapshot.totalShares);
            if (share.failed() || share.value() == 0) {
                return reject("restore", makeError(ErrorCode::DATABASE_ERROR,
                                                   "persisted claim in round " + std::to_string(roundId) +
                                                   " has no entitlement"));
            }
        }
    }
    for (const auto& r : state.rounds) {
        auto it = state.claims.find(r.id);
        size_t recorded = it != state.claims.end() ? it->second.size() : 0;
        if (recorded != r.claimedHolders) {
            return reject("restore", makeError(ErrorCode::DATABASE_ERROR,
                                               "persisted round " + std::to_string(r.id) + " records " +
                                               std::to_string(r.claimedHolders) + " claims but " +
                                               std::to_string(recorded) + " are stored"));
        }
    }

    std::unique_ptr<YieldDistributor> dist(new YieldDistributor());
    Impl& d = *dist->impl_;
    d.propertyId = state.propertyId;
    d.gracePeriod = state.gracePeriod;
    d.dustPolicy = state.dustPolicy;
    d.registryAddress = AddressUtil::normalize(state.registryAddress);
    d.assetAddress = AddressUtil::normalize(state.assetAddress);
    d.registry = std::move(registry);
    d.vault = std::move(vault);
    d.guard = guard.value();
    d.rounds = state.rounds;
    for (const auto& [roundId, holders] : state.claims) {
        for (const auto& holder : holders) d.claims.restore(roundId, holder);
    }
    d.totalDeposited = state.totalDeposited;
    d.totalPaidOut = state.totalPaidOut;
    d.nextEventSequence = state.nextEventSequence;
    return std::move(dist);
}

Result<void> YieldDistributor::Impl::fund(const char* op, const Address& payer, uint64_t amount) {
    if (externalDepth > 0) {
        return reject(op, makeError(ErrorCode::REENTRANT_CALL, "deposits are not accepted during a transfer"));
    }
    if (amount == 0) {
        return reject(op, makeError(ErrorCode::INVALID_AMOUNT, "deposit amount must be greater than zero"));
    }

    size_t idx = rounds.size() - 1;
    RoundRecord before = rounds[idx];
    uint64_t newDeposited = 0, newPool = 0, newTotal = 0;
    if (!safeAddU64(before.deposited, amount, newDeposited) ||
        !safeAddU64(newDeposited, before.carriedIn, newPool) ||
        !safeAddU64(totalDeposited, amount, newTotal)) {
        return reject(op, makeError(ErrorCode::INVALID_AMOUNT, "deposit amount overflows the ledger counters"));
    }

    uint64_t totalBefore = totalDeposited;
    rounds[idx].deposited = newDeposited;
    rounds[idx].state = RoundState::FUNDED;
    totalDeposited = newTotal;

    externalDepth++;
    auto transfer = vault->transferIn(payer, amount);
    externalDepth--;
    if (transfer.failed()) {
        rounds[idx] = before;
        totalDeposited = totalBefore;
        return reject(op, makeError(ErrorCode::TRANSFER_FAILED, "deposit transfer failed: " + transfer.error().message));
    }

    LedgerEvent ev;
    ev.type = LedgerEventType::DEPOSITED;
    ev.roundId = rounds[idx].id;
    ev.account = AddressUtil::normalize(payer);
    ev.amount = amount;
    emit(ev);

    utils::Logger::log(utils::LogLevel::INFO, "ledger",
                       "round " + std::to_string(ev.roundId) + " funded with " + std::to_string(amount) +
                       " from " + utils::Logger::redactAddress(ev.account) +
                       " (round total " + std::to_string(newDeposited) + ")");
    return {};
}

Result<void> YieldDistributor::deposit(const Address& caller, uint64_t amount) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    auto auth = impl_->guard.requireDepositor(caller, "deposit");
    if (auth.failed()) return reject("deposit", auth.error());
    return impl_->fund("deposit", caller, amount);
}

Result<void> YieldDistributor::depositFromRentalWallet(const Address& caller, uint64_t amount) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    auto auth = impl_->guard.requireOperator(caller, "pull rental income");
    if (auth.failed()) return reject("depositFromRentalWallet", auth.error());
    if (impl_->guard.rentalWallet().empty()) {
        return reject("depositFromRentalWallet",
                      makeError(ErrorCode::INVALID_ADDRESS, "no rental wallet is configured"));
    }
    return impl_->fund("depositFromRentalWallet", impl_->guard.rentalWallet(), amount);
}

Result<uint64_t> YieldDistributor::finalizeRound(const Address& caller) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    Impl& d = *impl_;
    auto auth = d.guard.requireOperator(caller, "finalize a round");
    if (auth.failed()) return reject("finalizeRound", auth.error());
    if (d.externalDepth > 0) {
        return reject("finalizeRound", makeError(ErrorCode::REENTRANT_CALL, "cannot finalize during a transfer"));
    }

    size_t idx = d.rounds.size() - 1;
    if (d.rounds[idx].state != RoundState::FUNDED) {
        return reject("finalizeRound", makeError(ErrorCode::ROUND_NOT_FUNDED,
                                                 "round " + std::to_string(idx) + " has no deposits"));
    }

    uint64_t ts = d.now();
    d.externalDepth++;
    auto snapshot = AllocationCalculator::captureSnapshot(*d.registry, ts);
    d.externalDepth--;
    if (snapshot.failed()) return reject("finalizeRound", snapshot.error());

    auto alloc = AllocationCalculator::allocate(d.rounds[idx].pool(), snapshot.value());
    if (alloc.failed()) return reject("finalizeRound", alloc.error());
    const Allocation& a = alloc.value();

    RoundRecord before = d.rounds[idx];

    RoundRecord& r = d.rounds[idx];
    r.snapshot = snapshot.value();
    r.totalEntitled = a.totalEntitled;
    r.remainder = a.remainder;
    r.entitledHolders = a.entitlements.size();
    r.finalizedAt = ts;

    // Under the sweep policy the dust leaves custody now; otherwise it seeds
    // the next round's pool. The round stays Funded until the sweep returns,
    // so no claim can land on it while the transfer is in flight.
    uint64_t carry = a.remainder;
    bool sweepDust = d.dustPolicy == DustPolicy::SWEEP_TO_TREASURY && a.remainder > 0 && r.entitledHolders > 0;
    if (sweepDust) {
        carry = 0;
        d.totalPaidOut += a.remainder;
        d.externalDepth++;
        auto transfer = d.vault->transferOut(d.guard.treasury(), a.remainder);
        d.externalDepth--;
        if (transfer.failed()) {
            // Claims on earlier rounds may have paid out during the transfer;
            // only this sweep is taken back.
            d.rounds[idx] = before;
            d.totalPaidOut -= a.remainder;
            return reject("finalizeRound", makeError(ErrorCode::TRANSFER_FAILED,
                                                     "dust sweep transfer failed: " + transfer.error().message));
        }
    }

    RoundRecord& finalized = d.rounds[idx];
    finalized.state = RoundState::FINALIZED;
    if (finalized.entitledHolders == 0) {
        finalized.state = RoundState::CLOSED;
        finalized.closedAt = ts;
    }

    RoundRecord next;
    next.id = idx + 1;
    next.carriedIn = carry;
    d.rounds.push_back(next);

    const RoundRecord& done = d.rounds[idx];
    LedgerEvent fin;
    fin.type = LedgerEventType::ROUND_FINALIZED;
    fin.roundId = done.id;
    fin.amount = done.totalEntitled;
    d.emit(fin);
    if (sweepDust) {
        LedgerEvent dust;
        dust.type = LedgerEventType::DUST_SWEPT;
        dust.roundId = done.id;
        dust.amount = done.remainder;
        d.emit(dust);
    }
    if (done.state == RoundState::CLOSED) {
        LedgerEvent closed;
        closed.type = LedgerEventType::ROUND_CLOSED;
        closed.roundId = done.id;
        d.emit(closed);
    }

    utils::Logger::log(utils::LogLevel::INFO, "ledger",
                       "round " + std::to_string(done.id) + " finalized: pool " + std::to_string(done.pool()) +
                       ", entitled " + std::to_string(done.totalEntitled) + " across " +
                       std::to_string(done.entitledHolders) + " holders, remainder " +
                       std::to_string(done.remainder) + (sweepDust ? " swept" : " carried"));
    return done.id;
}

Result<uint64_t> YieldDistributor::claim(const Address& holder, uint64_t roundId) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    Impl& d = *impl_;
    if (!AddressUtil::isValid(holder)) {
        return reject("claim", makeError(ErrorCode::INVALID_ADDRESS, "holder address cannot be zero"));
    }
    const RoundRecord* r = d.findRound(roundId);
    if (!r) {
        return reject("claim", makeError(ErrorCode::ROUND_NOT_FOUND, "round " + std::to_string(roundId) + " does not exist"));
    }
    if (d.claims.isClaimed(roundId, holder)) {
        return reject("claim", makeError(ErrorCode::ALREADY_CLAIMED,
                                         "round " + std::to_string(roundId) + " already claimed by holder"));
    }
    if (r->state != RoundState::FINALIZED) {
        return reject("claim", makeError(ErrorCode::ROUND_NOT_FINALIZED,
                                         "round " + std::to_string(roundId) + " is " + roundStateToString(r->state)));
    }
    auto share = AllocationCalculator::entitlementFor(r->pool(), r->snapshot.balanceOf(holder), r->snapshot.totalShares);
    if (share.failed()) return reject("claim", share.error());
    uint64_t amount = share.value();

    // Rounds may be appended by a reentrant deposit or finalize, so the
    // effects address the round by index rather than by reference.
    ClaimLedger::Effects effects;
    effects.apply = [&d, roundId, amount]() {
        RoundRecord& rr = d.rounds[roundId];
        rr.claimedAmount += amount;
        rr.claimedHolders++;
        d.totalPaidOut += amount;
    };
    effects.revert = [&d, roundId, amount]() {
        RoundRecord& rr = d.rounds[roundId];
        rr.claimedAmount -= amount;
        rr.claimedHolders--;
        d.totalPaidOut -= amount;
    };

    d.externalDepth++;
    d.claimsInFlight[roundId]++;
    auto paid = d.claims.payout(roundId, holder, amount, *d.vault, effects);
    d.externalDepth--;
    if (--d.claimsInFlight[roundId] == 0) d.claimsInFlight.erase(roundId);
    if (paid.failed()) return reject("claim", paid.error());

    // A nested claim that completes the round leaves the close to the
    // outermost payout, which may still fail and give its slot back.
    bool closedHere = false;
    RoundRecord& rr = d.rounds[roundId];
    if (d.claimsInFlight.count(roundId) == 0 && rr.state == RoundState::FINALIZED &&
        rr.claimedHolders >= rr.entitledHolders) {
        rr.state = RoundState::CLOSED;
        rr.closedAt = d.now();
        closedHere = true;
    }

    LedgerEvent ev;
    ev.type = LedgerEventType::CLAIMED;
    ev.roundId = roundId;
    ev.account = AddressUtil::normalize(holder);
    ev.amount = amount;
    d.emit(ev);
    if (closedHere) {
        LedgerEvent closed;
        closed.type = LedgerEventType::ROUND_CLOSED;
        closed.roundId = roundId;
        d.emit(closed);
    }

    utils::Logger::log(utils::LogLevel::INFO, "claims",
                       utils::Logger::redactAddress(ev.account) + " claimed " + std::to_string(amount) +
                       " from round " + std::to_string(roundId));
    return amount;
}

Result<uint64_t> YieldDistributor::closeRound(const Address& caller, uint64_t roundId) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    Impl& d = *impl_;
    auto auth = d.guard.requireOwner(caller, "close a round");
    if (auth.failed()) return reject("closeRound", auth.error());
    if (d.externalDepth > 0) {
        return reject("closeRound", makeError(ErrorCode::REENTRANT_CALL, "cannot close a round during a transfer"));
    }
    const RoundRecord* r = d.findRound(roundId);
    if (!r) {
        return reject("closeRound", makeError(ErrorCode::ROUND_NOT_FOUND, "round " + std::to_string(roundId) + " does not exist"));
    }
    if (r->state != RoundState::FINALIZED) {
        return reject("closeRound", makeError(ErrorCode::ROUND_NOT_FINALIZED,
                                              "round " + std::to_string(roundId) + " is " + roundStateToString(r->state)));
    }
    uint64_t ts = d.now();
    uint64_t opensAt = 0;
    if (!safeAddU64(r->finalizedAt, d.gracePeriod, opensAt)) opensAt = UINT64_MAX;
    if (ts < opensAt) {
        return reject("closeRound", makeError(ErrorCode::GRACE_PERIOD_ACTIVE,
                                              "round " + std::to_string(roundId) + " cannot be closed before " +
                                              std::to_string(opensAt)));
    }

    uint64_t sweep = r->unclaimed();

    RoundRecord& rr = d.rounds[roundId];
    rr.state = RoundState::CLOSED;
    rr.closedAt = ts;
    rr.sweptAmount = sweep;
    d.totalPaidOut += sweep;

    if (sweep > 0) {
        d.externalDepth++;
        auto transfer = d.vault->transferOut(d.guard.treasury(), sweep);
        d.externalDepth--;
        if (transfer.failed()) {
            // Claims on other rounds may have paid out during the transfer;
            // only this round's close is taken back.
            RoundRecord& undo = d.rounds[roundId];
            undo.state = RoundState::FINALIZED;
            undo.closedAt = 0;
            undo.sweptAmount = 0;
            d.totalPaidOut -= sweep;
            return reject("closeRound", makeError(ErrorCode::TRANSFER_FAILED,
                                                  "sweep transfer failed: " + transfer.error().message));
        }
    }

    LedgerEvent ev;
    ev.type = LedgerEventType::ROUND_CLOSED;
    ev.roundId = roundId;
    ev.amount = sweep;
    d.emit(ev);

    utils::Logger::log(utils::LogLevel::INFO, "ledger",
                       "round " + std::to_string(roundId) + " closed, " + std::to_string(sweep) +
                       " unclaimed swept to treasury");
    return sweep;
}

Result<void> YieldDistributor::setTreasury(const Address& caller, const Address& treasury) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    auto change = impl_->guard.setTreasury(caller, treasury);
    if (change.failed()) return reject("setTreasury", change.error());
    impl_->emitRoleChange(change.value());
    return {};
}

Result<void> YieldDistributor::setOperator(const Address& caller, const Address& operatorAddress) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    auto change = impl_->guard.setOperator(caller, operatorAddress);
    if (change.failed()) return reject("setOperator", change.error());
    impl_->emitRoleChange(change.value());
    return {};
}

Result<void> YieldDistributor::setRentalWallet(const Address& caller, const Address& wallet) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    auto change = impl_->guard.setRentalWallet(caller, wallet);
    if (change.failed()) return reject("setRentalWallet", change.error());
    impl_->emitRoleChange(change.value());
    return {};
}

Result<void> YieldDistributor::proposeOwner(const Address& caller, const Address& nominee) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    auto proposed = impl_->guard.proposeOwner(caller, nominee);
    if (proposed.failed()) return reject("proposeOwner", proposed.error());

    LedgerEvent ev;
    ev.type = LedgerEventType::OWNERSHIP_PROPOSED;
    ev.account = impl_->guard.pendingOwner();
    impl_->emit(ev);
    utils::Logger::log(utils::LogLevel::INFO, "roles",
                       "ownership offered to " + utils::Logger::redactAddress(ev.account));
    return {};
}

Result<void> YieldDistributor::acceptOwnership(const Address& caller) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    auto change = impl_->guard.acceptOwnership(caller);
    if (change.failed()) return reject("acceptOwnership", change.error());
    impl_->emitRoleChange(change.value());
    return {};
}

uint64_t YieldDistributor::propertyId() const {
    return impl_->propertyId;
}

Address YieldDistributor::registryAddress() const {
    return impl_->registryAddress;
}

Address YieldDistributor::assetAddress() const {
    return impl_->assetAddress;
}

uint64_t YieldDistributor::gracePeriod() const {
    return impl_->gracePeriod;
}

DustPolicy YieldDistributor::dustPolicy() const {
    return impl_->dustPolicy;
}

uint64_t YieldDistributor::currentRoundId() const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    return impl_->rounds.back().id;
}

Result<RoundState> YieldDistributor::roundState(uint64_t roundId) const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    const RoundRecord* r = impl_->findRound(roundId);
    RENTLEDGER_CHECK(r, ErrorCode::ROUND_NOT_FOUND, "round " + std::to_string(roundId) + " does not exist");
    return r->state;
}

Result<RoundRecord> YieldDistributor::round(uint64_t roundId) const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    const RoundRecord* r = impl_->findRound(roundId);
    RENTLEDGER_CHECK(r, ErrorCode::ROUND_NOT_FOUND, "round " + std::to_string(roundId) + " does not exist");
    return *r;
}

Result<uint64_t> YieldDistributor::entitlementOf(uint64_t roundId, const Address& holder) const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    const RoundRecord* r = impl_->findRound(roundId);
    RENTLEDGER_CHECK(r, ErrorCode::ROUND_NOT_FOUND, "round " + std::to_string(roundId) + " does not exist");
    RENTLEDGER_CHECK(r->state == RoundState::FINALIZED || r->state == RoundState::CLOSED,
                     ErrorCode::ROUND_NOT_FINALIZED, "round " + std::to_string(roundId) + " has no snapshot yet");
    return AllocationCalculator::entitlementFor(r->pool(), r->snapshot.balanceOf(holder), r->snapshot.totalShares);
}

Result<bool> YieldDistributor::isClaimed(uint64_t roundId, const Address& holder) const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    RENTLEDGER_CHECK(impl_->findRound(roundId), ErrorCode::ROUND_NOT_FOUND,
                     "round " + std::to_string(roundId) + " does not exist");
    return impl_->claims.isClaimed(roundId, holder);
}

LedgerTotals YieldDistributor::totals() const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    LedgerTotals t;
    t.totalDeposited = impl_->totalDeposited;
    t.totalPaidOut = impl_->totalPaidOut;
    t.carriedRemainder = impl_->rounds.back().carriedIn;
    t.fundsHeld = impl_->totalDeposited - impl_->totalPaidOut;
    return t;
}

RoleSet YieldDistributor::roles() const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    return impl_->guard.roles();
}

LedgerState YieldDistributor::state() const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    LedgerState s;
    s.propertyId = impl_->propertyId;
    s.registryAddress = impl_->registryAddress;
    s.assetAddress = impl_->assetAddress;
    s.gracePeriod = impl_->gracePeriod;
    s.dustPolicy = impl_->dustPolicy;
    s.roles = impl_->guard.roles();
    s.rounds = impl_->rounds;
    s.claims = impl_->claims.records();
    s.totalDeposited = impl_->totalDeposited;
    s.totalPaidOut = impl_->totalPaidOut;
    s.nextEventSequence = impl_->nextEventSequence;
    return s;
}

std::vector<LedgerEvent> YieldDistributor::events() const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    return impl_->events;
}

void YieldDistributor::onEvent(std::function<void(const LedgerEvent&)> callback) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    impl_->eventCallback = callback;
}

void YieldDistributor::setClock(Clock clock) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    impl_->clock = clock;
}

}
}
