#include "core/claim_ledger.h"
#include "core/memory_adapters.h"
#include <cassert>
#include <cstdio>
#include <iostream>
#include <string>

using namespace rentledger;
using namespace rentledger::core;

static Address addr(unsigned n) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "0x%040x", n);
    return buf;
}

static const Address ASSET = addr(0xA55E7);
static const Address FUNDER = addr(0xF0);
static const Address HOLDER = addr(1);

struct Counters {
    uint64_t paid = 0;
    int applied = 0;
    int reverted = 0;
};

static ClaimLedger::Effects effectsFor(Counters& c, uint64_t amount) {
    ClaimLedger::Effects fx;
    fx.apply = [&c, amount]() { c.paid += amount; c.applied++; };
    fx.revert = [&c, amount]() { c.paid -= amount; c.reverted++; };
    return fx;
}

static void fundVault(InMemoryVault& vault, uint64_t amount) {
    vault.credit(FUNDER, amount);
    assert(vault.transferIn(FUNDER, amount).ok());
}

static void testPayoutMarksAndPays() {
    InMemoryVault vault(ASSET);
    fundVault(vault, 500);
    ClaimLedger ledger;
    Counters c;

    auto paid = ledger.payout(0, HOLDER, 300, vault, effectsFor(c, 300));
    assert(paid.ok() && paid.value() == 300);
    assert(ledger.isClaimed(0, HOLDER));
    assert(!ledger.isClaimed(1, HOLDER));
    assert(ledger.claimCount(0) == 1);
    assert(vault.balanceOf(HOLDER) == 300);
    assert(vault.custody() == 200);
    assert(c.paid == 300 && c.applied == 1 && c.reverted == 0);
}

static void testSecondPayoutRejected() {
    InMemoryVault vault(ASSET);
    fundVault(vault, 500);
    ClaimLedger ledger;
    Counters c;

    assert(ledger.payout(0, HOLDER, 100, vault, effectsFor(c, 100)).ok());
    size_t transfers = vault.transferOutCount();

    std::string mixedCase = "0X" + std::string(39, '0') + "1";
    auto again = ledger.payout(0, mixedCase, 100, vault, effectsFor(c, 100));
    assert(again.failed());
    assert(again.code() == ErrorCode::ALREADY_CLAIMED);
    assert(vault.transferOutCount() == transfers);
    assert(c.applied == 1);
}

static void testZeroEntitlementRejected() {
    InMemoryVault vault(ASSET);
    ClaimLedger ledger;
    Counters c;
    auto res = ledger.payout(3, HOLDER, 0, vault, effectsFor(c, 0));
    assert(res.code() == ErrorCode::NO_ENTITLEMENT);
    assert(!ledger.isClaimed(3, HOLDER));
    assert(c.applied == 0);
}

static void testFailedTransferRollsBack() {
    InMemoryVault vault(ASSET);
    fundVault(vault, 500);
    vault.failTransferOut(true);
    ClaimLedger ledger;
    Counters c;

    auto res = ledger.payout(0, HOLDER, 250, vault, effectsFor(c, 250));
    assert(res.failed());
    assert(res.code() == ErrorCode::TRANSFER_FAILED);
    assert(!ledger.isClaimed(0, HOLDER));
    assert(ledger.claimCount(0) == 0);
    assert(ledger.records().empty());
    assert(c.paid == 0 && c.applied == 1 && c.reverted == 1);
    assert(vault.custody() == 500);

    vault.failTransferOut(false);
    assert(ledger.payout(0, HOLDER, 250, vault, effectsFor(c, 250)).ok());
}

static void testRecordVisibleDuringTransfer() {
    InMemoryVault vault(ASSET);
    fundVault(vault, 1000);
    ClaimLedger ledger;
    Counters c;

    ErrorCode nested = ErrorCode::OK;
    bool sawRecord = false;
    bool reentered = false;
    vault.onTransferOut([&](const Address&, uint64_t) {
        if (reentered) return;
        reentered = true;
        sawRecord = ledger.isClaimed(0, HOLDER);
        nested = ledger.payout(0, HOLDER, 100, vault, effectsFor(c, 100)).code();
    });

    assert(ledger.payout(0, HOLDER, 100, vault, effectsFor(c, 100)).ok());
    assert(sawRecord);
    assert(nested == ErrorCode::ALREADY_CLAIMED);
    assert(vault.balanceOf(HOLDER) == 100);
    assert(c.paid == 100);
}

static void testRestore() {
    ClaimLedger ledger;
    ledger.restore(2, addr(7));
    ledger.restore(2, addr(8));
    assert(ledger.isClaimed(2, addr(7)));
    assert(ledger.claimCount(2) == 2);
    assert(ledger.claimedHolders(2).count(addr(8)) == 1);
    assert(ledger.claimedHolders(5).empty());
}

int main() {
    std::cout << "Running claim ledger tests...\n";
    testPayoutMarksAndPays();
    testSecondPayoutRejected();
    testZeroEntitlementRejected();
    testFailedTransferRollsBack();
    testRecordVisibleDuringTransfer();
    testRestore();
    std::cout << "All claim ledger tests passed!\n";
    return 0;
}
