#include "core/allocation.h"
#include "core/memory_adapters.h"
#include <cassert>
#include <cstdint>
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

static ShareSnapshot snapshotOf(std::initializer_list<uint64_t> balances, uint64_t total = 0) {
    ShareSnapshot snap;
    unsigned n = 1;
    uint64_t sum = 0;
    for (uint64_t b : balances) {
        snap.balances[addr(n++)] = b;
        sum += b;
    }
    snap.totalShares = total ? total : sum;
    return snap;
}

static void testEntitlementFloors() {
    auto e = AllocationCalculator::entitlementFor(1000, 600, 1000);
    assert(e.ok() && e.value() == 600);

    e = AllocationCalculator::entitlementFor(100, 1, 3);
    assert(e.ok() && e.value() == 33);

    e = AllocationCalculator::entitlementFor(0, 5, 10);
    assert(e.ok() && e.value() == 0);

    e = AllocationCalculator::entitlementFor(7, 0, 10);
    assert(e.ok() && e.value() == 0);
}

static void testEntitlementWideProduct() {
    // pool * balance overflows 64 bits; the quotient does not.
    auto e = AllocationCalculator::entitlementFor(UINT64_MAX, 3, 4);
    assert(e.ok());
    assert(e.value() == 13835058055282163711ULL);

    e = AllocationCalculator::entitlementFor(UINT64_MAX, UINT64_MAX, UINT64_MAX);
    assert(e.ok() && e.value() == UINT64_MAX);
}

static void testEntitlementErrors() {
    auto e = AllocationCalculator::entitlementFor(1000, 0, 0);
    assert(e.failed());
    assert(e.code() == ErrorCode::DIVISION_BY_ZERO);

    e = AllocationCalculator::entitlementFor(1000, 11, 10);
    assert(e.failed());
    assert(e.code() == ErrorCode::INVALID_SNAPSHOT);
}

static void testAllocateSixHundredFourHundred() {
    auto a = AllocationCalculator::allocate(1000, snapshotOf({600, 400}));
    assert(a.ok());
    assert(a.value().entitlements.at(addr(1)) == 600);
    assert(a.value().entitlements.at(addr(2)) == 400);
    assert(a.value().totalEntitled == 1000);
    assert(a.value().remainder == 0);
}

static void testAllocateThirds() {
    auto a = AllocationCalculator::allocate(1000, snapshotOf({333, 333, 334}));
    assert(a.ok());
    assert(a.value().entitlements.at(addr(1)) == 333);
    assert(a.value().entitlements.at(addr(2)) == 333);
    assert(a.value().entitlements.at(addr(3)) == 334);
    assert(a.value().remainder == 0);
}

static void testAllocateLeavesDust() {
    auto a = AllocationCalculator::allocate(100, snapshotOf({1, 1, 1}));
    assert(a.ok());
    assert(a.value().totalEntitled == 99);
    assert(a.value().remainder == 1);
    for (const auto& entry : a.value().entitlements) assert(entry.second == 33);
}

static void testAllocateSkipsZeroShares() {
    auto a = AllocationCalculator::allocate(1, snapshotOf({1, 999}));
    assert(a.ok());
    assert(a.value().entitlements.empty());
    assert(a.value().totalEntitled == 0);
    assert(a.value().remainder == 1);
}

static void testAllocateUnissuedSharesStayInPool() {
    // Shares not held by any listed holder leave their portion as remainder.
    auto a = AllocationCalculator::allocate(1000, snapshotOf({250, 250}, 1000));
    assert(a.ok());
    assert(a.value().totalEntitled == 500);
    assert(a.value().remainder == 500);
}

static void testAllocateConservesPool() {
    uint64_t seed = 0x9E3779B97F4A7C15ULL;
    auto next = [&seed]() {
        seed ^= seed << 13;
        seed ^= seed >> 7;
        seed ^= seed << 17;
        return seed;
    };
    for (int round = 0; round < 200; ++round) {
        ShareSnapshot snap;
        unsigned holders = 1 + static_cast<unsigned>(next() % 12);
        uint64_t sum = 0;
        for (unsigned h = 1; h <= holders; ++h) {
            uint64_t bal = 1 + next() % 100000;
            snap.balances[addr(h)] = bal;
            sum += bal;
        }
        snap.totalShares = sum + next() % 1000;
        uint64_t pool = next() % 1000000000000ULL;

        auto a = AllocationCalculator::allocate(pool, snap);
        assert(a.ok());
        assert(a.value().totalEntitled + a.value().remainder == pool);
        assert(a.value().totalEntitled <= pool);
        for (const auto& entry : a.value().entitlements) {
            auto single = AllocationCalculator::entitlementFor(pool, snap.balanceOf(entry.first), snap.totalShares);
            assert(single.ok() && single.value() == entry.second);
        }
    }
}

static void testAllocateRejectsOversubscribedSnapshot() {
    auto a = AllocationCalculator::allocate(1000, snapshotOf({600, 600}, 1000));
    assert(a.failed());
    assert(a.code() == ErrorCode::INVALID_SNAPSHOT);

    ShareSnapshot empty;
    a = AllocationCalculator::allocate(1000, empty);
    assert(a.failed());
    assert(a.code() == ErrorCode::DIVISION_BY_ZERO);
}

static void testCaptureSnapshot() {
    InMemoryShareRegistry registry(addr(0xAA));
    registry.setBalance(addr(1), 600);
    registry.setBalance("0x" + std::string(38, '0') + "0A", 400);

    auto snap = AllocationCalculator::captureSnapshot(registry, 1234);
    assert(snap.ok());
    assert(snap.value().takenAt == 1234);
    assert(snap.value().totalShares == 1000);
    assert(snap.value().balances.size() == 2);
    assert(snap.value().balanceOf("0x" + std::string(38, '0') + "0a") == 400);
    assert(snap.value().balanceOf(addr(99)) == 0);

    registry.setTotalShares(900);
    snap = AllocationCalculator::captureSnapshot(registry, 1234);
    assert(snap.failed());
    assert(snap.code() == ErrorCode::INVALID_SNAPSHOT);

    InMemoryShareRegistry empty(addr(0xAA));
    snap = AllocationCalculator::captureSnapshot(empty, 1);
    assert(snap.failed());
    assert(snap.code() == ErrorCode::DIVISION_BY_ZERO);
}

static void testDustPolicyNames() {
    DustPolicy p;
    assert(parseDustPolicy("carry", p) && p == DustPolicy::CARRY_FORWARD);
    assert(parseDustPolicy("SWEEP", p) && p == DustPolicy::SWEEP_TO_TREASURY);
    assert(!parseDustPolicy("burn", p));
    assert(!parseDustPolicy("sw\xC9" "ep", p));
    assert(!parseDustPolicy("\xFF\xFE", p));
    assert(p == DustPolicy::SWEEP_TO_TREASURY);
    assert(std::string(dustPolicyToString(DustPolicy::SWEEP_TO_TREASURY)) == "sweep");
}

int main() {
    std::cout << "Running allocation tests...\n";
    testEntitlementFloors();
    testEntitlementWideProduct();
    testEntitlementErrors();
    testAllocateSixHundredFourHundred();
    testAllocateThirds();
    testAllocateLeavesDust();
    testAllocateSkipsZeroShares();
    testAllocateUnissuedSharesStayInPool();
    testAllocateConservesPool();
    testAllocateRejectsOversubscribedSnapshot();
    testCaptureSnapshot();
    testDustPolicyNames();
    std::cout << "All allocation tests passed!\n";
    return 0;
}
