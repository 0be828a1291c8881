#include "database/database.h"
#include "database/db_adapters.h"
#include "database/ledger_store.h"
#include "core/distributor.h"
#include "utils/logger.h"
#include <cassert>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

using namespace rentledger;
using namespace rentledger::core;
using namespace rentledger::database;

static Address addr(unsigned n) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "0x%040x", n);
    return buf;
}

static const Address OWNER = addr(0x01);
static const Address TREASURY = addr(0x02);
static const Address OPERATOR = addr(0x03);
static const Address TOKEN = addr(0x7000);
static const Address USDC = addr(0x8000);
static const Address ALICE = addr(0x11);
static const Address BOB = addr(0x12);

static std::filesystem::path makeTempDir(const std::string& name) {
    auto uniq = std::to_string(static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
    auto dir = std::filesystem::temp_directory_path() / ("rentledger_" + name + "_" + uniq);
    std::filesystem::create_directories(dir);
    return dir;
}

static std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

static void testDatabaseBasics() {
    auto dir = makeTempDir("db");
    {
        Database db;
        assert(!db.isOpen());
        assert(db.open((dir / "kv.db").string()));
        assert(db.isOpen());

        assert(db.put("a:1", bytes("one")));
        assert(db.put("a:2", std::string("two")));
        assert(db.put("a_3", std::string("underscore")));
        assert(db.put("b:1", std::string("other")));
        assert(db.getString("a:2") == "two");
        assert(db.get("a:1") == bytes("one"));
        assert(db.get("missing").empty());
        assert(db.exists("b:1"));
        assert(!db.exists("b:2"));

        auto keys = db.keys("a:");
        assert(keys.size() == 2);
        assert(keys[0] == "a:1" && keys[1] == "a:2");
        assert(db.count("a") == 3);
        assert(db.count() == 4);

        size_t visited = 0;
        db.forEach("a:", [&visited](const std::string&, const std::vector<uint8_t>&) {
            visited++;
            return false;
        });
        assert(visited == 1);

        assert(db.del("a:1"));
        assert(!db.exists("a:1"));
    }
    {
        Database db;
        assert(db.open((dir / "kv.db").string()));
        assert(db.getString("a:2") == "two");
        assert(!db.exists("a:1"));
    }
    std::filesystem::remove_all(dir);
}

static void testDatabaseTransactions() {
    auto dir = makeTempDir("tx");
    Database db;
    assert(db.open((dir / "kv.db").string()));
    assert(db.put("keep", std::string("1")));

    assert(db.beginTransaction());
    assert(db.inTransaction());
    assert(db.put("temp", std::string("x")));
    WriteBatch batch;
    batch.put("batched", bytes("y"));
    batch.del("keep");
    assert(batch.size() == 2);
    assert(db.write(batch));
    assert(!db.exists("keep"));
    assert(db.rollbackTransaction());
    assert(!db.inTransaction());
    assert(db.exists("keep"));
    assert(!db.exists("temp"));
    assert(!db.exists("batched"));

    assert(db.beginTransaction());
    assert(db.put("temp", std::string("x")));
    assert(db.commitTransaction());
    assert(db.exists("temp"));

    WriteBatch prefixed;
    assert(db.put("round:1", std::string("r1")));
    assert(db.put("round:2", std::string("r2")));
    prefixed.delPrefix("round:");
    prefixed.put("round:3", bytes("r3"));
    assert(db.write(prefixed));
    assert(db.keys("round:").size() == 1);
    assert(db.exists("round:3"));

    std::filesystem::remove_all(dir);
}

static void testKeysAreOrdered() {
    assert(LedgerStore::roundKey(2) < LedgerStore::roundKey(10));
    assert(LedgerStore::eventKey(9) < LedgerStore::eventKey(100));
    assert(LedgerStore::claimKey(3, ALICE).find(ALICE) != std::string::npos);
}

static void testRoundRecordEncoding() {
    RoundRecord r;
    r.id = 7;
    r.state = RoundState::FINALIZED;
    r.deposited = 1000;
    r.carriedIn = 2;
    r.snapshot.totalShares = 10;
    r.snapshot.takenAt = 55;
    r.snapshot.balances[ALICE] = 6;
    r.snapshot.balances[BOB] = 4;
    r.totalEntitled = 1002;
    r.entitledHolders = 2;
    r.finalizedAt = 55;

    RoundRecord out;
    assert(LedgerStore::deserializeRound(LedgerStore::serializeRound(r), out));
    assert(out.id == 7 && out.state == RoundState::FINALIZED);
    assert(out.pool() == 1002);
    assert(out.snapshot.balanceOf(BOB) == 4);
    assert(out.entitledHolders == 2 && out.finalizedAt == 55);

    auto truncated = LedgerStore::serializeRound(r);
    truncated.resize(truncated.size() / 2);
    assert(!LedgerStore::deserializeRound(truncated, out));
}

static void testLoadWithoutLedgerFails() {
    auto dir = makeTempDir("empty");
    Database db;
    assert(db.open((dir / "ledger.db").string()));
    LedgerStore store(db);
    assert(!store.exists());
    auto loaded = store.load();
    assert(loaded.failed());
    assert(loaded.code() == ErrorCode::DATABASE_ERROR);

    assert(db.put("meta:schema", std::vector<uint8_t>{0, 0, 0, 9}));
    loaded = store.load();
    assert(loaded.code() == ErrorCode::DATABASE_ERROR);
    std::filesystem::remove_all(dir);
}

static void testShareRegistry() {
    auto dir = makeTempDir("shares");
    Database db;
    assert(db.open((dir / "ledger.db").string()));
    DatabaseShareRegistry registry(db, TOKEN);

    assert(registry.mint(ALICE, 600).ok());
    assert(registry.mint(BOB, 500).ok());
    assert(registry.burn(BOB, 100).ok());
    assert(registry.totalShares() == 1000);
    assert(registry.holders().size() == 2);

    assert(registry.mint(ZERO_ADDRESS, 1).code() == ErrorCode::INVALID_ADDRESS);
    assert(registry.mint(ALICE, 0).code() == ErrorCode::INVALID_AMOUNT);
    assert(registry.burn(BOB, 401).code() == ErrorCode::INVALID_AMOUNT);
    assert(registry.transfer(ALICE, ZERO_ADDRESS, 1).code() == ErrorCode::INVALID_ADDRESS);

    assert(registry.transfer(BOB, ALICE, 400).ok());
    assert(registry.balanceOf(ALICE) == 1000);
    assert(registry.balanceOf(BOB) == 0);
    assert(registry.holders().size() == 1);
    assert(registry.totalShares() == 1000);
    std::filesystem::remove_all(dir);
}

static void testVault() {
    auto dir = makeTempDir("vault");
    Database db;
    assert(db.open((dir / "ledger.db").string()));
    DatabaseVault vault(db, USDC);

    assert(vault.credit(TREASURY, 1000).ok());
    assert(vault.credit(ZERO_ADDRESS, 1).code() == ErrorCode::INVALID_ADDRESS);
    assert(vault.transferIn(TREASURY, 400).ok());
    assert(vault.balanceOf(TREASURY) == 600);
    assert(vault.custody() == 400);

    auto shortIn = vault.transferIn(TREASURY, 601);
    assert(shortIn.code() == ErrorCode::TRANSFER_FAILED);
    assert(shortIn.error().message == "insufficient balance: have 600, need 601");

    assert(vault.transferOut(ALICE, 150).ok());
    assert(vault.balanceOf(ALICE) == 150);
    assert(vault.custody() == 250);
    assert(vault.transferOut(ALICE, 251).code() == ErrorCode::TRANSFER_FAILED);
    assert(vault.transferOut(ZERO_ADDRESS, 1).code() == ErrorCode::TRANSFER_FAILED);
    assert(vault.custody() == 250);

    assert(vault.credit(BOB, UINT64_MAX).ok());
    assert(vault.transferOut(BOB, 1).code() == ErrorCode::TRANSFER_FAILED);
    assert(vault.balanceOf(BOB) == UINT64_MAX);
    assert(vault.custody() == 250);
    std::filesystem::remove_all(dir);
}

static std::unique_ptr<YieldDistributor> openLedger(Database& db, uint64_t now) {
    LedgerStore store(db);
    auto state = store.load();
    assert(state.ok());
    auto registry = std::make_shared<DatabaseShareRegistry>(db, state.value().registryAddress);
    auto vault = std::make_shared<DatabaseVault>(db, state.value().assetAddress);
    auto restored = YieldDistributor::restore(state.value(), registry, vault);
    assert(restored.ok());
    auto dist = std::move(restored.value());
    dist->setClock([now]() { return now; });
    return dist;
}

static void commitLedger(Database& db, const YieldDistributor& dist) {
    LedgerStore store(db);
    assert(store.save(dist.state()).ok());
    assert(store.appendEvents(dist.events()).ok());
}

static void testLifecycleAcrossRestarts() {
    auto dir = makeTempDir("lifecycle");
    std::string path = (dir / "ledger.db").string();
    const uint64_t t0 = 1700000000;

    {
        Database db;
        assert(db.open(path));
        auto registry = std::make_shared<DatabaseShareRegistry>(db, TOKEN);
        auto vault = std::make_shared<DatabaseVault>(db, USDC);
        assert(registry->mint(ALICE, 600).ok());
        assert(registry->mint(BOB, 400).ok());
        assert(vault->credit(TREASURY, 5000).ok());

        DistributorParams params;
        params.propertyId = 9;
        params.owner = OWNER;
        params.treasury = TREASURY;
        params.operatorAddress = OPERATOR;
        params.gracePeriod = 100;
        auto created = YieldDistributor::create(params, registry, vault);
        assert(created.ok());
        auto& dist = created.value();
        dist->setClock([t0]() { return t0; });
        assert(dist->deposit(TREASURY, 1000).ok());
        commitLedger(db, *dist);
    }
    {
        Database db;
        assert(db.open(path));
        auto dist = openLedger(db, t0 + 1);
        assert(dist->propertyId() == 9);
        assert(dist->roundState(0).value() == RoundState::FUNDED);
        assert(dist->finalizeRound(OPERATOR).value() == 0);
        assert(dist->claim(ALICE, 0).value() == 600);
        commitLedger(db, *dist);

        LedgerStore store(db);
        assert(store.eventCount() == 3);
        DatabaseVault vault(db, USDC);
        assert(vault.balanceOf(ALICE) == 600);
        assert(vault.custody() == 400);
    }
    {
        Database db;
        assert(db.open(path));
        auto dist = openLedger(db, t0 + 101);
        assert(dist->claim(ALICE, 0).code() == ErrorCode::ALREADY_CLAIMED);
        assert(dist->entitlementOf(0, BOB).value() == 400);
        assert(dist->closeRound(OWNER, 0).value() == 400);
        commitLedger(db, *dist);

        LedgerStore store(db);
        auto events = store.loadEvents();
        assert(events.ok());
        assert(events.value().size() == 4);
        for (size_t i = 0; i < events.value().size(); ++i) {
            assert(events.value()[i].sequence == i);
        }
        assert(events.value()[3].type == LedgerEventType::ROUND_CLOSED);

        auto tail = store.loadEvents(1, 2);
        assert(tail.ok() && tail.value().size() == 2);
        assert(tail.value()[0].type == LedgerEventType::ROUND_FINALIZED);

        assert(store.appendEvents(events.value()).ok());
        assert(store.eventCount() == 4);

        DatabaseVault vault(db, USDC);
        assert(vault.balanceOf(TREASURY) == 4400);
        assert(vault.custody() == 0);
        assert(dist->totals().fundsHeld == 0);
    }
    {
        Database db;
        assert(db.open(path));
        LedgerStore store(db);
        auto state = store.load();
        assert(state.ok());
        assert(state.value().rounds.size() == 2);
        assert(state.value().rounds[0].state == RoundState::CLOSED);
        assert(state.value().claims.at(0).count(ALICE) == 1);
        assert(state.value().nextEventSequence == 4);

        auto wrongVault = std::make_shared<DatabaseVault>(db, addr(0x8001));
        auto registry = std::make_shared<DatabaseShareRegistry>(db, TOKEN);
        auto restored = YieldDistributor::restore(state.value(), registry, wrongVault);
        assert(restored.code() == ErrorCode::INVALID_ADDRESS);
    }
    std::filesystem::remove_all(dir);
}

static void testRolledBackCommandLeavesNoTrace() {
    auto dir = makeTempDir("rollback");
    Database db;
    assert(db.open((dir / "ledger.db").string()));
    auto registry = std::make_shared<DatabaseShareRegistry>(db, TOKEN);
    auto vault = std::make_shared<DatabaseVault>(db, USDC);
    assert(registry->mint(ALICE, 1).ok());
    assert(vault->credit(TREASURY, 100).ok());

    DistributorParams params;
    params.owner = OWNER;
    params.treasury = TREASURY;
    params.operatorAddress = OPERATOR;
    auto created = YieldDistributor::create(params, registry, vault);
    assert(created.ok());
    commitLedger(db, *created.value());

    assert(db.beginTransaction());
    assert(created.value()->deposit(TREASURY, 60).ok());
    assert(vault->custody() == 60);
    assert(db.rollbackTransaction());
    assert(vault->custody() == 0);
    assert(vault->balanceOf(TREASURY) == 100);

    LedgerStore store(db);
    auto state = store.load();
    assert(state.ok());
    assert(state.value().totalDeposited == 0);
    assert(state.value().rounds[0].state == RoundState::EMPTY);
    std::filesystem::remove_all(dir);
}

int main() {
    utils::Logger::setLevel(utils::LogLevel::ERROR);
    std::cout << "Running ledger store tests...\n";
    testDatabaseBasics();
    testDatabaseTransactions();
    testKeysAreOrdered();
    testRoundRecordEncoding();
    testLoadWithoutLedgerFails();
    testShareRegistry();
    testVault();
    testLifecycleAcrossRestarts();
    testRolledBackCommandLeavesNoTrace();
    std::cout << "All ledger store tests passed!\n";
    return 0;
}
