#include "database/ledger_store.h"
#include "utils/serialize.h"
#include "utils/logger.h"
#include <cstdio>
#include <stdexcept>

namespace rentledger {
namespace database {

using core::Address;
using core::LedgerEvent;
using core::LedgerState;
using core::RoundRecord;
using core::RoundState;

static const char* KEY_SCHEMA = "meta:schema";
static const char* KEY_LEDGER = "meta:ledger";
static const char* PREFIX_ROUND = "round:";
static const char* PREFIX_CLAIM = "claim:";
static const char* PREFIX_EVENT = "event:";

static std::string padded(uint64_t value) {
    char buf[21];
    std::snprintf(buf, sizeof(buf), "%020llu", static_cast<unsigned long long>(value));
    return buf;
}

static Error storeError(const std::string& msg) {
    Error err = makeError(ErrorCode::DATABASE_ERROR, msg, "ledger_store");
    utils::Logger::log(utils::LogLevel::ERROR, "store", msg);
    ErrorHandler::instance().handle(err);
    return err;
}

LedgerStore::LedgerStore(Database& db) : db_(db) {}

std::string LedgerStore::roundKey(uint64_t roundId) {
    return PREFIX_ROUND + padded(roundId);
}

std::string LedgerStore::claimKey(uint64_t roundId, const Address& holder) {
    return PREFIX_CLAIM + padded(roundId) + ":" + core::AddressUtil::normalize(holder);
}

std::string LedgerStore::eventKey(uint64_t sequence) {
    return PREFIX_EVENT + padded(sequence);
}

std::vector<uint8_t> LedgerStore::serializeRound(const RoundRecord& r) {
    utils::ByteBuffer buf;
    buf.writeUint64(r.id);
    buf.writeUint8(static_cast<uint8_t>(r.state));
    buf.writeUint64(r.deposited);
    buf.writeUint64(r.carriedIn);
    buf.writeUint64(r.totalEntitled);
    buf.writeUint64(r.remainder);
    buf.writeUint64(r.claimedAmount);
    buf.writeUint64(r.entitledHolders);
    buf.writeUint64(r.claimedHolders);
    buf.writeUint64(r.finalizedAt);
    buf.writeUint64(r.closedAt);
    buf.writeUint64(r.sweptAmount);
    buf.writeUint64(r.snapshot.totalShares);
    buf.writeUint64(r.snapshot.takenAt);
    buf.writeVarInt(r.snapshot.balances.size());
    for (const auto& entry : r.snapshot.balances) {
        buf.writeString(entry.first);
        buf.writeUint64(entry.second);
    }
    return buf.data();
}

bool LedgerStore::deserializeRound(const std::vector<uint8_t>& data, RoundRecord& out) {
    try {
        utils::ByteBuffer buf(data);
        RoundRecord r;
        r.id = buf.readUint64();
        uint8_t state = buf.readUint8();
        if (state > static_cast<uint8_t>(RoundState::CLOSED)) return false;
        r.state = static_cast<RoundState>(state);
        r.deposited = buf.readUint64();
        r.carriedIn = buf.readUint64();
        r.totalEntitled = buf.readUint64();
        r.remainder = buf.readUint64();
        r.claimedAmount = buf.readUint64();
        r.entitledHolders = buf.readUint64();
        r.claimedHolders = buf.readUint64();
        r.finalizedAt = buf.readUint64();
        r.closedAt = buf.readUint64();
        r.sweptAmount = buf.readUint64();
        r.snapshot.totalShares = buf.readUint64();
        r.snapshot.takenAt = buf.readUint64();
        uint64_t holders = buf.readVarInt();
        for (uint64_t i = 0; i < holders; ++i) {
            std::string holder = buf.readString();
            r.snapshot.balances[holder] = buf.readUint64();
        }
        if (!buf.exhausted()) return false;
        out = r;
        return true;
    } catch (const std::runtime_error&) {
        return false;
    }
}

bool LedgerStore::exists() const {
    return db_.exists(KEY_SCHEMA);
}

Result<void> LedgerStore::save(const LedgerState& state) {
    utils::ByteBuffer schema;
    schema.writeUint32(SCHEMA_VERSION);

    utils::ByteBuffer meta;
    meta.writeUint64(state.propertyId);
    meta.writeString(state.registryAddress);
    meta.writeString(state.assetAddress);
    meta.writeUint64(state.gracePeriod);
    meta.writeUint8(static_cast<uint8_t>(state.dustPolicy));
    meta.writeString(state.roles.owner);
    meta.writeString(state.roles.treasury);
    meta.writeString(state.roles.operatorAddress);
    meta.writeString(state.roles.pendingOwner);
    meta.writeString(state.roles.rentalWallet);
    meta.writeUint64(state.totalDeposited);
    meta.writeUint64(state.totalPaidOut);
    meta.writeUint64(state.nextEventSequence);
    meta.writeUint64(state.rounds.size());

    WriteBatch batch;
    batch.delPrefix(PREFIX_ROUND);
    batch.delPrefix(PREFIX_CLAIM);
    batch.put(KEY_SCHEMA, schema.data());
    batch.put(KEY_LEDGER, meta.data());
    for (const auto& r : state.rounds) {
        batch.put(roundKey(r.id), serializeRound(r));
    }
    for (const auto& entry : state.claims) {
        for (const auto& holder : entry.second) {
            batch.put(claimKey(entry.first, holder), std::vector<uint8_t>{1});
        }
    }

    if (!db_.write(batch)) {
        return storeError("failed to save ledger state: " + db_.lastError());
    }
    LOG_DEBUG("saved ledger state with " + std::to_string(state.rounds.size()) + " rounds");
    return {};
}

Result<LedgerState> LedgerStore::load() const {
    auto schemaData = db_.get(KEY_SCHEMA);
    if (schemaData.empty()) {
        return storeError("no ledger has been initialized in " + db_.getPath());
    }

    LedgerState state;
    uint64_t roundCount = 0;
    try {
        utils::ByteBuffer schema(schemaData);
        uint32_t version = schema.readUint32();
        if (version != SCHEMA_VERSION) {
            return storeError("unsupported schema version " + std::to_string(version));
        }

        utils::ByteBuffer meta(db_.get(KEY_LEDGER));
        state.propertyId = meta.readUint64();
        state.registryAddress = meta.readString();
        state.assetAddress = meta.readString();
        state.gracePeriod = meta.readUint64();
        uint8_t policy = meta.readUint8();
        if (policy > static_cast<uint8_t>(core::DustPolicy::SWEEP_TO_TREASURY)) {
            return storeError("unknown dust policy in ledger record");
        }
        state.dustPolicy = static_cast<core::DustPolicy>(policy);
        state.roles.owner = meta.readString();
        state.roles.treasury = meta.readString();
        state.roles.operatorAddress = meta.readString();
        state.roles.pendingOwner = meta.readString();
        state.roles.rentalWallet = meta.readString();
        state.totalDeposited = meta.readUint64();
        state.totalPaidOut = meta.readUint64();
        state.nextEventSequence = meta.readUint64();
        roundCount = meta.readUint64();
    } catch (const std::runtime_error& e) {
        return storeError(std::string("corrupt ledger record: ") + e.what());
    }

    bool corrupt = false;
    db_.forEach(PREFIX_ROUND, [&](const std::string& key, const std::vector<uint8_t>& value) {
        RoundRecord r;
        if (!deserializeRound(value, r) || key != roundKey(r.id)) {
            corrupt = true;
            return false;
        }
        state.rounds.push_back(r);
        return true;
    });
    if (corrupt) return storeError("corrupt round record");
    if (state.rounds.size() != roundCount) {
        return storeError("expected " + std::to_string(roundCount) + " rounds, found " +
                          std::to_string(state.rounds.size()));
    }

    db_.forEach(PREFIX_CLAIM, [&](const std::string& key, const std::vector<uint8_t>&) {
        // claim:<20 digit round>:<holder>
        size_t idStart = std::string(PREFIX_CLAIM).size();
        if (key.size() <= idStart + 21 || key[idStart + 20] != ':' ||
            key.substr(idStart, 20).find_first_not_of("0123456789") != std::string::npos) {
            corrupt = true;
            return false;
        }
        uint64_t roundId = std::stoull(key.substr(idStart, 20));
        state.claims[roundId].insert(key.substr(idStart + 21));
        return true;
    });
    if (corrupt) return storeError("corrupt claim record");

    return state;
}

Result<void> LedgerStore::appendEvents(const std::vector<LedgerEvent>& events) {
    WriteBatch batch;
    for (const auto& ev : events) {
        std::string key = eventKey(ev.sequence);
        if (!db_.exists(key)) batch.put(key, ev.serialize());
    }
    if (batch.size() == 0) return {};
    if (!db_.write(batch)) {
        return storeError("failed to append events: " + db_.lastError());
    }
    return {};
}

Result<std::vector<LedgerEvent>> LedgerStore::loadEvents(uint64_t fromSequence, size_t limit) const {
    std::vector<LedgerEvent> events;
    bool corrupt = false;
    std::string first = eventKey(fromSequence);
    db_.forEach(PREFIX_EVENT, [&](const std::string& key, const std::vector<uint8_t>& value) {
        if (key < first) return true;
        LedgerEvent ev;
        if (!LedgerEvent::deserialize(value, ev)) {
            corrupt = true;
            return false;
        }
        events.push_back(ev);
        return limit == 0 || events.size() < limit;
    });
    if (corrupt) return storeError("corrupt event record");
    return events;
}

size_t LedgerStore::eventCount() const {
    return db_.count(PREFIX_EVENT);
}

}
}
