#pragma once

#include "core/distributor.h"
#include "core/events.h"
#include "database/database.h"
#include "infrastructure/error_handling.h"
#include <vector>
#include <cstdint>

namespace rentledger {
namespace database {

// Persists a distributor's state and event log in a Database.
//
// Layout:
//   meta:schema          schema version (uint32)
//   meta:ledger          identity, roles, dust policy and counters
//   round:<id>           one record per round, snapshot included
//   claim:<id>:<holder>  presence marks a paid claim
//   event:<sequence>     serialized LedgerEvent
//
// Numeric key parts are zero padded so key order matches numeric order.
class LedgerStore {
public:
    static constexpr uint32_t SCHEMA_VERSION = 1;

    explicit LedgerStore(Database& db);

    bool exists() const;

    Result<void> save(const core::LedgerState& state);
    Result<core::LedgerState> load() const;

    // Events whose sequence is already stored are skipped.
    Result<void> appendEvents(const std::vector<core::LedgerEvent>& events);
    Result<std::vector<core::LedgerEvent>> loadEvents(uint64_t fromSequence = 0, size_t limit = 0) const;
    size_t eventCount() const;

    static std::string roundKey(uint64_t roundId);
    static std::string claimKey(uint64_t roundId, const core::Address& holder);
    static std::string eventKey(uint64_t sequence);

    static std::vector<uint8_t> serializeRound(const core::RoundRecord& round);
    static bool deserializeRound(const std::vector<uint8_t>& data, core::RoundRecord& out);

private:
    Database& db_;
};

}
}
