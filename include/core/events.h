#pragma once

#include "core/address.h"
#include "core/role_guard.h"
#include <string>
#include <vector>
#include <cstdint>

namespace rentledger {
namespace core {

enum class LedgerEventType : uint8_t {
    DEPOSITED = 0,
    ROUND_FINALIZED = 1,
    CLAIMED = 2,
    ROLE_CHANGED = 3,
    OWNERSHIP_PROPOSED = 4,
    ROUND_CLOSED = 5,
    DUST_SWEPT = 6
};

const char* eventTypeToString(LedgerEventType type);

// Notification for external observers. Only the fields relevant to the
// event type are populated:
//   DEPOSITED           roundId, account (payer), amount
//   ROUND_FINALIZED     roundId, amount (total entitled)
//   CLAIMED             roundId, account (holder), amount
//   ROLE_CHANGED        role, oldAddress, newAddress
//   OWNERSHIP_PROPOSED  account (nominee)
//   ROUND_CLOSED        roundId, amount (swept to treasury)
//   DUST_SWEPT          roundId, amount
struct LedgerEvent {
    uint64_t sequence = 0;
    uint64_t timestamp = 0;
    LedgerEventType type = LedgerEventType::DEPOSITED;
    uint64_t roundId = 0;
    Address account;
    uint64_t amount = 0;
    Role role = Role::OWNER;
    Address oldAddress;
    Address newAddress;

    std::vector<uint8_t> serialize() const;
    static bool deserialize(const std::vector<uint8_t>& data, LedgerEvent& out);
    std::string toJson() const;
};

}
}
