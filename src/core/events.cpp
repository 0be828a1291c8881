#include "core/events.h"
#include "utils/serialize.h"
#include <sstream>
#include <stdexcept>

namespace rentledger {
namespace core {

static constexpr uint8_t EVENT_RECORD_VERSION = 1;

const char* eventTypeToString(LedgerEventType type) {
    switch (type) {
        case LedgerEventType::DEPOSITED: return "Deposited";
        case LedgerEventType::ROUND_FINALIZED: return "RoundFinalized";
        case LedgerEventType::CLAIMED: return "Claimed";
        case LedgerEventType::ROLE_CHANGED: return "RoleChanged";
        case LedgerEventType::OWNERSHIP_PROPOSED: return "OwnershipProposed";
        case LedgerEventType::ROUND_CLOSED: return "RoundClosed";
        case LedgerEventType::DUST_SWEPT: return "DustSwept";
        default: return "Unknown";
    }
}

std::vector<uint8_t> LedgerEvent::serialize() const {
    utils::ByteBuffer buf;
    buf.writeUint8(EVENT_RECORD_VERSION);
    buf.writeUint64(sequence);
    buf.writeUint64(timestamp);
    buf.writeUint8(static_cast<uint8_t>(type));
    buf.writeUint64(roundId);
    buf.writeString(account);
    buf.writeUint64(amount);
    buf.writeUint8(static_cast<uint8_t>(role));
    buf.writeString(oldAddress);
    buf.writeString(newAddress);
    return buf.data();
}

bool LedgerEvent::deserialize(const std::vector<uint8_t>& data, LedgerEvent& out) {
    try {
        utils::ByteBuffer buf(data);
        if (buf.readUint8() != EVENT_RECORD_VERSION) return false;

        LedgerEvent ev;
        ev.sequence = buf.readUint64();
        ev.timestamp = buf.readUint64();
        uint8_t type = buf.readUint8();
        if (type > static_cast<uint8_t>(LedgerEventType::DUST_SWEPT)) return false;
        ev.type = static_cast<LedgerEventType>(type);
        ev.roundId = buf.readUint64();
        ev.account = buf.readString();
        ev.amount = buf.readUint64();
        uint8_t role = buf.readUint8();
        if (role > static_cast<uint8_t>(Role::RENTAL_WALLET)) return false;
        ev.role = static_cast<Role>(role);
        ev.oldAddress = buf.readString();
        ev.newAddress = buf.readString();
        if (!buf.exhausted()) return false;

        out = ev;
        return true;
    } catch (const std::runtime_error&) {
        return false;
    }
}

std::string LedgerEvent::toJson() const {
    std::stringstream ss;
    ss << "{";
    ss << "\"sequence\":" << sequence << ",";
    ss << "\"timestamp\":" << timestamp << ",";
    ss << "\"type\":\"" << eventTypeToString(type) << "\"";
    switch (type) {
        case LedgerEventType::DEPOSITED:
            ss << ",\"roundId\":" << roundId << ",\"from\":\"" << account << "\",\"amount\":" << amount;
            break;
        case LedgerEventType::ROUND_FINALIZED:
            ss << ",\"roundId\":" << roundId << ",\"totalEntitled\":" << amount;
            break;
        case LedgerEventType::CLAIMED:
            ss << ",\"roundId\":" << roundId << ",\"holder\":\"" << account << "\",\"amount\":" << amount;
            break;
        case LedgerEventType::ROLE_CHANGED:
            ss << ",\"role\":\"" << roleToString(role) << "\",\"oldAddress\":\"" << oldAddress
               << "\",\"newAddress\":\"" << newAddress << "\"";
            break;
        case LedgerEventType::OWNERSHIP_PROPOSED:
            ss << ",\"nominee\":\"" << account << "\"";
            break;
        case LedgerEventType::ROUND_CLOSED:
        case LedgerEventType::DUST_SWEPT:
            ss << ",\"roundId\":" << roundId << ",\"amount\":" << amount;
            break;
    }
    ss << "}";
    return ss.str();
}

}
}
