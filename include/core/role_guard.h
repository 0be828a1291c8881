#pragma once

#include "core/address.h"
#include "infrastructure/error_handling.h"
#include <string>
#include <cstdint>

namespace rentledger {
namespace core {

enum class Role : uint8_t {
    OWNER = 0,
    TREASURY = 1,
    OPERATOR = 2,
    RENTAL_WALLET = 3
};

const char* roleToString(Role role);

struct RoleSet {
    Address owner;
    Address treasury;
    Address operatorAddress;
    Address pendingOwner;
    Address rentalWallet;
};

struct RoleChange {
    Role role = Role::OWNER;
    Address oldAddress;
    Address newAddress;
};

// Holds the privileged principals of one ledger. Every check runs before any
// mutation, so a rejected call leaves the role set untouched.
class RoleGuard {
public:
    RoleGuard() = default;

    static Result<RoleGuard> create(const Address& owner, const Address& treasury, const Address& operatorAddress);
    // Rebuilds a guard from persisted roles, re-validating every address.
    static Result<RoleGuard> fromRoles(const RoleSet& roles);

    const RoleSet& roles() const { return roles_; }
    const Address& owner() const { return roles_.owner; }
    const Address& treasury() const { return roles_.treasury; }
    const Address& operatorAddress() const { return roles_.operatorAddress; }
    const Address& pendingOwner() const { return roles_.pendingOwner; }
    const Address& rentalWallet() const { return roles_.rentalWallet; }

    bool isOwner(const Address& caller) const;
    bool isTreasury(const Address& caller) const;
    bool isOperator(const Address& caller) const;

    Result<void> requireOwner(const Address& caller, const std::string& action) const;
    Result<void> requireOperator(const Address& caller, const std::string& action) const;
    Result<void> requireDepositor(const Address& caller, const std::string& action) const;

    Result<RoleChange> setTreasury(const Address& caller, const Address& treasury);
    Result<RoleChange> setOperator(const Address& caller, const Address& operatorAddress);
    Result<RoleChange> setRentalWallet(const Address& caller, const Address& wallet);

    // Two-phase ownership transfer: the current owner nominates, the nominee
    // accepts. Proposing again replaces the pending nominee.
    Result<void> proposeOwner(const Address& caller, const Address& nominee);
    Result<RoleChange> acceptOwnership(const Address& caller);

private:
    Result<RoleChange> reassign(const Address& caller, Role role, Address& slot, const Address& next);

    RoleSet roles_;
};

}
}
