#include "core/role_guard.h"

namespace rentledger {
namespace core {

const char* roleToString(Role role) {
    switch (role) {
        case Role::OWNER: return "owner";
        case Role::TREASURY: return "treasury";
        case Role::OPERATOR: return "operator";
        case Role::RENTAL_WALLET: return "rentalWallet";
        default: return "unknown";
    }
}

static Result<void> validateRoleAddress(const Address& address, const char* role) {
    if (!AddressUtil::isValid(address)) {
        return makeError(ErrorCode::INVALID_ADDRESS, std::string(role) + " address cannot be zero");
    }
    return {};
}

Result<RoleGuard> RoleGuard::create(const Address& owner, const Address& treasury, const Address& operatorAddress) {
    RoleSet roles;
    roles.owner = owner;
    roles.treasury = treasury;
    roles.operatorAddress = operatorAddress;
    return fromRoles(roles);
}

Result<RoleGuard> RoleGuard::fromRoles(const RoleSet& roles) {
    auto r = validateRoleAddress(roles.owner, "owner");
    if (r.failed()) return r.error();
    r = validateRoleAddress(roles.treasury, "treasury");
    if (r.failed()) return r.error();
    r = validateRoleAddress(roles.operatorAddress, "operator");
    if (r.failed()) return r.error();
    if (!roles.pendingOwner.empty()) {
        r = validateRoleAddress(roles.pendingOwner, "pending owner");
        if (r.failed()) return r.error();
    }
    if (!roles.rentalWallet.empty()) {
        r = validateRoleAddress(roles.rentalWallet, "rental wallet");
        if (r.failed()) return r.error();
    }

    RoleGuard guard;
    guard.roles_.owner = AddressUtil::normalize(roles.owner);
    guard.roles_.treasury = AddressUtil::normalize(roles.treasury);
    guard.roles_.operatorAddress = AddressUtil::normalize(roles.operatorAddress);
    guard.roles_.pendingOwner = AddressUtil::normalize(roles.pendingOwner);
    guard.roles_.rentalWallet = AddressUtil::normalize(roles.rentalWallet);
    return guard;
}

bool RoleGuard::isOwner(const Address& caller) const {
    return !caller.empty() && AddressUtil::normalize(caller) == roles_.owner;
}

bool RoleGuard::isTreasury(const Address& caller) const {
    return !caller.empty() && AddressUtil::normalize(caller) == roles_.treasury;
}

bool RoleGuard::isOperator(const Address& caller) const {
    return !caller.empty() && AddressUtil::normalize(caller) == roles_.operatorAddress;
}

Result<void> RoleGuard::requireOwner(const Address& caller, const std::string& action) const {
    RENTLEDGER_CHECK(isOwner(caller), ErrorCode::UNAUTHORIZED, "only the owner may " + action);
    return {};
}

Result<void> RoleGuard::requireOperator(const Address& caller, const std::string& action) const {
    RENTLEDGER_CHECK(isOperator(caller), ErrorCode::UNAUTHORIZED, "only the operator may " + action);
    return {};
}

Result<void> RoleGuard::requireDepositor(const Address& caller, const std::string& action) const {
    RENTLEDGER_CHECK(isTreasury(caller) || isOperator(caller), ErrorCode::UNAUTHORIZED,
                     "only the treasury or operator may " + action);
    return {};
}

Result<RoleChange> RoleGuard::reassign(const Address& caller, Role role, Address& slot, const Address& next) {
    auto auth = requireOwner(caller, std::string("set the ") + roleToString(role));
    if (auth.failed()) return auth.error();
    auto valid = validateRoleAddress(next, roleToString(role));
    if (valid.failed()) return valid.error();

    RoleChange change;
    change.role = role;
    change.oldAddress = slot;
    change.newAddress = AddressUtil::normalize(next);
    slot = change.newAddress;
    return change;
}

Result<RoleChange> RoleGuard::setTreasury(const Address& caller, const Address& treasury) {
    return reassign(caller, Role::TREASURY, roles_.treasury, treasury);
}

Result<RoleChange> RoleGuard::setOperator(const Address& caller, const Address& operatorAddress) {
    return reassign(caller, Role::OPERATOR, roles_.operatorAddress, operatorAddress);
}

Result<RoleChange> RoleGuard::setRentalWallet(const Address& caller, const Address& wallet) {
    return reassign(caller, Role::RENTAL_WALLET, roles_.rentalWallet, wallet);
}

Result<void> RoleGuard::proposeOwner(const Address& caller, const Address& nominee) {
    auto auth = requireOwner(caller, "propose a new owner");
    if (auth.failed()) return auth;
    auto valid = validateRoleAddress(nominee, "nominee");
    if (valid.failed()) return valid;
    roles_.pendingOwner = AddressUtil::normalize(nominee);
    return {};
}

Result<RoleChange> RoleGuard::acceptOwnership(const Address& caller) {
    RENTLEDGER_CHECK(!roles_.pendingOwner.empty(), ErrorCode::UNAUTHORIZED, "no ownership transfer is pending");
    RENTLEDGER_CHECK(!caller.empty() && AddressUtil::normalize(caller) == roles_.pendingOwner,
                     ErrorCode::UNAUTHORIZED, "only the nominated owner may accept ownership");

    RoleChange change;
    change.role = Role::OWNER;
    change.oldAddress = roles_.owner;
    change.newAddress = roles_.pendingOwner;
    roles_.owner = roles_.pendingOwner;
    roles_.pendingOwner.clear();
    return change;
}

}
}
