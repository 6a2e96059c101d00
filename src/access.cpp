// =============================================================================
// access.cpp - Role-based capability checks
// =============================================================================

#include "lever/access.hpp"

namespace lever {

const char* role_name(Role role) {
    switch (role) {
        case Role::ADMIN: return "admin";
        case Role::LEVERAGE: return "leverage";
        case Role::MINTER: return "minter";
    }
    return "unknown";
}

AccessControl::AccessControl(const Address& owner) : owner_(owner) {}

int32_t AccessControl::transfer_ownership(const Address& caller, const Address& new_owner) {
    if (caller != owner_) return errors::UNAUTHORIZED;
    if (addresses::is_zero(new_owner)) return errors::INVALID_ADDRESS;
    owner_ = new_owner;
    return errors::OK;
}

int32_t AccessControl::grant(const Address& caller, const Address& who, Role role) {
    if (!has_role(caller, Role::ADMIN)) return errors::UNAUTHORIZED;
    if (addresses::is_zero(who)) return errors::INVALID_ADDRESS;
    roles_[who].insert(role);
    return errors::OK;
}

int32_t AccessControl::revoke(const Address& caller, const Address& who, Role role) {
    if (!has_role(caller, Role::ADMIN)) return errors::UNAUTHORIZED;
    auto it = roles_.find(who);
    if (it != roles_.end()) {
        it->second.erase(role);
        if (it->second.empty()) roles_.erase(it);
    }
    return errors::OK;
}

bool AccessControl::has_role(const Address& who, Role role) const {
    if (role == Role::ADMIN && who == owner_) return true;
    auto it = roles_.find(who);
    return it != roles_.end() && it->second.count(role) > 0;
}

int32_t AccessControl::require(const Address& caller, Role role) const {
    return has_role(caller, role) ? errors::OK : errors::UNAUTHORIZED;
}

} // namespace lever
