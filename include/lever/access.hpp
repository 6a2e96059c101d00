#ifndef LEVER_ACCESS_HPP
#define LEVER_ACCESS_HPP

#include <map>
#include <set>

#include "types.hpp"

namespace lever {

enum class Role : uint8_t {
    ADMIN = 0,      // configuration and emergency surface
    LEVERAGE = 1,   // may act on a position on its owner's behalf
    MINTER = 2      // may mint/burn a token
};

const char* role_name(Role role);

// =============================================================================
// AccessControl - Capability predicate (caller identity x required role)
// =============================================================================

class AccessControl {
public:
    explicit AccessControl(const Address& owner);

    const Address& owner() const { return owner_; }

    int32_t transfer_ownership(const Address& caller, const Address& new_owner);

    int32_t grant(const Address& caller, const Address& who, Role role);
    int32_t revoke(const Address& caller, const Address& who, Role role);

    // The owner implicitly holds ADMIN
    bool has_role(const Address& who, Role role) const;

    // errors::OK or errors::UNAUTHORIZED
    int32_t require(const Address& caller, Role role) const;

private:
    Address owner_;
    std::map<Address, std::set<Role>> roles_;
};

} // namespace lever

#endif // LEVER_ACCESS_HPP
