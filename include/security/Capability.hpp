#pragma once

#include "security/Action.hpp"
#include "ids/Snowflake.hpp"
#include "identity/Identity.hpp"

#include <optional>

namespace canopy::security {

class AccessGateway;

// Proof that the gateway authorized one action on one node. Store mutators
// take one and refuse any whose action or target does not match the call.
class Capability {
public:
    [[nodiscard]] identity::UserId actor() const { return actor_; }
    [[nodiscard]] Action action() const { return action_; }
    [[nodiscard]] const std::optional<ids::Snowflake>& target() const { return target_; }
    [[nodiscard]] rbac::PermissionLevel level() const { return level_; }

private:
    friend class AccessGateway;

    Capability(const identity::UserId actor, const Action action, const std::optional<ids::Snowflake> target,
               const rbac::PermissionLevel level)
        : actor_(actor), action_(action), target_(target), level_(level) {}

    identity::UserId actor_;
    Action action_;
    std::optional<ids::Snowflake> target_;
    rbac::PermissionLevel level_;
};

}
