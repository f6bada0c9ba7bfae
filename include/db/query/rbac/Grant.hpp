#pragma once

#include "ids/Snowflake.hpp"
#include "identity/Identity.hpp"

namespace canopy::rbac::model { struct Grant; }

namespace canopy::db::query::rbac {

class Grant {
    using GrantModel = canopy::rbac::model::Grant;

public:
    static void upsert(const GrantModel& grant);

    static void remove(ids::Snowflake nodeId, identity::UserId subjectId);
};

}
