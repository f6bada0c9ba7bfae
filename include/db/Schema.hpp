#pragma once

namespace canopy::db::schema {

// Creates the node and grant tables if absent. Idempotent.
void deploy();

}
