#pragma once

#include "ids/Snowflake.hpp"
#include "identity/Identity.hpp"

#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
class result;
}

namespace canopy::node::model {

enum class NodeType : uint8_t {
    Workspace = 0,
    Category = 1,
    Document = 2,
    Resource = 3,
};

[[nodiscard]] std::string to_string(NodeType type);
[[nodiscard]] NodeType nodeTypeFromString(const std::string& str);
[[nodiscard]] NodeType nodeTypeFromInt(int value);

// Resources are leaves; everything else may hold children.
[[nodiscard]] constexpr bool canHaveChildren(const NodeType type) { return type != NodeType::Resource; }

// Only documents and resources are backed by a storage object.
[[nodiscard]] constexpr bool carriesObject(const NodeType type) {
    return type == NodeType::Document || type == NodeType::Resource;
}

struct Node {
    ids::Snowflake id{};
    NodeType type{NodeType::Workspace};
    std::string name{};
    std::optional<ids::Snowflake> parent_id{};
    identity::UserId owner_id{};
    std::time_t created_at{}, updated_at{};
    std::optional<std::time_t> deleted_at{};

    Node() = default;
    explicit Node(const pqxx::row& row);

    [[nodiscard]] bool isWorkspace() const { return type == NodeType::Workspace; }
    [[nodiscard]] bool isDeleted() const { return deleted_at.has_value(); }

    [[nodiscard]] bool operator==(const Node& other) const = default;
};

void to_json(nlohmann::json& j, const Node& node);
void from_json(const nlohmann::json& j, Node& node);

std::vector<Node> nodes_from_pq_res(const pqxx::result& res);

std::string to_string(const Node& node);

}
