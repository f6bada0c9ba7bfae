#include "node/model/Node.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/result>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

using namespace canopy::node::model;
using namespace canopy::util;

std::string canopy::node::model::to_string(const NodeType type) {
    switch (type) {
        case NodeType::Workspace: return "workspace";
        case NodeType::Category: return "category";
        case NodeType::Document: return "document";
        case NodeType::Resource: return "resource";
    }
    throw std::invalid_argument("Unknown node type");
}

NodeType canopy::node::model::nodeTypeFromString(const std::string& str) {
    std::string lower(str);
    std::ranges::transform(lower, lower.begin(), [](const unsigned char c) { return std::tolower(c); });

    if (lower == "workspace") return NodeType::Workspace;
    if (lower == "category") return NodeType::Category;
    if (lower == "document") return NodeType::Document;
    if (lower == "resource") return NodeType::Resource;
    throw std::invalid_argument("Unknown node type: " + str);
}

NodeType canopy::node::model::nodeTypeFromInt(const int value) {
    if (value < 0 || value > static_cast<int>(NodeType::Resource))
        throw std::invalid_argument("Node type out of range: " + std::to_string(value));
    return static_cast<NodeType>(value);
}

Node::Node(const pqxx::row& row)
    : id(row["id"].as<ids::Snowflake>()),
      type(nodeTypeFromInt(row["type"].as<int>())),
      name(row["name"].as<std::string>()),
      owner_id(row["owner_id"].as<identity::UserId>()),
      created_at(row["created_at"].as<std::time_t>()),
      updated_at(row["updated_at"].as<std::time_t>()) {
    if (row["parent_id"].is_null()) parent_id = std::nullopt;
    else parent_id = row["parent_id"].as<ids::Snowflake>();

    if (row["deleted_at"].is_null()) deleted_at = std::nullopt;
    else deleted_at = row["deleted_at"].as<std::time_t>();
}

std::vector<Node> canopy::node::model::nodes_from_pq_res(const pqxx::result& res) {
    std::vector<Node> nodes;
    nodes.reserve(res.size());
    for (const auto& row : res) nodes.emplace_back(row);
    return nodes;
}

void canopy::node::model::to_json(nlohmann::json& j, const Node& node) {
    j = {
        {"id", std::to_string(node.id)},
        {"type", to_string(node.type)},
        {"name", node.name},
        {"owner_id", node.owner_id},
        {"created_at", timestampToString(node.created_at)},
        {"updated_at", timestampToString(node.updated_at)}
    };

    if (node.parent_id) j["parent_id"] = std::to_string(*node.parent_id);
    else j["parent_id"] = nullptr;

    if (node.deleted_at) j["deleted_at"] = timestampToString(*node.deleted_at);
    else j["deleted_at"] = nullptr;
}

void canopy::node::model::from_json(const nlohmann::json& j, Node& node) {
    node.id = ids::parseSnowflake(j.at("id").get<std::string>());
    node.type = nodeTypeFromString(j.at("type").get<std::string>());
    node.name = j.value("name", std::string{});
    node.owner_id = j.at("owner_id").get<identity::UserId>();
    node.created_at = parseTimestampFromString(j.at("created_at").get<std::string>());
    node.updated_at = parseTimestampFromString(j.at("updated_at").get<std::string>());

    if (j.contains("parent_id") && !j.at("parent_id").is_null())
        node.parent_id = ids::parseSnowflake(j.at("parent_id").get<std::string>());
    else node.parent_id = std::nullopt;

    if (j.contains("deleted_at") && !j.at("deleted_at").is_null())
        node.deleted_at = parseTimestampFromString(j.at("deleted_at").get<std::string>());
    else node.deleted_at = std::nullopt;
}

std::string canopy::node::model::to_string(const Node& node) {
    std::ostringstream ss;
    ss << to_string(node.type) << " " << node.id << " '" << node.name << "'";
    if (node.parent_id) ss << " parent=" << *node.parent_id;
    ss << " owner=" << node.owner_id;
    if (node.deleted_at) ss << " [deleted " << timestampToString(*node.deleted_at) << "]";
    return ss.str();
}
