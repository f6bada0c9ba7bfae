#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace canopy::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<IdsConfig> {
    static Node encode(const IdsConfig& rhs) {
        Node node;
        if (rhs.generator_id == AUTO_GENERATOR_ID) node["generator_id"] = "auto";
        else node["generator_id"] = rhs.generator_id;
        node["clock_skew_tolerance_ms"] = rhs.clock_skew_tolerance.count();
        return node;
    }

    static bool decode(const Node& node, IdsConfig& rhs) {
        if (!node.IsMap()) return false;
        const auto gen = node["generator_id"];
        if (!gen || gen.as<std::string>() == "auto") rhs.generator_id = AUTO_GENERATOR_ID;
        else rhs.generator_id = gen.as<uint16_t>();
        rhs.clock_skew_tolerance = std::chrono::milliseconds(node["clock_skew_tolerance_ms"].as<int64_t>(10));
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["pool_size"] = rhs.pool_size;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("canopy");
        rhs.user = node["user"].as<std::string>("canopy");
        rhs.password = node["password"].as<std::string>("");
        rhs.pool_size = node["pool_size"].as<unsigned int>(4);
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["endpoint"] = rhs.endpoint;
        node["region"] = rhs.region;
        node["bucket"] = rhs.bucket;
        node["key_prefix"] = rhs.key_prefix;
        node["path_style"] = rhs.path_style;
        node["presign_ttl_seconds"] = rhs.presign_ttl.count();
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.endpoint = node["endpoint"].as<std::string>("https://s3.amazonaws.com");
        rhs.region = node["region"].as<std::string>("us-east-1");
        rhs.bucket = node["bucket"].as<std::string>("canopy-objects");
        rhs.key_prefix = node["key_prefix"].as<std::string>("nodes");
        rhs.access_key = node["access_key"].as<std::string>("");
        rhs.secret_access_key = node["secret_access_key"].as<std::string>("");
        rhs.path_style = node["path_style"].as<bool>(false);
        rhs.presign_ttl = std::chrono::seconds(node["presign_ttl_seconds"].as<int64_t>(300));
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["canopy"]   = to_std_string(spdlog::level::to_string_view(rhs.canopy));
        node["ids"]      = to_std_string(spdlog::level::to_string_view(rhs.ids));
        node["store"]    = to_std_string(spdlog::level::to_string_view(rhs.store));
        node["rbac"]     = to_std_string(spdlog::level::to_string_view(rhs.rbac));
        node["gateway"]  = to_std_string(spdlog::level::to_string_view(rhs.gateway));
        node["storage"]  = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["db"]       = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["auth"]     = to_std_string(spdlog::level::to_string_view(rhs.auth));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.canopy = spdlog::level::from_str(node["canopy"].as<std::string>("info"));
        rhs.ids = spdlog::level::from_str(node["ids"].as<std::string>("warn"));
        rhs.store = spdlog::level::from_str(node["store"].as<std::string>("warn"));
        rhs.rbac = spdlog::level::from_str(node["rbac"].as<std::string>("warn"));
        rhs.gateway = spdlog::level::from_str(node["gateway"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("error"));
        rhs.auth = spdlog::level::from_str(node["auth"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/canopy");
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<AuditConfig> {
    static Node encode(const AuditConfig& rhs) {
        Node node;
        node["log_allowed_decisions"] = rhs.log_allowed_decisions;
        return node;
    }

    static bool decode(const Node& node, AuditConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_allowed_decisions = node["log_allowed_decisions"].as<bool>(true);
        return true;
    }
};

}
