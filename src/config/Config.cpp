#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace canopy::config {

static Config fromRoot(const YAML::Node& root) {
    Config cfg;

    if (auto node = root["ids"]) YAML::convert<IdsConfig>::decode(node, cfg.ids);
    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["auditing"]) YAML::convert<AuditConfig>::decode(node, cfg.auditing);

    return cfg;
}

Config loadConfig(const std::filesystem::path& path) {
    return fromRoot(YAML::LoadFile(path.string()));
}

Config loadConfigFromString(const std::string& yaml) {
    return fromRoot(YAML::Load(yaml));
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"ids", c.ids},
        {"database", c.database},
        {"storage", c.storage},
        {"logging", c.logging},
        {"auditing", c.auditing}
    };
}

void to_json(nlohmann::json& j, const IdsConfig& c) {
    j = {{"clock_skew_tolerance_ms", c.clock_skew_tolerance.count()}};
    if (c.generator_id == AUTO_GENERATOR_ID) j["generator_id"] = "auto";
    else j["generator_id"] = c.generator_id;
}

void to_json(nlohmann::json& j, const DatabaseConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"name", c.name},
        {"user", c.user},
        {"pool_size", c.pool_size}
    };
}

// Credentials are deliberately left out of the dump.
void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {
        {"endpoint", c.endpoint},
        {"region", c.region},
        {"bucket", c.bucket},
        {"key_prefix", c.key_prefix},
        {"path_style", c.path_style},
        {"presign_ttl_seconds", c.presign_ttl.count()}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", YAML::to_std_string(spdlog::level::to_string_view(c.console_log_level))},
        {"file_log_level", YAML::to_std_string(spdlog::level::to_string_view(c.file_log_level))},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    const auto name = [](const spdlog::level::level_enum lvl) {
        return YAML::to_std_string(spdlog::level::to_string_view(lvl));
    };

    j = {
        {"canopy", name(c.canopy)},
        {"ids", name(c.ids)},
        {"store", name(c.store)},
        {"rbac", name(c.rbac)},
        {"gateway", name(c.gateway)},
        {"storage", name(c.storage)},
        {"db", name(c.db)},
        {"auth", name(c.auth)}
    };
}

void to_json(nlohmann::json& j, const AuditConfig& c) {
    j = {{"log_allowed_decisions", c.log_allowed_decisions}};
}

}
