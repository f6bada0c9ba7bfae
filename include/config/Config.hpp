#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace canopy::config {

constexpr static uint16_t AUTO_GENERATOR_ID = UINT16_MAX;

struct IdsConfig {
    // AUTO_GENERATOR_ID derives the id from the host name at startup
    uint16_t generator_id = AUTO_GENERATOR_ID;
    std::chrono::milliseconds clock_skew_tolerance{10};
};

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "canopy";
    std::string user = "canopy";
    std::string password{}; // falls back to $CANOPY_DB_PASSWORD when empty
    unsigned int pool_size = 4;
};

struct StorageConfig {
    std::string endpoint = "https://s3.amazonaws.com";
    std::string region = "us-east-1";
    std::string bucket = "canopy-objects";
    std::string key_prefix = "nodes";
    std::string access_key{};
    std::string secret_access_key{};
    bool path_style = false;
    std::chrono::seconds presign_ttl{300};
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum canopy   = spdlog::level::info;   // startup/shutdown, hydration
    spdlog::level::level_enum ids      = spdlog::level::warn;   // clock skew, overflow waits
    spdlog::level::level_enum store    = spdlog::level::warn;   // structural rejections
    spdlog::level::level_enum rbac     = spdlog::level::warn;
    spdlog::level::level_enum gateway  = spdlog::level::info;
    spdlog::level::level_enum storage  = spdlog::level::warn;   // presign failures
    spdlog::level::level_enum db       = spdlog::level::err;    // unreachable DB, failed tx
    spdlog::level::level_enum auth     = spdlog::level::warn;   // malformed identity claims
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/canopy";
    LogLevelsConfig levels;
};

struct AuditConfig {
    bool log_allowed_decisions = true;
};

struct Config {
    IdsConfig ids;
    DatabaseConfig database;
    StorageConfig storage;
    LoggingConfig logging;
    AuditConfig auditing;
};

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const IdsConfig& c);
void to_json(nlohmann::json& j, const DatabaseConfig& c);
void to_json(nlohmann::json& j, const StorageConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const AuditConfig& c);

}
