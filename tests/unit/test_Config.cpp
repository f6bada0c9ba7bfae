#include <gtest/gtest.h>
#include "config/Config.hpp"

#include <nlohmann/json.hpp>

using namespace canopy::config;

TEST(ConfigTest, EmptyDocumentYieldsDefaults) {
    const auto cnf = loadConfigFromString("{}");
    EXPECT_EQ(cnf.ids.generator_id, AUTO_GENERATOR_ID);
    EXPECT_EQ(cnf.ids.clock_skew_tolerance, std::chrono::milliseconds(10));
    EXPECT_EQ(cnf.database.port, 5432);
    EXPECT_EQ(cnf.storage.key_prefix, "nodes");
    EXPECT_EQ(cnf.storage.presign_ttl, std::chrono::seconds(300));
    EXPECT_TRUE(cnf.auditing.log_allowed_decisions);
}

TEST(ConfigTest, ParsesEverySection) {
    const auto cnf = loadConfigFromString(R"(
ids:
  generator_id: 17
  clock_skew_tolerance_ms: 25
database:
  host: db.internal
  port: 6543
  name: tree
  user: svc
  password: hunter2
  pool_size: 8
storage:
  endpoint: http://minio:9000
  region: eu-west-1
  bucket: objects
  key_prefix: tenant-a
  access_key: AK
  secret_access_key: SK
  path_style: true
  presign_ttl_seconds: 60
logging:
  log_dir: /tmp/canopy-logs
  log_levels:
    console_log_level: debug
    file_log_level: error
    subsystem_levels:
      gateway: trace
      db: warn
auditing:
  log_allowed_decisions: false
)");

    EXPECT_EQ(cnf.ids.generator_id, 17);
    EXPECT_EQ(cnf.ids.clock_skew_tolerance, std::chrono::milliseconds(25));

    EXPECT_EQ(cnf.database.host, "db.internal");
    EXPECT_EQ(cnf.database.port, 6543);
    EXPECT_EQ(cnf.database.password, "hunter2");
    EXPECT_EQ(cnf.database.pool_size, 8u);

    EXPECT_EQ(cnf.storage.endpoint, "http://minio:9000");
    EXPECT_TRUE(cnf.storage.path_style);
    EXPECT_EQ(cnf.storage.secret_access_key, "SK");
    EXPECT_EQ(cnf.storage.presign_ttl, std::chrono::seconds(60));

    EXPECT_EQ(cnf.logging.log_dir.string(), "/tmp/canopy-logs");
    EXPECT_EQ(cnf.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cnf.logging.levels.file_log_level, spdlog::level::err);
    EXPECT_EQ(cnf.logging.levels.subsystem_levels.gateway, spdlog::level::trace);
    EXPECT_EQ(cnf.logging.levels.subsystem_levels.db, spdlog::level::warn);
    // untouched subsystems keep their defaults
    EXPECT_EQ(cnf.logging.levels.subsystem_levels.store, spdlog::level::warn);

    EXPECT_FALSE(cnf.auditing.log_allowed_decisions);
}

TEST(ConfigTest, AutoGeneratorIdIsExplicitlyAccepted) {
    const auto cnf = loadConfigFromString("ids:\n  generator_id: auto\n");
    EXPECT_EQ(cnf.ids.generator_id, AUTO_GENERATOR_ID);
}

TEST(ConfigTest, JsonDumpOmitsSecrets) {
    auto cnf = loadConfigFromString("{}");
    cnf.database.password = "hunter2";
    cnf.storage.access_key = "AK";
    cnf.storage.secret_access_key = "SK";

    const nlohmann::json j = cnf;
    EXPECT_FALSE(j.at("database").contains("password"));
    EXPECT_FALSE(j.at("storage").contains("access_key"));
    EXPECT_FALSE(j.at("storage").contains("secret_access_key"));
    EXPECT_EQ(j.at("ids").at("generator_id"), "auto");
    EXPECT_EQ(j.at("logging").at("levels").at("subsystem_levels").at("db"), "error");
    EXPECT_EQ(j.dump().find("hunter2"), std::string::npos);
}
