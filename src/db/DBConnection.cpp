#include "db/DBConnection.hpp"
#include "config/Config.hpp"
#include "util/s3Helpers.hpp"
#include "log/Registry.hpp"

#include <cstdlib>
#include <stdexcept>

namespace canopy::db {

std::string connectionString(const config::DatabaseConfig& cnf) {
    auto password = cnf.password;
    if (password.empty())
        if (const char* env = std::getenv("CANOPY_DB_PASSWORD")) password = env;

    std::string url = "postgresql://" + util::uriEncode(cnf.user);
    if (!password.empty()) url += ":" + util::uriEncode(password);
    return url + "@" + cnf.host + ":" + std::to_string(cnf.port) + "/" + util::uriEncode(cnf.name);
}

DBConnection::DBConnection(const config::DatabaseConfig& cnf) {
    try {
        conn_ = std::make_unique<pqxx::connection>(connectionString(cnf));
    } catch (const pqxx::broken_connection& e) {
        log::Registry::db()->error("[DBConnection] Cannot reach {}:{}/{}: {}", cnf.host, cnf.port, cnf.name, e.what());
        throw;
    }
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    initPreparedNodes();
    initPreparedGrants();
}

}
