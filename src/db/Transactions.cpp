#include "db/Transactions.hpp"
#include "config/Config.hpp"

using namespace canopy::db;

void Transactions::init(const config::DatabaseConfig& cnf) {
    if (dbPool_) {
        log::Registry::db()->warn("[Transactions] Already initialized, ignoring second init()");
        return;
    }
    dbPool_ = std::make_shared<DBPool>(cnf, cnf.pool_size == 0 ? 1 : cnf.pool_size);
    log::Registry::db()->debug("[Transactions] Opened {} connections to {}:{}/{}",
                               dbPool_->size(), cnf.host, cnf.port, cnf.name);
}

void Transactions::initPrepared() {
    if (!dbPool_) throw std::runtime_error("Transactions not initialized!");

    // Hold every connection so each one is prepared exactly once.
    std::vector<std::unique_ptr<DBConnection>> held;
    held.reserve(dbPool_->size());
    try {
        for (size_t i = 0; i < dbPool_->size(); ++i) {
            held.push_back(dbPool_->acquire());
            held.back()->initPrepared();
        }
    } catch (...) {
        for (auto& conn : held) dbPool_->release(std::move(conn));
        throw;
    }
    for (auto& conn : held) dbPool_->release(std::move(conn));
}
