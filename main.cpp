// Config
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

// Engine
#include "ids/SnowflakeGenerator.hpp"
#include "node/Store.hpp"
#include "rbac/Resolver.hpp"

// Database
#include "db/PostgresBackend.hpp"

// Misc
#include "util/parse.hpp"
#include "util/timestamp.hpp"

// Libraries
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace canopy;
using namespace canopy::config;

namespace {

constexpr uint32_t MAX_MINT = 100000;

constexpr const auto* USAGE =
    "usage: canopy-admin [-c <config.yaml>] <command> [args...]\n"
    "\n"
    "commands:\n"
    "  schema                 create the node and grant tables\n"
    "  mint [n]               issue n ids (default 1) and show their parts\n"
    "  tree <node>            print a subtree, trashed nodes included\n"
    "  perms <node>           effective permission of every subject\n"
    "  resolve <user> <node>  effective level of one user and its source\n";

int usage() {
    std::cerr << USAGE;
    return 2;
}

std::shared_ptr<node::Store> openStore() {
    const auto& cnf = ConfigRegistry::get();
    auto backend = std::make_shared<db::PostgresBackend>(cnf.database);
    auto store = std::make_shared<node::Store>(backend, ids::makeGenerator(cnf.ids));
    store->load();
    return store;
}

void printSubtree(const node::Store& store, const node::model::Node& n, const size_t depth) {
    fmt::print("{}{}\n", std::string(depth * 2, ' '), node::model::to_string(n));
    auto cursor = store.listChildren(n.id, true);
    while (const auto child = cursor.next()) printSubtree(store, *child, depth + 1);
}

int cmdSchema() {
    const db::PostgresBackend backend(ConfigRegistry::get().database);
    fmt::print("schema ready\n");
    return 0;
}

int cmdMint(const std::vector<std::string>& args) {
    const auto count = args.empty() ? 1u : util::parseCount(args[0], MAX_MINT);
    const auto generator = ids::makeGenerator(ConfigRegistry::get().ids);
    for (uint32_t i = 0; i < count; ++i) {
        const auto id = generator->next();
        const auto parts = ids::decompose(id);
        fmt::print("{}  {}\n", id, ids::to_string(parts));
    }
    return 0;
}

int cmdTree(const std::vector<std::string>& args) {
    if (args.size() != 1) return usage();
    const auto store = openStore();
    printSubtree(*store, store->get(ids::parseSnowflake(args[0])), 0);
    return 0;
}

int cmdPerms(const std::vector<std::string>& args) {
    if (args.size() != 1) return usage();
    const auto store = openStore();
    const auto view = store->snapshot();
    for (const auto& [user, level] : rbac::Resolver::effectivePermissions(view.tree(), ids::parseSnowflake(args[0])))
        fmt::print("{}\t{}\n", user, rbac::to_string(level));
    return 0;
}

int cmdResolve(const std::vector<std::string>& args) {
    if (args.size() != 2) return usage();
    const auto user = ids::parseSnowflake(args[0]);
    const auto nodeId = ids::parseSnowflake(args[1]);
    const auto store = openStore();
    const auto view = store->snapshot();
    const nlohmann::json j = rbac::Resolver::explain(view.tree(), user, nodeId);
    fmt::print("{}\n", j.dump(2));
    return 0;
}

}

int main(const int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::filesystem::path configPath = DEFAULT_CONFIG_PATH;
    if (args.size() >= 2 && (args[0] == "-c" || args[0] == "--config")) {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) return usage();

    const auto cmd = args.front();
    args.erase(args.begin());

    try {
        ConfigRegistry::init(configPath);
        log::Registry::init(ConfigRegistry::get().logging);

        if (cmd == "schema") return cmdSchema();
        if (cmd == "mint") return cmdMint(args);
        if (cmd == "tree") return cmdTree(args);
        if (cmd == "perms") return cmdPerms(args);
        if (cmd == "resolve") return cmdResolve(args);
        return usage();
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized()) log::Registry::canopy()->error("[canopy-admin] {} failed: {}", cmd, e.what());
        fmt::print(stderr, "canopy-admin: {}\n", e.what());
        return 1;
    }
}
