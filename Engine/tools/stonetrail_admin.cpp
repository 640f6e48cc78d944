/**
 * @file stonetrail_admin.cpp
 * @brief Administrative CLI: schema setup, listings, routes and deletion
 */

#include <config/engine_config.hpp>
#include <core/errors.hpp>
#include <core/reply_json.hpp>
#include <database/connection_pool.hpp>
#include <storage/history_store.hpp>
#include <storage/item_store.hpp>
#include <tracking/history_tracker.hpp>
#include <tracking/route_builder.hpp>
#include <utils/logger.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace Stonetrail;

namespace {

void usage() {
    std::cerr << "Usage: stonetrail_admin <command> [args]\n"
              << "  init-schema [schema.sql]   Create tables (default Engine/sql/schema.sql)\n"
              << "  list                       All items with history counts\n"
              << "  mine <user_id>             Items registered by a user\n"
              << "  route <item_id>            Route geometry of an item as JSON\n"
              << "  delete <item_id>           Delete an item and its history\n";
}

std::int64_t parse_id(const char* arg) {
    try {
        size_t used = 0;
        long long v = std::stoll(arg, &used);
        if (used != std::string(arg).size() || v <= 0) throw std::invalid_argument(arg);
        return v;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("not a positive id: ") + arg);
    }
}

void print_items(const std::vector<Item>& items, HistoryTracker& tracker) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& item : items) out.push_back(tracker.summarize(item));
    std::cout << out.dump(2) << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }
    const std::string command = argv[1];

    // JSON goes to stdout; keep progress chatter out of it unless asked for
    if (!std::getenv("STONETRAIL_LOG_LEVEL")) {
        Logger::set_level(Logger::Level::Warning);
    }

    try {
        EngineConfig config = EngineConfig::from_env();
        config.validate();

        ConnectionPool pool(config.database.conninfo(), 1);

        if (command == "init-schema") {
            std::string path = argc > 2 ? argv[2] : "Engine/sql/schema.sql";
            std::ifstream in(path);
            if (!in) throw std::runtime_error("Cannot open " + path);
            std::stringstream sql;
            sql << in.rdbuf();

            auto db = pool.acquire();
            db->execute(sql.str());
            Logger::success("Schema applied from " + path);
            return 0;
        }

        PgItemStore items(pool);
        PgHistoryStore history(pool);
        SystemWallClock clock;
        HistoryTracker tracker(history, clock);

        if (command == "list") {
            print_items(items.list_all(), tracker);
        } else if (command == "mine" && argc > 2) {
            print_items(items.list_by_registrant(parse_id(argv[2])), tracker);
        } else if (command == "route" && argc > 2) {
            RouteBuilder routes(tracker);
            nlohmann::json out = routes.build_route(parse_id(argv[2]));
            std::cout << out.dump(2) << std::endl;
        } else if (command == "delete" && argc > 2) {
            ItemId id = parse_id(argv[2]);
            if (!items.remove(id)) {
                Logger::warn("Item " + std::to_string(id) + " does not exist");
                return 2;
            }
            // Running engines drop the vector on their next warm-up
            Logger::success("Deleted item " + std::to_string(id));
        } else {
            usage();
            return 1;
        }
    } catch (const ConfigError& e) {
        Logger::error(e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::error(std::string("Fatal: ") + e.what());
        return 1;
    }

    return 0;
}
