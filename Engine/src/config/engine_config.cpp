/**
 * @file engine_config.cpp
 * @brief Environment and JSON loading for EngineConfig
 */

#include <config/engine_config.hpp>
#include <core/errors.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace Stonetrail {

namespace {

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

double env_double(const char* name, double fallback) {
    const char* v = env(name);
    if (!v) return fallback;
    try {
        return std::stod(v);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " is not a number: " + v);
    }
}

long long env_int(const char* name, long long fallback) {
    const char* v = env(name);
    if (!v) return fallback;
    try {
        return std::stoll(v);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " is not an integer: " + v);
    }
}

std::size_t non_negative(long long v, const char* name) {
    if (v < 0) throw ConfigError(std::string(name) + " must not be negative");
    return static_cast<std::size_t>(v);
}

IndexKind parse_index_kind(const std::string& name) {
    if (name == "exact") return IndexKind::Exact;
    if (name == "hnsw") return IndexKind::Hnsw;
    throw ConfigError("unknown index kind '" + name + "' (expected exact or hnsw)");
}

} // namespace

std::string DatabaseConfig::conninfo() const {
    if (!url.empty()) return url;

    std::ostringstream conninfo;
    conninfo << "host=" << host << " ";
    conninfo << "port=" << port << " ";
    conninfo << "dbname=" << dbname << " ";
    conninfo << "user=" << user;
    if (!password.empty()) {
        conninfo << " password=" << password;
    }
    return conninfo.str();
}

EngineConfig EngineConfig::from_env() {
    EngineConfig config;

    config.image_match_threshold = static_cast<float>(
        env_double("STONETRAIL_IMAGE_THRESHOLD", config.image_match_threshold));
    config.text_match_threshold = static_cast<float>(
        env_double("STONETRAIL_TEXT_THRESHOLD", config.text_match_threshold));
    config.text_top_k = non_negative(
        env_int("STONETRAIL_TEXT_TOP_K", static_cast<long long>(config.text_top_k)), "STONETRAIL_TEXT_TOP_K");
    config.embedding_dimensions = non_negative(
        env_int("STONETRAIL_EMBEDDING_DIM", static_cast<long long>(config.embedding_dimensions)),
        "STONETRAIL_EMBEDDING_DIM");
    config.session_ttl = std::chrono::seconds(
        env_int("STONETRAIL_SESSION_TTL_SECONDS", config.session_ttl.count()));
    config.sweep_interval = std::chrono::seconds(
        env_int("STONETRAIL_SWEEP_INTERVAL_SECONDS", config.sweep_interval.count()));
    config.worker_threads = non_negative(
        env_int("STONETRAIL_WORKERS", static_cast<long long>(config.worker_threads)), "STONETRAIL_WORKERS");

    if (const char* kind = env("STONETRAIL_INDEX")) {
        config.index_kind = parse_index_kind(kind);
    }
    config.hnsw.ef_search = non_negative(
        env_int("STONETRAIL_HNSW_EF_SEARCH", static_cast<long long>(config.hnsw.ef_search)),
        "STONETRAIL_HNSW_EF_SEARCH");

    // Database: DATABASE_URL wins over the individual PG* variables
    auto& db = config.database;
    if (const char* v = env("DATABASE_URL")) db.url = v;
    if (const char* v = env("PGHOST")) db.host = v;
    if (const char* v = env("PGPORT")) db.port = v;
    if (const char* v = env("PGDATABASE")) db.dbname = v;
    if (const char* v = env("PGUSER")) db.user = v;
    if (const char* v = env("PGPASSWORD")) db.password = v;
    db.pool_size = non_negative(
        env_int("STONETRAIL_DB_POOL_SIZE", static_cast<long long>(db.pool_size)), "STONETRAIL_DB_POOL_SIZE");

    if (const char* path = env("STONETRAIL_CONFIG")) {
        config.merge_json_file(path);
    }

    config.validate();
    return config;
}

void EngineConfig::merge_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    merge_json(buffer.str());
}

void EngineConfig::merge_json(const std::string& json_text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("invalid JSON: ") + e.what());
    }

    try {
        if (j.contains("matching")) {
            const auto& m = j["matching"];
            image_match_threshold = m.value("image_threshold", image_match_threshold);
            text_match_threshold = m.value("text_threshold", text_match_threshold);
            text_top_k = m.value("text_top_k", text_top_k);
            embedding_dimensions = m.value("embedding_dimensions", embedding_dimensions);
        }
        if (j.contains("session")) {
            const auto& s = j["session"];
            session_ttl = std::chrono::seconds(s.value("ttl_seconds", static_cast<long long>(session_ttl.count())));
            sweep_interval = std::chrono::seconds(
                s.value("sweep_interval_seconds", static_cast<long long>(sweep_interval.count())));
            worker_threads = s.value("workers", worker_threads);
            min_name_length = s.value("min_name_length", min_name_length);
        }
        if (j.contains("index")) {
            const auto& idx = j["index"];
            if (idx.contains("kind")) index_kind = parse_index_kind(idx["kind"].get<std::string>());
            hnsw.m = idx.value("m", hnsw.m);
            hnsw.ef_construction = idx.value("ef_construction", hnsw.ef_construction);
            hnsw.ef_search = idx.value("ef_search", hnsw.ef_search);
            hnsw.initial_capacity = idx.value("initial_capacity", hnsw.initial_capacity);
        }
        if (j.contains("database")) {
            const auto& d = j["database"];
            database.url = d.value("url", database.url);
            database.host = d.value("host", database.host);
            database.port = d.value("port", database.port);
            database.dbname = d.value("dbname", database.dbname);
            database.user = d.value("user", database.user);
            database.password = d.value("password", database.password);
            database.pool_size = d.value("pool_size", database.pool_size);
        }
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigError(std::string("wrong value type: ") + e.what());
    }
}

void EngineConfig::validate() const {
    if (!(image_match_threshold > -1.0f && image_match_threshold <= 1.0f)) {
        throw ConfigError("image threshold must be in (-1, 1]");
    }
    if (!(text_match_threshold > -1.0f && text_match_threshold <= 1.0f)) {
        throw ConfigError("text threshold must be in (-1, 1]");
    }
    if (text_top_k == 0) throw ConfigError("text_top_k must be positive");
    if (embedding_dimensions == 0) throw ConfigError("embedding dimensions must be positive");
    if (session_ttl.count() <= 0) throw ConfigError("session TTL must be positive");
    if (sweep_interval.count() <= 0) throw ConfigError("sweep interval must be positive");
    if (worker_threads == 0) throw ConfigError("worker count must be positive");
    if (hnsw.m < 2) throw ConfigError("hnsw m must be at least 2");
    if (hnsw.ef_search == 0) throw ConfigError("hnsw ef_search must be positive");
    if (database.pool_size == 0) throw ConfigError("database pool size must be positive");
}

} // namespace Stonetrail
