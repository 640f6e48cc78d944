/**
 * @file engine_config.hpp
 * @brief Engine configuration: thresholds, session TTL, index and database settings
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace Stonetrail {

enum class IndexKind {
    Exact,
    Hnsw
};

struct HnswParameters {
    std::size_t m = 16;
    std::size_t ef_construction = 200;
    std::size_t ef_search = 64;
    std::size_t initial_capacity = 1024;
};

struct DatabaseConfig {
    std::string host = "localhost";
    std::string port = "5432";
    std::string dbname = "stonetrail";
    std::string user = "postgres";
    std::string password;
    std::string url;            // Takes priority when set (DATABASE_URL)
    std::size_t pool_size = 4;

    std::string conninfo() const;
};

/**
 * @brief Engine configuration
 *
 * Defaults match the production deployment. from_env() reads STONETRAIL_*
 * variables plus the standard PG* ones; merge_json_file() overlays a JSON file.
 */
struct EngineConfig {
    // Matching
    float image_match_threshold = 0.82f;
    float text_match_threshold = 0.25f;
    std::size_t text_top_k = 5;
    std::size_t embedding_dimensions = 512;

    // Sessions
    std::chrono::seconds session_ttl{1800};
    std::chrono::seconds sweep_interval{60};
    std::size_t worker_threads = 4;

    // Names shorter than this are re-prompted
    std::size_t min_name_length = 2;

    // Similarity index
    IndexKind index_kind = IndexKind::Hnsw;
    HnswParameters hnsw;

    DatabaseConfig database;

    static EngineConfig defaults() { return EngineConfig{}; }
    static EngineConfig from_env();

    void merge_json_file(const std::string& path);
    void merge_json(const std::string& json_text);

    /// Throws ConfigError on out-of-range values.
    void validate() const;
};

} // namespace Stonetrail
