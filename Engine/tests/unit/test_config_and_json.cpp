/**
 * @file test_config_and_json.cpp
 * @brief Engine configuration, reply serialization and base64
 */

#include <gtest/gtest.h>
#include <config/engine_config.hpp>
#include <core/errors.hpp>
#include <core/reply_json.hpp>
#include <utils/base64.hpp>
#include <utils/logger.hpp>
#include <cstdlib>

using namespace Stonetrail;

TEST(EngineConfigTest, Defaults) {
    EngineConfig c = EngineConfig::defaults();
    EXPECT_FLOAT_EQ(c.image_match_threshold, 0.82f);
    EXPECT_FLOAT_EQ(c.text_match_threshold, 0.25f);
    EXPECT_EQ(c.text_top_k, 5u);
    EXPECT_EQ(c.embedding_dimensions, 512u);
    EXPECT_EQ(c.session_ttl, std::chrono::seconds(1800));
    EXPECT_EQ(c.index_kind, IndexKind::Hnsw);
    EXPECT_EQ(c.hnsw.m, 16u);
    EXPECT_EQ(c.hnsw.ef_construction, 200u);
    EXPECT_NO_THROW(c.validate());
}

TEST(EngineConfigTest, JsonOverlay) {
    EngineConfig c;
    c.merge_json(R"({
        "matching": {"image_threshold": 0.9, "text_top_k": 3},
        "session": {"ttl_seconds": 600},
        "index": {"kind": "exact"},
        "database": {"host": "db.internal", "pool_size": 8}
    })");

    EXPECT_FLOAT_EQ(c.image_match_threshold, 0.9f);
    EXPECT_FLOAT_EQ(c.text_match_threshold, 0.25f);
    EXPECT_EQ(c.text_top_k, 3u);
    EXPECT_EQ(c.session_ttl, std::chrono::seconds(600));
    EXPECT_EQ(c.index_kind, IndexKind::Exact);
    EXPECT_EQ(c.database.host, "db.internal");
    EXPECT_EQ(c.database.pool_size, 8u);
}

TEST(EngineConfigTest, InvalidInputRaisesConfigError) {
    EngineConfig c;
    EXPECT_THROW(c.merge_json("{not json"), ConfigError);
    EXPECT_THROW(c.merge_json(R"({"matching": {"image_threshold": "high"}})"), ConfigError);
    EXPECT_THROW(c.merge_json(R"({"index": {"kind": "lsh"}})"), ConfigError);
    EXPECT_THROW(c.merge_json_file("/nonexistent/stonetrail.json"), ConfigError);

    EngineConfig bad;
    bad.image_match_threshold = 1.5f;
    EXPECT_THROW(bad.validate(), ConfigError);

    bad = EngineConfig{};
    bad.text_top_k = 0;
    EXPECT_THROW(bad.validate(), ConfigError);
}

TEST(EngineConfigTest, ConnInfo) {
    DatabaseConfig db;
    db.host = "h";
    db.port = "6543";
    db.dbname = "d";
    db.user = "u";
    EXPECT_EQ(db.conninfo(), "host=h port=6543 dbname=d user=u");

    db.password = "p";
    EXPECT_EQ(db.conninfo(), "host=h port=6543 dbname=d user=u password=p");

    db.url = "postgresql://x@y/z";
    EXPECT_EQ(db.conninfo(), "postgresql://x@y/z");
}

TEST(EngineConfigTest, FromEnvironment) {
    setenv("STONETRAIL_IMAGE_THRESHOLD", "0.75", 1);
    setenv("STONETRAIL_INDEX", "exact", 1);
    setenv("PGHOST", "envhost", 1);

    EngineConfig c = EngineConfig::from_env();
    EXPECT_FLOAT_EQ(c.image_match_threshold, 0.75f);
    EXPECT_EQ(c.index_kind, IndexKind::Exact);
    EXPECT_EQ(c.database.host, "envhost");

    setenv("STONETRAIL_WORKERS", "many", 1);
    EXPECT_THROW(EngineConfig::from_env(), ConfigError);

    unsetenv("STONETRAIL_IMAGE_THRESHOLD");
    unsetenv("STONETRAIL_INDEX");
    unsetenv("PGHOST");
    unsetenv("STONETRAIL_WORKERS");
}

TEST(ReplyJsonTest, SerializesConfirmation) {
    Reply r;
    r.kind = ReplyKind::Confirmation;
    r.code = ReplyCode::SightingRecorded;
    r.state = SessionState::Idle;
    r.language = "en";

    ItemSummary item;
    item.id = 7;
    item.name = "Stone";
    item.history_count = 2;
    item.latest_location = GeoPoint{52.23, 21.01};
    r.item = item;

    RouteGeometry route;
    route.item_id = 7;
    RoutePoint p;
    p.position = GeoPoint{52.23, 21.01};
    p.role = MarkerRole::Start;
    p.record_id = 3;
    route.points.push_back(p);
    r.route = route;
    r.route_image = {'P', 'N', 'G'};

    nlohmann::json j = r;
    EXPECT_EQ(j["kind"], "confirmation");
    EXPECT_EQ(j["code"], "sighting_recorded");
    EXPECT_EQ(j["state"], "idle");
    EXPECT_EQ(j["language"], "en");
    EXPECT_EQ(j["item"]["id"], 7);
    EXPECT_EQ(j["item"]["history_count"], 2);
    EXPECT_DOUBLE_EQ(j["item"]["latest_location"]["lat"].get<double>(), 52.23);
    EXPECT_EQ(j["route"]["points"][0]["role"], "start");
    EXPECT_EQ(j["route_image_base64"], "UE5H");
    EXPECT_FALSE(j.contains("failure"));
    EXPECT_FALSE(j.contains("matches"));
    EXPECT_FALSE(j.contains("thumbnail_base64"));
}

TEST(ReplyJsonTest, SerializesErrorAndMatches) {
    Reply r;
    r.kind = ReplyKind::Error;
    r.code = ReplyCode::RetryStep;
    r.failure = "geocoder";
    r.matches.push_back(MatchView{1, "Stone", std::string("grey"), 0.5f});

    nlohmann::json j = r;
    EXPECT_EQ(j["code"], "retry_step");
    EXPECT_EQ(j["failure"], "geocoder");
    ASSERT_EQ(j["matches"].size(), 1u);
    EXPECT_EQ(j["matches"][0]["description"], "grey");
}

TEST(Base64Test, EncodesAndDecodes) {
    EXPECT_EQ(base64_encode({}), "");
    EXPECT_EQ(base64_encode({'M'}), "TQ==");
    EXPECT_EQ(base64_encode({'M', 'a'}), "TWE=");
    EXPECT_EQ(base64_encode({'M', 'a', 'n'}), "TWFu");

    Bytes decoded = base64_decode("TWFu");
    EXPECT_EQ(std::string(decoded.begin(), decoded.end()), "Man");
    decoded = base64_decode("TQ==");
    EXPECT_EQ(std::string(decoded.begin(), decoded.end()), "M");

    EXPECT_THROW(base64_decode("T$=="), std::invalid_argument);
}

TEST(LoggerTest, LevelNamesAndOverride) {
    EXPECT_EQ(Logger::parse_level("debug"), Logger::Level::Debug);
    EXPECT_EQ(Logger::parse_level("warn"), Logger::Level::Warning);
    EXPECT_EQ(Logger::parse_level("off"), Logger::Level::Off);
    EXPECT_EQ(Logger::parse_level("bogus"), Logger::Level::Info);

    const Logger::Level before = Logger::min_level();
    Logger::set_level(Logger::Level::Error);
    EXPECT_EQ(Logger::min_level(), Logger::Level::Error);
    Logger::set_level(before);
}
