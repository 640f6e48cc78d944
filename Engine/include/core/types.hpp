/**
 * @file types.hpp
 * @brief Shared data model: items, history records, matches, locations
 */

#pragma once

#include <utils/time.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Stonetrail {

using ItemId = std::int64_t;
using RecordId = std::int64_t;
using UserId = std::int64_t;
using Embedding = std::vector<float>;
using Bytes = std::vector<std::uint8_t>;

/**
 * @brief WGS84 coordinate pair.
 */
struct GeoPoint {
    double latitude = 0.0;
    double longitude = 0.0;

    bool operator==(const GeoPoint& other) const {
        return latitude == other.latitude && longitude == other.longitude;
    }
};

bool is_valid_geo_point(const GeoPoint& p);

/**
 * @brief Registered item. The canonical embedding is fixed at registration.
 */
struct Item {
    ItemId id = 0;
    std::string name;
    std::optional<std::string> description;
    Embedding embedding;
    std::string photo_ref;
    UserId registered_by = 0;
    Timestamp created_at{};
};

/**
 * @brief One observation of an item.
 */
struct HistoryRecord {
    RecordId id = 0;
    ItemId item_id = 0;
    UserId reported_by = 0;
    std::string photo_ref;
    std::optional<GeoPoint> location;
    std::optional<std::string> postal_code;
    Timestamp created_at{};
};

/**
 * @brief Observation payload before it is persisted.
 */
struct Observation {
    UserId reported_by = 0;
    std::string photo_ref;
    std::optional<GeoPoint> location;
    std::optional<std::string> postal_code;
};

struct NewItem {
    std::string name;
    std::optional<std::string> description;
    Embedding embedding;
    std::string photo_ref;
    UserId registered_by = 0;
};

struct Registration {
    Item item;
    HistoryRecord first_record;
};

struct Match {
    ItemId item_id = 0;
    float similarity = 0.0f;
};

/**
 * @brief Item plus the aggregates shown in listings.
 */
struct ItemSummary {
    ItemId id = 0;
    std::string name;
    std::optional<std::string> description;
    UserId registered_by = 0;
    std::size_t history_count = 0;
    std::optional<GeoPoint> latest_location;
};

struct UserPreference {
    UserId user_id = 0;
    std::string language;
};

/**
 * @brief Reverse-geocoded address, display only.
 */
struct Address {
    std::optional<std::string> postal_code;
    std::optional<std::string> city;
    std::optional<std::string> country;
    std::optional<std::string> display_name;
};

} // namespace Stonetrail
