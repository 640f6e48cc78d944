#pragma once

#include <core/types.hpp>
#include <geometry/geo_bbox.hpp>
#include <optional>
#include <vector>

namespace Stonetrail {

enum class MarkerRole {
    Start,
    Waypoint,
    End
};

const char* to_string(MarkerRole role);

struct RoutePoint {
    GeoPoint position;
    MarkerRole role = MarkerRole::Waypoint;
    RecordId record_id = 0;
    Timestamp observed_at{};
    std::optional<std::string> postal_code;
};

/**
 * @brief Renderer-ready route: located history in chronological order.
 *
 * Empty when the item has no located records; a single Start point when it has one.
 */
struct RouteGeometry {
    ItemId item_id = 0;
    std::vector<RoutePoint> points;
    std::optional<geo::GeoBBox> bounds;
    double length_m = 0.0;

    bool empty() const { return points.empty(); }
};

} // namespace Stonetrail
