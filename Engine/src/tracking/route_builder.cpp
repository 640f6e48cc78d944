#include <tracking/route_builder.hpp>

namespace Stonetrail {

RouteBuilder::RouteBuilder(HistoryTracker& tracker) : tracker_(tracker) {}

RouteGeometry RouteBuilder::build_route(ItemId item) {
    return build_from_records(item, tracker_.list_ordered(item));
}

RouteGeometry RouteBuilder::build_from_records(ItemId item, const std::vector<HistoryRecord>& ordered) {
    RouteGeometry route;
    route.item_id = item;

    for (const auto& rec : ordered) {
        if (!rec.location) continue;

        RoutePoint p;
        p.position = *rec.location;
        p.record_id = rec.id;
        p.observed_at = rec.created_at;
        p.postal_code = rec.postal_code;

        if (route.bounds) {
            geo::bbox_expand(*route.bounds, p.position);
            route.length_m += geo::haversine_m(route.points.back().position, p.position);
        } else {
            route.bounds = geo::bbox_from_point(p.position);
        }
        route.points.push_back(std::move(p));
    }

    if (!route.points.empty()) {
        route.points.front().role = MarkerRole::Start;
        if (route.points.size() > 1) {
            route.points.back().role = MarkerRole::End;
        }
    }
    return route;
}

} // namespace Stonetrail
