/**
 * @file route_builder.hpp
 * @brief Derives renderer-ready route geometry from an item's history
 */

#pragma once

#include <tracking/history_tracker.hpp>
#include <tracking/route_geometry.hpp>

namespace Stonetrail {

class RouteBuilder {
public:
    explicit RouteBuilder(HistoryTracker& tracker);

    RouteGeometry build_route(ItemId item);

    /**
     * @brief Pure geometry step over already ordered records
     */
    static RouteGeometry build_from_records(ItemId item, const std::vector<HistoryRecord>& ordered);

private:
    HistoryTracker& tracker_;
};

} // namespace Stonetrail
