/**
 * @file history_tracker.hpp
 * @brief Append-only sightings log per item
 */

#pragma once

#include <storage/repositories.hpp>
#include <utils/time.hpp>
#include <optional>
#include <vector>

namespace Stonetrail {

/**
 * @brief History tracker
 *
 * append() is the only mutation. list_ordered() is sorted by (created_at, id)
 * regardless of the order the repository returns rows in.
 */
class HistoryTracker {
public:
    HistoryTracker(HistoryRepository& repo, const WallClock& clock);

    HistoryRecord append(ItemId item, UserId reporter, const std::string& photo_ref,
                         const std::optional<GeoPoint>& location,
                         const std::optional<std::string>& postal_code = std::nullopt);

    std::vector<HistoryRecord> list_ordered(ItemId item);

    std::size_t count(ItemId item);

    /**
     * @brief Most recent record that carries coordinates
     */
    std::optional<HistoryRecord> latest_located(ItemId item);

    /**
     * @brief Item with its sighting count and latest located point
     */
    ItemSummary summarize(const Item& item);

private:
    HistoryRepository& repo_;
    const WallClock& clock_;
};

} // namespace Stonetrail
