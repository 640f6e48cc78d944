#include <tracking/history_tracker.hpp>
#include <algorithm>

namespace Stonetrail {

HistoryTracker::HistoryTracker(HistoryRepository& repo, const WallClock& clock)
    : repo_(repo), clock_(clock) {}

HistoryRecord HistoryTracker::append(ItemId item, UserId reporter, const std::string& photo_ref,
                                     const std::optional<GeoPoint>& location,
                                     const std::optional<std::string>& postal_code) {
    Observation obs;
    obs.reported_by = reporter;
    obs.photo_ref = photo_ref;
    obs.location = location;
    obs.postal_code = postal_code;
    return repo_.append(item, obs, clock_.now());
}

std::vector<HistoryRecord> HistoryTracker::list_ordered(ItemId item) {
    auto records = repo_.list_for_item(item);
    std::sort(records.begin(), records.end(), [](const HistoryRecord& a, const HistoryRecord& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.id < b.id;
    });
    return records;
}

std::size_t HistoryTracker::count(ItemId item) {
    return repo_.count_for_item(item);
}

std::optional<HistoryRecord> HistoryTracker::latest_located(ItemId item) {
    auto records = list_ordered(item);
    for (auto it = records.rbegin(); it != records.rend(); ++it) {
        if (it->location) return *it;
    }
    return std::nullopt;
}

ItemSummary HistoryTracker::summarize(const Item& item) {
    ItemSummary s;
    s.id = item.id;
    s.name = item.name;
    s.description = item.description;
    s.registered_by = item.registered_by;
    s.history_count = count(item.id);
    if (auto latest = latest_located(item.id)) {
        s.latest_location = latest->location;
    }
    return s;
}

} // namespace Stonetrail
