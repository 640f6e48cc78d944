#include <storage/memory_store.hpp>
#include <core/errors.hpp>
#include <algorithm>

namespace Stonetrail {

// ---------------------------------------------------------------------------
// MemoryHistoryStore
// ---------------------------------------------------------------------------

void MemoryHistoryStore::check_available() const {
    if (unavailable_) {
        throw PersistenceError("history store unavailable");
    }
}

void MemoryHistoryStore::set_unavailable(bool unavailable) {
    std::lock_guard<std::mutex> lock(mutex_);
    unavailable_ = unavailable;
}

void MemoryHistoryStore::fail_next_read() {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_next_read_ = true;
}

void MemoryHistoryStore::check_readable() {
    check_available();
    if (fail_next_read_) {
        fail_next_read_ = false;
        throw PersistenceError("history read failed");
    }
}

HistoryRecord MemoryHistoryStore::append(ItemId item, const Observation& obs, Timestamp at) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available();

    HistoryRecord rec;
    rec.id = next_id_++;
    rec.item_id = item;
    rec.reported_by = obs.reported_by;
    rec.photo_ref = obs.photo_ref;
    rec.location = obs.location;
    rec.postal_code = obs.postal_code;
    rec.created_at = at;

    records_[item].push_back(rec);
    return rec;
}

std::vector<HistoryRecord> MemoryHistoryStore::list_for_item(ItemId item) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_readable();

    auto it = records_.find(item);
    if (it == records_.end()) return {};

    std::vector<HistoryRecord> out = it->second;
    std::stable_sort(out.begin(), out.end(), [](const HistoryRecord& a, const HistoryRecord& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.id < b.id;
    });
    return out;
}

std::size_t MemoryHistoryStore::count_for_item(ItemId item) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_readable();

    auto it = records_.find(item);
    return it == records_.end() ? 0 : it->second.size();
}

std::size_t MemoryHistoryStore::remove_item(ItemId item) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available();

    auto it = records_.find(item);
    if (it == records_.end()) return 0;
    std::size_t n = it->second.size();
    records_.erase(it);
    return n;
}

// ---------------------------------------------------------------------------
// MemoryItemStore
// ---------------------------------------------------------------------------

MemoryItemStore::MemoryItemStore(MemoryHistoryStore& history) : history_(history) {}

void MemoryItemStore::check_available() const {
    if (unavailable_) {
        throw PersistenceError("item store unavailable");
    }
}

void MemoryItemStore::set_unavailable(bool unavailable) {
    std::lock_guard<std::mutex> lock(mutex_);
    unavailable_ = unavailable;
}

Registration MemoryItemStore::register_item(const NewItem& item, const Observation& first, Timestamp at) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available();

    Item stored;
    stored.id = next_id_;
    stored.name = item.name;
    stored.description = item.description;
    stored.embedding = item.embedding;
    stored.photo_ref = item.photo_ref;
    stored.registered_by = item.registered_by;
    stored.created_at = at;

    // History first: if it throws, the item was never inserted
    HistoryRecord rec = history_.append(stored.id, first, at);

    ++next_id_;
    items_.emplace(stored.id, stored);
    return Registration{stored, rec};
}

std::optional<Item> MemoryItemStore::find(ItemId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available();

    auto it = items_.find(id);
    if (it == items_.end()) return std::nullopt;
    return it->second;
}

std::vector<Item> MemoryItemStore::list_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available();

    std::vector<Item> out;
    out.reserve(items_.size());
    for (const auto& [id, item] : items_) {
        out.push_back(item);
    }
    return out;
}

std::vector<Item> MemoryItemStore::list_by_registrant(UserId user) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available();

    std::vector<Item> out;
    for (const auto& [id, item] : items_) {
        if (item.registered_by == user) out.push_back(item);
    }
    return out;
}

bool MemoryItemStore::remove(ItemId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available();

    auto it = items_.find(id);
    if (it == items_.end()) return false;
    history_.remove_item(id);
    items_.erase(it);
    return true;
}

// ---------------------------------------------------------------------------
// MemoryPreferenceStore
// ---------------------------------------------------------------------------

std::optional<UserPreference> MemoryPreferenceStore::find(UserId user) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = prefs_.find(user);
    if (it == prefs_.end()) return std::nullopt;
    return it->second;
}

void MemoryPreferenceStore::save(const UserPreference& pref) {
    std::lock_guard<std::mutex> lock(mutex_);
    prefs_[pref.user_id] = pref;
}

} // namespace Stonetrail
