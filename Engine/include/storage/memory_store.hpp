/**
 * @file memory_store.hpp
 * @brief In-process repositories for tests and ephemeral deployments
 */

#pragma once

#include <storage/repositories.hpp>
#include <map>
#include <mutex>
#include <unordered_map>

namespace Stonetrail {

class MemoryHistoryStore final : public HistoryRepository {
public:
    HistoryRecord append(ItemId item, const Observation& obs, Timestamp at) override;
    std::vector<HistoryRecord> list_for_item(ItemId item) override;
    std::size_t count_for_item(ItemId item) override;

    /**
     * @brief Drop all records of an item (cascade from item deletion)
     */
    std::size_t remove_item(ItemId item);

    /**
     * @brief Make subsequent calls throw PersistenceError (outage simulation)
     */
    void set_unavailable(bool unavailable);

    /**
     * @brief Make the next list or count call throw PersistenceError once
     */
    void fail_next_read();

private:
    void check_available() const;
    void check_readable();

    mutable std::mutex mutex_;
    RecordId next_id_ = 1;
    std::unordered_map<ItemId, std::vector<HistoryRecord>> records_;
    bool unavailable_ = false;
    bool fail_next_read_ = false;
};

/**
 * @brief In-memory items; owns the cascade into the companion history store.
 */
class MemoryItemStore final : public ItemRepository {
public:
    explicit MemoryItemStore(MemoryHistoryStore& history);

    Registration register_item(const NewItem& item, const Observation& first, Timestamp at) override;
    std::optional<Item> find(ItemId id) override;
    std::vector<Item> list_all() override;
    std::vector<Item> list_by_registrant(UserId user) override;
    bool remove(ItemId id) override;

    void set_unavailable(bool unavailable);

private:
    void check_available() const;

    MemoryHistoryStore& history_;
    mutable std::mutex mutex_;
    ItemId next_id_ = 1;
    std::map<ItemId, Item> items_;
    bool unavailable_ = false;
};

class MemoryPreferenceStore final : public PreferenceRepository {
public:
    std::optional<UserPreference> find(UserId user) override;
    void save(const UserPreference& pref) override;

private:
    std::mutex mutex_;
    std::unordered_map<UserId, UserPreference> prefs_;
};

} // namespace Stonetrail
