/**
 * @file repositories.hpp
 * @brief Persistence ports for items, history and user preferences
 */

#pragma once

#include <core/types.hpp>
#include <optional>
#include <vector>

namespace Stonetrail {

/**
 * @brief Item persistence.
 *
 * register_item() stores the item and its first history record atomically:
 * either both exist afterwards or neither does.
 */
class ItemRepository {
public:
    virtual ~ItemRepository() = default;

    virtual Registration register_item(const NewItem& item, const Observation& first, Timestamp at) = 0;
    virtual std::optional<Item> find(ItemId id) = 0;
    virtual std::vector<Item> list_all() = 0;
    virtual std::vector<Item> list_by_registrant(UserId user) = 0;

    /**
     * @brief Delete an item and cascade its history. Returns false if it did not exist.
     */
    virtual bool remove(ItemId id) = 0;

    /**
     * @brief Embedding dimension enforced by the storage, if it enforces one
     */
    virtual std::optional<std::size_t> embedding_dimensions() { return std::nullopt; }
};

/**
 * @brief Append-only history persistence.
 */
class HistoryRepository {
public:
    virtual ~HistoryRepository() = default;

    virtual HistoryRecord append(ItemId item, const Observation& obs, Timestamp at) = 0;

    /**
     * @brief All records of an item ordered by (created_at, id) ascending
     */
    virtual std::vector<HistoryRecord> list_for_item(ItemId item) = 0;

    virtual std::size_t count_for_item(ItemId item) = 0;
};

class PreferenceRepository {
public:
    virtual ~PreferenceRepository() = default;

    virtual std::optional<UserPreference> find(UserId user) = 0;
    virtual void save(const UserPreference& pref) = 0;
};

} // namespace Stonetrail
