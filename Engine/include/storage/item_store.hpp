/**
 * @file item_store.hpp
 * @brief PostgreSQL-backed item repository (pgvector canonical embeddings)
 */

#pragma once

#include <database/connection_pool.hpp>
#include <storage/repositories.hpp>

namespace Stonetrail {

class PgItemStore final : public ItemRepository {
public:
    explicit PgItemStore(ConnectionPool& pool);

    Registration register_item(const NewItem& item, const Observation& first, Timestamp at) override;
    std::optional<Item> find(ItemId id) override;
    std::vector<Item> list_all() override;
    std::vector<Item> list_by_registrant(UserId user) override;
    bool remove(ItemId id) override;

    /**
     * @brief Declared size of the items.embedding column (nullopt for untyped vector)
     */
    std::optional<std::size_t> embedding_dimensions() override;

private:
    static Item item_from_row(const SqlRow& row);

    ConnectionPool& pool_;
};

} // namespace Stonetrail
