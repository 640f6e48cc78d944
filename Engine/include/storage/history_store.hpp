/**
 * @file history_store.hpp
 * @brief PostgreSQL-backed append-only history repository
 */

#pragma once

#include <database/connection_pool.hpp>
#include <storage/repositories.hpp>

namespace Stonetrail {

class PgHistoryStore final : public HistoryRepository {
public:
    explicit PgHistoryStore(ConnectionPool& pool);

    HistoryRecord append(ItemId item, const Observation& obs, Timestamp at) override;
    std::vector<HistoryRecord> list_for_item(ItemId item) override;
    std::size_t count_for_item(ItemId item) override;

    /**
     * @brief Insert a record on an existing connection (used inside item registration)
     */
    static HistoryRecord insert(PostgresConnection& db, ItemId item, const Observation& obs, Timestamp at);

    static HistoryRecord record_from_row(const SqlRow& row);

private:
    ConnectionPool& pool_;
};

} // namespace Stonetrail
