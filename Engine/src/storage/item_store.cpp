#include <storage/item_store.hpp>
#include <storage/history_store.hpp>
#include <storage/format_utils.hpp>
#include <core/errors.hpp>

namespace Stonetrail {

namespace {

const char* kItemColumns =
    "id, name, description, embedding::text, photo_ref, registered_by, "
    "EXTRACT(EPOCH FROM created_at)";

} // namespace

PgItemStore::PgItemStore(ConnectionPool& pool) : pool_(pool) {}

Item PgItemStore::item_from_row(const SqlRow& row) {
    if (row.size() < 7) {
        throw PersistenceError("item row has " + std::to_string(row.size()) + " columns, expected 7");
    }

    Item item;
    item.id = parse_int64(row[0], "id");
    item.name = row[1].value_or("");
    item.description = row[2];
    if (row[3]) item.embedding = embedding_from_pgvector(*row[3]);
    item.photo_ref = row[4].value_or("");
    item.registered_by = parse_int64(row[5], "registered_by");
    if (!row[6]) {
        throw PersistenceError("Unexpected NULL in column created_at");
    }
    item.created_at = timestamp_from_sql(*row[6]);
    return item;
}

Registration PgItemStore::register_item(const NewItem& item, const Observation& first, Timestamp at) {
    auto db = pool_.acquire();
    PostgresConnection::Transaction tx(*db);

    std::optional<Item> stored;
    db->query(
        std::string("INSERT INTO stonetrail.items "
                    "(name, description, embedding, photo_ref, registered_by, created_at) "
                    "VALUES ($1, $2, $3::vector, $4, $5, to_timestamp($6)) RETURNING ") + kItemColumns,
        {
            item.name,
            optional_text(item.description),
            embedding_to_pgvector(item.embedding),
            item.photo_ref,
            std::to_string(item.registered_by),
            timestamp_to_sql(at)
        },
        [&](const SqlRow& row) { stored = item_from_row(row); });

    if (!stored) {
        throw PersistenceError("item insert returned no row");
    }

    HistoryRecord rec = PgHistoryStore::insert(*db, stored->id, first, at);
    tx.commit();
    return Registration{*stored, rec};
}

std::optional<Item> PgItemStore::find(ItemId id) {
    auto db = pool_.acquire();
    std::optional<Item> out;
    db->query(std::string("SELECT ") + kItemColumns + " FROM stonetrail.items WHERE id = $1",
              {std::to_string(id)},
              [&](const SqlRow& row) { out = item_from_row(row); });
    return out;
}

std::vector<Item> PgItemStore::list_all() {
    auto db = pool_.acquire();
    std::vector<Item> out;
    db->query(std::string("SELECT ") + kItemColumns + " FROM stonetrail.items ORDER BY id",
              {},
              [&](const SqlRow& row) { out.push_back(item_from_row(row)); });
    return out;
}

std::vector<Item> PgItemStore::list_by_registrant(UserId user) {
    auto db = pool_.acquire();
    std::vector<Item> out;
    db->query(std::string("SELECT ") + kItemColumns +
                  " FROM stonetrail.items WHERE registered_by = $1 ORDER BY id",
              {std::to_string(user)},
              [&](const SqlRow& row) { out.push_back(item_from_row(row)); });
    return out;
}

bool PgItemStore::remove(ItemId id) {
    auto db = pool_.acquire();
    // history rows go with ON DELETE CASCADE
    return db->execute("DELETE FROM stonetrail.items WHERE id = $1", {std::to_string(id)}) > 0;
}

std::optional<std::size_t> PgItemStore::embedding_dimensions() {
    auto db = pool_.acquire();

    // pgvector stores the declared dimension as the column typmod
    std::optional<std::int64_t> typmod;
    db->query(
        "SELECT atttypmod FROM pg_attribute "
        "WHERE attrelid = 'stonetrail.items'::regclass AND attname = 'embedding'",
        {},
        [&](const SqlRow& row) { typmod = parse_int64(row.at(0), "atttypmod"); });

    if (!typmod) {
        throw PersistenceError("stonetrail.items.embedding column not found");
    }
    if (*typmod <= 0) return std::nullopt;
    return static_cast<std::size_t>(*typmod);
}

} // namespace Stonetrail
