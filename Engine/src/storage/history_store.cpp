#include <storage/history_store.hpp>
#include <storage/format_utils.hpp>
#include <core/errors.hpp>

namespace Stonetrail {

namespace {

const char* kRecordColumns =
    "id, item_id, reported_by, photo_ref, latitude, longitude, postal_code, "
    "EXTRACT(EPOCH FROM created_at)";

} // namespace

PgHistoryStore::PgHistoryStore(ConnectionPool& pool) : pool_(pool) {}

HistoryRecord PgHistoryStore::record_from_row(const SqlRow& row) {
    if (row.size() < 8) {
        throw PersistenceError("history row has " + std::to_string(row.size()) + " columns, expected 8");
    }

    HistoryRecord rec;
    rec.id = parse_int64(row[0], "id");
    rec.item_id = parse_int64(row[1], "item_id");
    rec.reported_by = parse_int64(row[2], "reported_by");
    rec.photo_ref = row[3].value_or("");
    if (row[4] && row[5]) {
        rec.location = GeoPoint{parse_double(*row[4], "latitude"), parse_double(*row[5], "longitude")};
    }
    rec.postal_code = row[6];
    if (!row[7]) {
        throw PersistenceError("Unexpected NULL in column created_at");
    }
    rec.created_at = timestamp_from_sql(*row[7]);
    return rec;
}

HistoryRecord PgHistoryStore::insert(PostgresConnection& db, ItemId item, const Observation& obs, Timestamp at) {
    std::optional<double> lat, lon;
    if (obs.location) {
        lat = obs.location->latitude;
        lon = obs.location->longitude;
    }

    std::optional<HistoryRecord> rec;
    db.query(
        std::string("INSERT INTO stonetrail.history "
                    "(item_id, reported_by, photo_ref, latitude, longitude, postal_code, created_at) "
                    "VALUES ($1, $2, $3, $4, $5, $6, to_timestamp($7)) RETURNING ") + kRecordColumns,
        {
            std::to_string(item),
            std::to_string(obs.reported_by),
            obs.photo_ref,
            optional_double(lat),
            optional_double(lon),
            optional_text(obs.postal_code),
            timestamp_to_sql(at)
        },
        [&](const SqlRow& row) { rec = record_from_row(row); });

    if (!rec) {
        throw PersistenceError("history insert returned no row");
    }
    return *rec;
}

HistoryRecord PgHistoryStore::append(ItemId item, const Observation& obs, Timestamp at) {
    auto db = pool_.acquire();
    return insert(*db, item, obs, at);
}

std::vector<HistoryRecord> PgHistoryStore::list_for_item(ItemId item) {
    auto db = pool_.acquire();
    std::vector<HistoryRecord> out;
    db->query(
        std::string("SELECT ") + kRecordColumns +
            " FROM stonetrail.history WHERE item_id = $1 ORDER BY created_at ASC, id ASC",
        {std::to_string(item)},
        [&](const SqlRow& row) { out.push_back(record_from_row(row)); });
    return out;
}

std::size_t PgHistoryStore::count_for_item(ItemId item) {
    auto db = pool_.acquire();
    auto n = db->query_single("SELECT COUNT(*) FROM stonetrail.history WHERE item_id = $1",
                              {std::to_string(item)});
    return static_cast<std::size_t>(parse_int64(n, "count"));
}

} // namespace Stonetrail
