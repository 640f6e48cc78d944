#include <core/reply_json.hpp>
#include <utils/base64.hpp>
#include <utils/time.hpp>

namespace Stonetrail {

using json = nlohmann::json;

namespace {

template <typename T>
void put_optional(json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
}

} // namespace

void to_json(json& j, const GeoPoint& p) {
    j = json{{"lat", p.latitude}, {"lon", p.longitude}};
}

void to_json(json& j, const Address& a) {
    j = json::object();
    put_optional(j, "postal_code", a.postal_code);
    put_optional(j, "city", a.city);
    put_optional(j, "country", a.country);
    put_optional(j, "display_name", a.display_name);
}

void to_json(json& j, const HistoryRecord& r) {
    j = json{
        {"id", r.id},
        {"item_id", r.item_id},
        {"reported_by", r.reported_by},
        {"photo_ref", r.photo_ref},
        {"created_at", to_epoch_seconds(r.created_at)}
    };
    put_optional(j, "location", r.location);
    put_optional(j, "postal_code", r.postal_code);
}

void to_json(json& j, const ItemSummary& s) {
    j = json{
        {"id", s.id},
        {"name", s.name},
        {"registered_by", s.registered_by},
        {"history_count", s.history_count}
    };
    put_optional(j, "description", s.description);
    put_optional(j, "latest_location", s.latest_location);
}

void to_json(json& j, const RouteGeometry& g) {
    json points = json::array();
    for (const auto& p : g.points) {
        json jp{
            {"lat", p.position.latitude},
            {"lon", p.position.longitude},
            {"role", to_string(p.role)},
            {"record_id", p.record_id},
            {"observed_at", to_epoch_seconds(p.observed_at)}
        };
        put_optional(jp, "postal_code", p.postal_code);
        points.push_back(std::move(jp));
    }

    j = json{{"item_id", g.item_id}, {"points", std::move(points)}, {"length_m", g.length_m}};
    if (g.bounds) {
        j["bounds"] = json{{"min", g.bounds->min}, {"max", g.bounds->max}};
    }
}

void to_json(json& j, const MatchView& m) {
    j = json{{"item_id", m.item_id}, {"name", m.name}, {"similarity", m.similarity}};
    put_optional(j, "description", m.description);
}

void to_json(json& j, const Reply& r) {
    j = json{
        {"kind", to_string(r.kind)},
        {"code", to_string(r.code)},
        {"state", to_string(r.state)},
        {"language", r.language},
        {"session_expired", r.session_expired}
    };
    put_optional(j, "item", r.item);
    put_optional(j, "similarity", r.similarity);
    put_optional(j, "subject_found", r.subject_found);
    put_optional(j, "record", r.record);
    put_optional(j, "address", r.address);
    put_optional(j, "route", r.route);
    put_optional(j, "pending_name", r.pending_name);
    put_optional(j, "failure", r.failure);
    if (!r.matches.empty()) j["matches"] = r.matches;
    if (!r.items.empty()) j["items"] = r.items;
    if (!r.thumbnail.empty()) j["thumbnail_base64"] = base64_encode(r.thumbnail);
    if (!r.route_image.empty()) j["route_image_base64"] = base64_encode(r.route_image);
}

} // namespace Stonetrail
