#include <adapters/nominatim_geocoder.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdio>

namespace Stonetrail {

using json = nlohmann::json;

namespace {

std::string url_encode(const std::string& s) {
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        }
    }
    return out;
}

std::string format_coordinate(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.7f", v);
    return buf;
}

double coordinate(const json& v) {
    // Nominatim sends coordinates as strings
    if (v.is_string()) return std::stod(v.get<std::string>());
    return v.get<double>();
}

std::optional<std::string> string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace

NominatimGeocoder::NominatimGeocoder(std::string base_url, std::string user_agent, std::chrono::seconds timeout)
    : base_url_(std::move(base_url)), user_agent_(std::move(user_agent)), timeout_(timeout) {}

std::string NominatimGeocoder::get(const std::string& path_with_query) {
    httplib::Client cli(base_url_);
    cli.set_connection_timeout(timeout_);
    cli.set_read_timeout(timeout_);

    httplib::Headers headers = {{"User-Agent", user_agent_}};
    auto res = cli.Get(path_with_query, headers);
    if (!res) {
        throw CollaboratorUnavailable("geocoder", "request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw CollaboratorUnavailable("geocoder", "HTTP " + std::to_string(res->status));
    }
    return res->body;
}

std::optional<GeoPoint> NominatimGeocoder::forward(const std::string& postal_code) {
    std::string body = get("/search?postalcode=" + url_encode(postal_code) + "&format=json&limit=1");
    return parse_search(body);
}

std::optional<Address> NominatimGeocoder::reverse(const GeoPoint& point) {
    std::string body = get("/reverse?lat=" + format_coordinate(point.latitude) +
                           "&lon=" + format_coordinate(point.longitude) +
                           "&format=json&addressdetails=1");
    return parse_reverse(body);
}

std::optional<GeoPoint> NominatimGeocoder::parse_search(const std::string& body) {
    try {
        json j = json::parse(body);
        if (!j.is_array()) {
            throw CollaboratorUnavailable("geocoder", "search response is not an array");
        }
        if (j.empty()) return std::nullopt;

        const json& first = j.front();
        if (!first.contains("lat") || !first.contains("lon")) return std::nullopt;
        return GeoPoint{coordinate(first["lat"]), coordinate(first["lon"])};
    } catch (const json::exception& e) {
        throw CollaboratorUnavailable("geocoder", std::string("malformed search response: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw CollaboratorUnavailable("geocoder", std::string("malformed coordinate: ") + e.what());
    } catch (const std::out_of_range& e) {
        throw CollaboratorUnavailable("geocoder", std::string("malformed coordinate: ") + e.what());
    }
}

std::optional<Address> NominatimGeocoder::parse_reverse(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw CollaboratorUnavailable("geocoder", std::string("malformed reverse response: ") + e.what());
    }

    if (!j.is_object() || j.contains("error")) {
        return std::nullopt;
    }

    Address addr;
    addr.display_name = string_field(j, "display_name");

    auto it = j.find("address");
    if (it != j.end() && it->is_object()) {
        const json& a = *it;
        addr.postal_code = string_field(a, "postcode");
        addr.city = string_field(a, "city");
        if (!addr.city) addr.city = string_field(a, "town");
        if (!addr.city) addr.city = string_field(a, "village");
        addr.country = string_field(a, "country");
    }

    if (!addr.display_name && !addr.postal_code && !addr.city && !addr.country) {
        return std::nullopt;
    }
    return addr;
}

} // namespace Stonetrail
