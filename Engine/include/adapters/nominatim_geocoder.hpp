/**
 * @file nominatim_geocoder.hpp
 * @brief Geocoder over a Nominatim-compatible HTTP API
 */

#pragma once

#include <ports/collaborators.hpp>
#include <chrono>
#include <string>

namespace Stonetrail {

class NominatimGeocoder final : public Geocoder {
public:
    explicit NominatimGeocoder(std::string base_url = "https://nominatim.openstreetmap.org",
                               std::string user_agent = "stonetrail/1.0",
                               std::chrono::seconds timeout = std::chrono::seconds(10));

    std::optional<GeoPoint> forward(const std::string& postal_code) override;
    std::optional<Address> reverse(const GeoPoint& point) override;

    /**
     * @brief Parse a /reverse response body (exposed for tests)
     */
    static std::optional<Address> parse_reverse(const std::string& body);

    /**
     * @brief Parse a /search response body (exposed for tests)
     */
    static std::optional<GeoPoint> parse_search(const std::string& body);

private:
    std::string get(const std::string& path_with_query);

    std::string base_url_;
    std::string user_agent_;
    std::chrono::seconds timeout_;
};

} // namespace Stonetrail
