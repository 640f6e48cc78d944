#include "geometry/geo_bbox.hpp"
#include <cmath>
#include <numbers>

namespace Stonetrail::geo
{
    namespace
    {
        constexpr double kEarthRadiusM = 6371008.8;

        constexpr double radians(double deg) noexcept
        {
            return deg * std::numbers::pi / 180.0;
        }
    }

    double haversine_m(const GeoPoint& a, const GeoPoint& b) noexcept
    {
        const double dlat = radians(b.latitude - a.latitude);
        const double dlon = radians(b.longitude - a.longitude);
        const double s1 = std::sin(dlat / 2.0);
        const double s2 = std::sin(dlon / 2.0);
        double h = s1 * s1 + std::cos(radians(a.latitude)) * std::cos(radians(b.latitude)) * s2 * s2;
        if (h > 1.0) h = 1.0;
        return 2.0 * kEarthRadiusM * std::asin(std::sqrt(h));
    }
}
