#pragma once

#include <core/types.hpp>

namespace Stonetrail::geo
{
    /**
     * @brief Axis-aligned latitude/longitude box.
     */
    struct GeoBBox
    {
        GeoPoint min;
        GeoPoint max;
    };

    inline GeoBBox bbox_from_point(const GeoPoint& p) noexcept
    {
        return GeoBBox{p, p};
    }

    inline void bbox_expand(GeoBBox& b, const GeoPoint& p) noexcept
    {
        if (p.latitude < b.min.latitude) b.min.latitude = p.latitude;
        if (p.latitude > b.max.latitude) b.max.latitude = p.latitude;
        if (p.longitude < b.min.longitude) b.min.longitude = p.longitude;
        if (p.longitude > b.max.longitude) b.max.longitude = p.longitude;
    }

    inline bool bbox_contains(const GeoBBox& b, const GeoPoint& p) noexcept
    {
        return p.latitude >= b.min.latitude && p.latitude <= b.max.latitude &&
               p.longitude >= b.min.longitude && p.longitude <= b.max.longitude;
    }

    // Great-circle distance in meters (haversine).
    double haversine_m(const GeoPoint& a, const GeoPoint& b) noexcept;
}
