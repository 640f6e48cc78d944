/**
 * @file collaborators.hpp
 * @brief Capability interfaces the engine consumes
 *
 * Implementations report outages and timeouts by throwing
 * CollaboratorUnavailable. "Not found" style outcomes are ordinary return
 * values (found=false, std::nullopt).
 */

#pragma once

#include <core/types.hpp>
#include <tracking/route_geometry.hpp>
#include <optional>
#include <string>

namespace Stonetrail {

/**
 * @brief Image and text encoder sharing one vector space
 */
class EmbeddingService {
public:
    virtual ~EmbeddingService() = default;

    virtual Embedding embed_image(const Bytes& image) = 0;
    virtual Embedding embed_text(const std::string& text) = 0;
};

struct CropResult {
    Bytes cropped;
    Bytes thumbnail;
    bool found = false;
};

/**
 * @brief Background removal and subject crop
 */
class SubjectCropper {
public:
    virtual ~SubjectCropper() = default;

    virtual CropResult crop_subject(const Bytes& image) = 0;
};

class Geocoder {
public:
    virtual ~Geocoder() = default;

    /**
     * @brief Postal code to coordinates; std::nullopt when the code is unknown
     */
    virtual std::optional<GeoPoint> forward(const std::string& postal_code) = 0;

    /**
     * @brief Coordinates to a display address; std::nullopt when nothing is known
     */
    virtual std::optional<Address> reverse(const GeoPoint& point) = 0;
};

class RouteRenderer {
public:
    virtual ~RouteRenderer() = default;

    virtual Bytes render(const RouteGeometry& route) = 0;
};

} // namespace Stonetrail
