/**
 * @file fakes.hpp
 * @brief Deterministic collaborators for engine tests
 */

#pragma once

#include <core/errors.hpp>
#include <ports/collaborators.hpp>
#include <map>
#include <mutex>
#include <string>

namespace Stonetrail::testing {

inline Bytes bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

inline std::string text(const Bytes& b) {
    return std::string(b.begin(), b.end());
}

/// Unit vector along one axis.
inline Embedding axis(std::size_t dims, std::size_t i) {
    Embedding v(dims, 0.0f);
    v[i] = 1.0f;
    return v;
}

/**
 * @brief Embeddings looked up by image content / query text
 */
class FakeEmbedder final : public EmbeddingService {
public:
    void set_image(const std::string& image, Embedding e) {
        std::lock_guard<std::mutex> lock(mutex_);
        images_[image] = std::move(e);
    }

    void set_text(const std::string& query, Embedding e) {
        std::lock_guard<std::mutex> lock(mutex_);
        texts_[query] = std::move(e);
    }

    void set_unavailable(bool v) {
        std::lock_guard<std::mutex> lock(mutex_);
        unavailable_ = v;
    }

    Embedding embed_image(const Bytes& image) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++image_calls;
        if (unavailable_) throw CollaboratorUnavailable("embedding", "service down");
        auto it = images_.find(text(image));
        if (it == images_.end()) throw CollaboratorUnavailable("embedding", "unknown image " + text(image));
        return it->second;
    }

    Embedding embed_text(const std::string& query) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (unavailable_) throw CollaboratorUnavailable("embedding", "service down");
        auto it = texts_.find(query);
        if (it == texts_.end()) throw CollaboratorUnavailable("embedding", "unknown text " + query);
        return it->second;
    }

    int image_calls = 0;

private:
    std::mutex mutex_;
    std::map<std::string, Embedding> images_;
    std::map<std::string, Embedding> texts_;
    bool unavailable_ = false;
};

/**
 * @brief Crops by prefixing "crop:"; subject detection can be turned off
 *
 * With detection on, the embedder must know the "crop:<image>" key.
 */
class FakeCropper final : public SubjectCropper {
public:
    CropResult crop_subject(const Bytes& image) override {
        if (unavailable) throw CollaboratorUnavailable("cropper", "service down");
        CropResult r;
        r.thumbnail = bytes("thumb:" + text(image));
        if (detect) {
            r.found = true;
            r.cropped = bytes("crop:" + text(image));
        }
        return r;
    }

    bool detect = false;
    bool unavailable = false;
};

class FakeGeocoder final : public Geocoder {
public:
    std::optional<GeoPoint> forward(const std::string& postal_code) override {
        ++forward_calls;
        if (forward_unavailable) throw CollaboratorUnavailable("geocoder", "timeout");
        auto it = postal.find(postal_code);
        if (it == postal.end()) return std::nullopt;
        return it->second;
    }

    std::optional<Address> reverse(const GeoPoint&) override {
        ++reverse_calls;
        if (reverse_unavailable) throw CollaboratorUnavailable("geocoder", "timeout");
        return address;
    }

    std::map<std::string, GeoPoint> postal;
    std::optional<Address> address;
    bool forward_unavailable = false;
    bool reverse_unavailable = false;
    int forward_calls = 0;
    int reverse_calls = 0;
};

class FakeRenderer final : public RouteRenderer {
public:
    Bytes render(const RouteGeometry& route) override {
        ++calls;
        last = route;
        if (unavailable) throw CollaboratorUnavailable("renderer", "down");
        return bytes("png:" + std::to_string(route.points.size()));
    }

    bool unavailable = false;
    int calls = 0;
    RouteGeometry last;
};

} // namespace Stonetrail::testing
