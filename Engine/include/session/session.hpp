/**
 * @file session.hpp
 * @brief Per-user conversational state and inbound events
 */

#pragma once

#include <core/reply.hpp>
#include <core/types.hpp>
#include <optional>
#include <string>

namespace Stonetrail {

/**
 * @brief Ephemeral per-user state of the registration/sighting flow
 *
 * Pending fields are meaningful only outside Idle. An Idle session is never
 * stored; the store drops it.
 */
struct Session {
    UserId user_id = 0;
    SessionState state = SessionState::Idle;
    std::string language;

    bool is_new = false;
    std::optional<Match> candidate;
    std::size_t candidate_history_count = 0;
    Embedding pending_embedding;
    std::string photo_ref;
    Bytes thumbnail;
    std::optional<std::string> name;
    std::optional<std::string> description;

    Timestamp started_at{};
    Timestamp last_activity{};

    /**
     * @brief Drop all pending data and return to Idle
     */
    void reset();
};

struct PhotoUpload {
    std::string reference;  // Opaque transport reference, persisted
    Bytes bytes;            // Raw image, never persisted
};

/**
 * @brief Coordinates or a postal code
 */
struct LocationInput {
    std::optional<GeoPoint> point;
    std::optional<std::string> postal_code;

    static LocationInput coordinates(double latitude, double longitude) {
        LocationInput in;
        in.point = GeoPoint{latitude, longitude};
        return in;
    }

    static LocationInput postal(const std::string& code) {
        LocationInput in;
        in.postal_code = code;
        return in;
    }
};

enum class EventKind {
    Photo,
    Text,
    Location,
    Skip,
    Cancel
};

const char* to_string(EventKind kind);

struct SessionEvent {
    EventKind kind = EventKind::Cancel;
    PhotoUpload photo;
    std::string text;
    LocationInput location;

    static SessionEvent photo_event(PhotoUpload upload) {
        SessionEvent e;
        e.kind = EventKind::Photo;
        e.photo = std::move(upload);
        return e;
    }

    static SessionEvent text_event(std::string text) {
        SessionEvent e;
        e.kind = EventKind::Text;
        e.text = std::move(text);
        return e;
    }

    static SessionEvent location_event(LocationInput input) {
        SessionEvent e;
        e.kind = EventKind::Location;
        e.location = std::move(input);
        return e;
    }

    static SessionEvent skip_event() {
        SessionEvent e;
        e.kind = EventKind::Skip;
        return e;
    }

    static SessionEvent cancel_event() {
        SessionEvent e;
        e.kind = EventKind::Cancel;
        return e;
    }
};

} // namespace Stonetrail
