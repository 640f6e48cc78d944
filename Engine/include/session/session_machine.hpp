/**
 * @file session_machine.hpp
 * @brief Finite-state machine of the registration / sighting conversation
 */

#pragma once

#include <config/engine_config.hpp>
#include <matching/identity_resolver.hpp>
#include <ports/collaborators.hpp>
#include <session/session.hpp>
#include <storage/repositories.hpp>
#include <tracking/history_tracker.hpp>
#include <tracking/route_builder.hpp>

namespace Stonetrail {

/**
 * @brief Session state machine
 *
 * Transitions (every other state/event pair re-prompts without changing state):
 *
 *   any        + Photo    -> AwaitingConfirmation (match) | AwaitingName (no match)
 *   non-Idle   + Cancel   -> Idle
 *   AwaitingName        + Text              -> AwaitingDescription
 *   AwaitingDescription + Text | Skip       -> AwaitingLocation
 *   AwaitingConfirmation + Location | Skip  -> commit sighting, Idle
 *   AwaitingLocation     + Location | Skip  -> commit new item, Idle
 *
 * dispatch() mutates the session it is given. Collaborator and persistence
 * failures propagate as exceptions; the caller owns rollback of the session.
 */
class SessionMachine {
public:
    struct Dependencies {
        EmbeddingService& embedder;
        SubjectCropper& cropper;
        Geocoder& geocoder;
        RouteRenderer* renderer;  // Optional
        ItemRepository& items;
        HistoryTracker& tracker;
        RouteBuilder& routes;
        SimilarityIndex& index;
        const WallClock& clock;
    };

    SessionMachine(const EngineConfig& config, Dependencies deps);

    Reply dispatch(Session& session, const SessionEvent& event);

    /**
     * @brief Postal code shape check: 3-10 chars, alphanumeric after removing '-' and ' ',
     *        with at least one digit
     */
    static bool looks_like_postal_code(const std::string& text);

    static std::string trim(const std::string& text);

private:
    struct ResolvedLocation {
        std::optional<GeoPoint> point;
        std::optional<std::string> postal_code;
        std::optional<Address> address;
    };

    Reply on_photo(Session& session, const PhotoUpload& photo);
    Reply on_text(Session& session, const std::string& text);
    Reply on_location(Session& session, const LocationInput& input);
    Reply on_skip(Session& session);
    Reply on_cancel(Session& session);

    Reply commit(Session& session, const ResolvedLocation& location);
    Reply commit_new_item(Session& session, const ResolvedLocation& location);
    Reply commit_sighting(Session& session, const ResolvedLocation& location);

    ResolvedLocation resolve_coordinates(const GeoPoint& point);
    ResolvedLocation resolve_postal_code(const std::string& postal_code);

    Embedding embed_photo(const Bytes& bytes);
    Reply prompt_for_state(const Session& session) const;

    const EngineConfig& config_;
    Dependencies deps_;
    IdentityResolver resolver_;
};

} // namespace Stonetrail
