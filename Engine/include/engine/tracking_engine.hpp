/**
 * @file tracking_engine.hpp
 * @brief Transport-facing facade of the identity resolution & tracking engine
 */

#pragma once

#include <config/engine_config.hpp>
#include <export.hpp>
#include <matching/similarity_index.hpp>
#include <matching/text_query_resolver.hpp>
#include <ports/collaborators.hpp>
#include <session/session_machine.hpp>
#include <session/session_store.hpp>
#include <storage/repositories.hpp>
#include <tracking/history_tracker.hpp>
#include <tracking/route_builder.hpp>
#include <memory>
#include <string>
#include <vector>

namespace Stonetrail {

/**
 * @brief Tracking engine
 *
 * Every handle_* call runs one step of the calling user's conversation under
 * that user's exclusive session lock. A step that fails (collaborator outage,
 * database error) leaves the session exactly as it was before the call, so the
 * transport can simply resend the same input.
 *
 * Thread-safe: different users may be served concurrently from any threads.
 */
class STONETRAIL_API TrackingEngine {
public:
    struct Repositories {
        ItemRepository& items;
        HistoryRepository& history;
        PreferenceRepository& preferences;
    };

    struct Collaborators {
        EmbeddingService& embedder;
        SubjectCropper& cropper;
        Geocoder& geocoder;
        RouteRenderer* renderer = nullptr;
    };

    static constexpr const char* kDefaultLanguage = "pl";

    TrackingEngine(EngineConfig config, Repositories repos, Collaborators collaborators,
                   const WallClock& clock, std::unique_ptr<SimilarityIndex> index = nullptr);

    TrackingEngine(const TrackingEngine&) = delete;
    TrackingEngine& operator=(const TrackingEngine&) = delete;

    /**
     * @brief Rebuild the similarity index from persisted items
     * @return Number of indexed items
     */
    std::size_t warm_index();

    // Conversation
    Reply handle_photo(UserId user, const PhotoUpload& photo);
    Reply handle_text(UserId user, const std::string& text);
    Reply handle_location(UserId user, const LocationInput& location);
    Reply handle_skip(UserId user);
    Reply handle_cancel(UserId user);

    /**
     * @brief Single dispatch point for all conversation events
     */
    Reply dispatch(UserId user, const SessionEvent& event);

    // Search (independent of the session)
    Reply handle_text_search(UserId user, const std::string& query);

    // Listings and preferences
    Reply user_items(UserId user);
    std::vector<ItemSummary> catalog_overview();
    RouteGeometry route(ItemId item);
    Reply set_language(UserId user, const std::string& code);
    std::string language(UserId user);

    static bool is_supported_language(const std::string& code);

    /**
     * @brief Administrative deletion: item, its history, and its index entry
     */
    bool delete_item(ItemId item);

    std::size_t sweep_expired_sessions();

    /**
     * @brief Current state of a user's session (Idle when none)
     */
    SessionState session_state(UserId user);

    const EngineConfig& config() const { return config_; }
    SimilarityIndex& index() { return *index_; }
    HistoryTracker& tracker() { return tracker_; }

private:
    Reply failure_reply(ReplyCode code, const std::string& failure, const std::string& language) const;

    EngineConfig config_;
    Repositories repos_;
    Collaborators collaborators_;
    const WallClock& clock_;
    std::unique_ptr<SimilarityIndex> index_;
    HistoryTracker tracker_;
    RouteBuilder routes_;
    TextQueryResolver text_resolver_;
    SessionStore sessions_;
    SessionMachine machine_;
};

/**
 * @brief Build the index implementation selected by the configuration
 */
std::unique_ptr<SimilarityIndex> make_similarity_index(const EngineConfig& config);

} // namespace Stonetrail
