#include <engine/tracking_engine.hpp>
#include <core/errors.hpp>
#include <matching/exact_similarity_index.hpp>
#include <matching/hnsw_similarity_index.hpp>
#include <utils/logger.hpp>
#include <stdexcept>

namespace Stonetrail {

std::unique_ptr<SimilarityIndex> make_similarity_index(const EngineConfig& config) {
    switch (config.index_kind) {
        case IndexKind::Exact:
            return std::make_unique<ExactSimilarityIndex>(config.embedding_dimensions);
        case IndexKind::Hnsw:
            return std::make_unique<HnswSimilarityIndex>(config.embedding_dimensions, config.hnsw);
    }
    throw ConfigError("unknown index kind");
}

TrackingEngine::TrackingEngine(EngineConfig config, Repositories repos, Collaborators collaborators,
                               const WallClock& clock, std::unique_ptr<SimilarityIndex> index)
    : config_(std::move(config)),
      repos_(repos),
      collaborators_(collaborators),
      clock_(clock),
      index_(index ? std::move(index) : make_similarity_index(config_)),
      tracker_(repos_.history, clock_),
      routes_(tracker_),
      text_resolver_(*index_, config_.text_match_threshold, config_.text_top_k),
      sessions_(clock_, config_.session_ttl),
      machine_(config_, SessionMachine::Dependencies{
          collaborators_.embedder,
          collaborators_.cropper,
          collaborators_.geocoder,
          collaborators_.renderer,
          repos_.items,
          tracker_,
          routes_,
          *index_,
          clock_}) {
    if (index_->dimensions() != config_.embedding_dimensions) {
        throw ConfigError("index dimension " + std::to_string(index_->dimensions()) +
                          " does not match embedding dimension " + std::to_string(config_.embedding_dimensions));
    }
}

std::size_t TrackingEngine::warm_index() {
    Timer timer;
    std::size_t indexed = 0;

    if (auto stored = repos_.items.embedding_dimensions(); stored && *stored != config_.embedding_dimensions) {
        throw ConfigError("embedding dimension " + std::to_string(config_.embedding_dimensions) +
                          " does not match the stored column size " + std::to_string(*stored));
    }

    for (const auto& item : repos_.items.list_all()) {
        try {
            index_->insert(item.id, item.embedding);
            ++indexed;
        } catch (const std::invalid_argument& e) {
            Logger::warn("Skipping item " + std::to_string(item.id) + " during warm-up: " + e.what());
        }
    }

    Logger::success("Indexed " + std::to_string(indexed) + " item(s) in " +
                    std::to_string(timer.elapsed_ms()) + " ms");
    return indexed;
}

Reply TrackingEngine::handle_photo(UserId user, const PhotoUpload& photo) {
    return dispatch(user, SessionEvent::photo_event(photo));
}

Reply TrackingEngine::handle_text(UserId user, const std::string& text) {
    return dispatch(user, SessionEvent::text_event(text));
}

Reply TrackingEngine::handle_location(UserId user, const LocationInput& location) {
    return dispatch(user, SessionEvent::location_event(location));
}

Reply TrackingEngine::handle_skip(UserId user) {
    return dispatch(user, SessionEvent::skip_event());
}

Reply TrackingEngine::handle_cancel(UserId user) {
    return dispatch(user, SessionEvent::cancel_event());
}

Reply TrackingEngine::dispatch(UserId user, const SessionEvent& event) {
    auto handle = sessions_.acquire(user);
    const bool expired = handle.expired();

    std::string lang = handle.current() ? handle.current()->language : std::string(kDefaultLanguage);
    const SessionState before = handle.current() ? handle.current()->state : SessionState::Idle;

    try {
        Session working;
        if (handle.current()) {
            working = *handle.current();
        } else {
            working.user_id = user;
            working.language = language(user);
            working.started_at = clock_.now();
            working.last_activity = working.started_at;
        }
        lang = working.language;

        Reply reply;
        if (expired && event.kind != EventKind::Photo) {
            reply.kind = ReplyKind::Confirmation;
            reply.code = ReplyCode::SessionExpired;
        } else {
            reply = machine_.dispatch(working, event);
        }

        reply.state = working.state;
        reply.language = working.language;
        reply.session_expired = expired;
        handle.store(std::move(working), clock_.now());
        return reply;
    } catch (const CollaboratorUnavailable& e) {
        Logger::warn("User " + std::to_string(user) + ": " + e.what() + " (state kept)");
        Reply r = failure_reply(ReplyCode::RetryStep, e.collaborator(), lang);
        r.state = before;
        r.session_expired = expired;
        return r;
    } catch (const PersistenceError& e) {
        Logger::error("User " + std::to_string(user) + ": " + e.what() + " (state kept)");
        Reply r = failure_reply(ReplyCode::RetryStep, "persistence", lang);
        r.state = before;
        r.session_expired = expired;
        return r;
    } catch (const std::exception& e) {
        Logger::error("User " + std::to_string(user) + ": unexpected failure handling " +
                      to_string(event.kind) + ": " + e.what());
        Reply r = failure_reply(ReplyCode::Internal, "internal", lang);
        r.state = before;
        r.session_expired = expired;
        return r;
    }
}

Reply TrackingEngine::handle_text_search(UserId user, const std::string& query) {
    const SessionState state = session_state(user);
    std::string lang = kDefaultLanguage;

    try {
        lang = language(user);

        Embedding embedding = collaborators_.embedder.embed_text(query);
        std::vector<Match> matches;
        try {
            matches = text_resolver_.resolve_text(embedding);
        } catch (const std::invalid_argument& e) {
            throw CollaboratorUnavailable("embedding", e.what());
        }

        Reply r;
        r.kind = ReplyKind::List;
        r.code = ReplyCode::SearchResults;
        r.state = state;
        r.language = lang;

        for (const auto& m : matches) {
            auto item = repos_.items.find(m.item_id);
            if (!item) continue;
            r.matches.push_back(MatchView{item->id, item->name, item->description, m.similarity});
        }

        Logger::info("Text search by user " + std::to_string(user) + ": " + std::to_string(r.matches.size()) +
                     " result(s)");
        return r;
    } catch (const CollaboratorUnavailable& e) {
        Logger::warn(std::string("Text search failed: ") + e.what());
        Reply r = failure_reply(ReplyCode::RetryStep, e.collaborator(), lang);
        r.state = state;
        return r;
    } catch (const PersistenceError& e) {
        Logger::error(std::string("Text search failed: ") + e.what());
        Reply r = failure_reply(ReplyCode::RetryStep, "persistence", lang);
        r.state = state;
        return r;
    }
}

Reply TrackingEngine::user_items(UserId user) {
    const SessionState state = session_state(user);
    std::string lang = kDefaultLanguage;

    try {
        lang = language(user);

        Reply r;
        r.kind = ReplyKind::List;
        r.code = ReplyCode::UserItems;
        r.state = state;
        r.language = lang;
        for (const auto& item : repos_.items.list_by_registrant(user)) {
            r.items.push_back(tracker_.summarize(item));
        }
        return r;
    } catch (const PersistenceError& e) {
        Logger::error(std::string("Listing items failed: ") + e.what());
        Reply r = failure_reply(ReplyCode::RetryStep, "persistence", lang);
        r.state = state;
        return r;
    }
}

std::vector<ItemSummary> TrackingEngine::catalog_overview() {
    std::vector<ItemSummary> out;
    for (const auto& item : repos_.items.list_all()) {
        out.push_back(tracker_.summarize(item));
    }
    return out;
}

RouteGeometry TrackingEngine::route(ItemId item) {
    return routes_.build_route(item);
}

bool TrackingEngine::is_supported_language(const std::string& code) {
    return code == "pl" || code == "en" || code == "ru";
}

std::string TrackingEngine::language(UserId user) {
    auto pref = repos_.preferences.find(user);
    if (pref && is_supported_language(pref->language)) {
        return pref->language;
    }
    return kDefaultLanguage;
}

Reply TrackingEngine::set_language(UserId user, const std::string& code) {
    auto handle = sessions_.acquire(user);
    const SessionState state = handle.current() ? handle.current()->state : SessionState::Idle;

    if (!is_supported_language(code)) {
        Reply r = failure_reply(ReplyCode::UnsupportedLanguage, code,
                                handle.current() ? handle.current()->language : kDefaultLanguage);
        r.state = state;
        return r;
    }

    try {
        repos_.preferences.save(UserPreference{user, code});
    } catch (const PersistenceError& e) {
        Logger::error(std::string("Saving language failed: ") + e.what());
        Reply r = failure_reply(ReplyCode::RetryStep, "persistence", kDefaultLanguage);
        r.state = state;
        return r;
    }

    // A live session picks up the new language for its remaining replies
    if (handle.current()) {
        Session updated = *handle.current();
        updated.language = code;
        handle.store(std::move(updated), clock_.now());
    }

    Logger::info("User " + std::to_string(user) + " switched language to " + code);

    Reply r;
    r.kind = ReplyKind::Confirmation;
    r.code = ReplyCode::LanguageChanged;
    r.state = state;
    r.language = code;
    return r;
}

bool TrackingEngine::delete_item(ItemId item) {
    if (!repos_.items.remove(item)) {
        Logger::warn("Delete requested for unknown item " + std::to_string(item));
        return false;
    }
    index_->remove(item);
    Logger::success("Deleted item " + std::to_string(item) + " and its history");
    return true;
}

std::size_t TrackingEngine::sweep_expired_sessions() {
    return sessions_.sweep_expired();
}

SessionState TrackingEngine::session_state(UserId user) {
    auto handle = sessions_.acquire(user);
    return handle.current() ? handle.current()->state : SessionState::Idle;
}

Reply TrackingEngine::failure_reply(ReplyCode code, const std::string& failure, const std::string& language) const {
    Reply r;
    r.kind = ReplyKind::Error;
    r.code = code;
    r.language = language;
    r.failure = failure;
    return r;
}

} // namespace Stonetrail
