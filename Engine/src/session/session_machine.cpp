#include <session/session_machine.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace Stonetrail {

namespace {

// Code points, not bytes: "Żo" is a valid two-letter name
std::size_t utf8_length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

Reply prompt(ReplyCode code, SessionState state) {
    Reply r;
    r.kind = ReplyKind::Prompt;
    r.code = code;
    r.state = state;
    return r;
}

std::string describe(const GeoPoint& p) {
    std::ostringstream ss;
    ss << "(" << p.latitude << ", " << p.longitude << ")";
    return ss.str();
}

} // namespace

SessionMachine::SessionMachine(const EngineConfig& config, Dependencies deps)
    : config_(config), deps_(deps), resolver_(deps.index, config.image_match_threshold) {}

std::string SessionMachine::trim(const std::string& text) {
    const char* ws = " \t\r\n\f\v";
    auto first = text.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    auto last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

bool SessionMachine::looks_like_postal_code(const std::string& text) {
    std::string t = trim(text);
    if (t.size() < 3 || t.size() > 10) return false;

    // Every postal code carries a digit; "skip" or "nie" typed as text does not
    bool digit = false;
    for (unsigned char c : t) {
        if (c == '-' || c == ' ') continue;
        if (!std::isalnum(c)) return false;
        if (std::isdigit(c)) digit = true;
    }
    return digit;
}

Reply SessionMachine::dispatch(Session& session, const SessionEvent& event) {
    Logger::debug("User " + std::to_string(session.user_id) + " in " + to_string(session.state) +
                  " <- " + to_string(event.kind));

    switch (event.kind) {
        case EventKind::Photo:    return on_photo(session, event.photo);
        case EventKind::Text:     return on_text(session, event.text);
        case EventKind::Location: return on_location(session, event.location);
        case EventKind::Skip:     return on_skip(session);
        case EventKind::Cancel:   return on_cancel(session);
    }
    return prompt_for_state(session);
}

Embedding SessionMachine::embed_photo(const Bytes& bytes) {
    Embedding embedding = deps_.embedder.embed_image(bytes);
    try {
        // Rejects wrong dimension, zero and non-finite vectors
        normalized_copy(embedding, config_.embedding_dimensions);
    } catch (const std::invalid_argument& e) {
        throw CollaboratorUnavailable("embedding", e.what());
    }
    return embedding;
}

Reply SessionMachine::prompt_for_state(const Session& session) const {
    switch (session.state) {
        case SessionState::Idle:
            return prompt(ReplyCode::SendPhoto, session.state);
        case SessionState::AwaitingName:
            return prompt(ReplyCode::EnterName, session.state);
        case SessionState::AwaitingDescription:
            return prompt(ReplyCode::EnterDescription, session.state);
        case SessionState::AwaitingConfirmation:
        case SessionState::AwaitingLocation:
            return prompt(ReplyCode::EnterLocation, session.state);
    }
    return prompt(ReplyCode::SendPhoto, session.state);
}

Reply SessionMachine::on_photo(Session& session, const PhotoUpload& photo) {
    session.reset();

    CropResult crop = deps_.cropper.crop_subject(photo.bytes);
    const bool found = crop.found && !crop.cropped.empty();
    if (!found) {
        Logger::info("No subject detected, embedding the full image");
    }

    Embedding embedding = embed_photo(found ? crop.cropped : photo.bytes);
    std::optional<Match> match = resolver_.resolve(embedding);

    std::optional<Item> candidate;
    if (match) {
        candidate = deps_.items.find(match->item_id);
        if (!candidate) {
            Logger::warn("Matched item " + std::to_string(match->item_id) + " no longer exists");
            match.reset();
        }
    }

    const Timestamp now = deps_.clock.now();
    session.pending_embedding = std::move(embedding);
    session.photo_ref = photo.reference;
    session.thumbnail = crop.thumbnail.empty() ? photo.bytes : crop.thumbnail;
    session.started_at = now;

    Reply reply;
    reply.kind = ReplyKind::Prompt;
    reply.subject_found = found;
    reply.thumbnail = session.thumbnail;

    if (match) {
        Logger::step("Photo matches item " + std::to_string(match->item_id) + " (similarity " +
                     std::to_string(match->similarity) + " >= " + std::to_string(resolver_.threshold()) + ")");
        session.is_new = false;
        session.candidate = match;
        session.state = SessionState::AwaitingConfirmation;

        reply.code = ReplyCode::ExistingItemFound;
        reply.item = deps_.tracker.summarize(*candidate);
        session.candidate_history_count = reply.item->history_count;
        reply.similarity = match->similarity;
    } else {
        Logger::step("No item above threshold " + std::to_string(resolver_.threshold()) +
                     ", starting registration");
        session.is_new = true;
        session.state = SessionState::AwaitingName;

        reply.code = ReplyCode::EnterName;
    }

    reply.state = session.state;
    return reply;
}

Reply SessionMachine::on_text(Session& session, const std::string& text) {
    const std::string value = trim(text);

    switch (session.state) {
        case SessionState::Idle:
            return prompt(ReplyCode::SendPhoto, session.state);

        case SessionState::AwaitingName: {
            if (utf8_length(value) < config_.min_name_length) {
                return prompt(ReplyCode::NameTooShort, session.state);
            }
            session.name = value;
            session.state = SessionState::AwaitingDescription;
            Reply r = prompt(ReplyCode::EnterDescription, session.state);
            r.pending_name = value;
            return r;
        }

        case SessionState::AwaitingDescription:
            session.description = value.empty() ? std::nullopt : std::optional<std::string>(value);
            session.state = SessionState::AwaitingLocation;
            return prompt(ReplyCode::EnterLocation, session.state);

        case SessionState::AwaitingConfirmation:
        case SessionState::AwaitingLocation:
            if (!looks_like_postal_code(value)) {
                return prompt(ReplyCode::InvalidLocation, session.state);
            }
            return commit(session, resolve_postal_code(value));
    }
    return prompt_for_state(session);
}

Reply SessionMachine::on_location(Session& session, const LocationInput& input) {
    if (session.state != SessionState::AwaitingConfirmation &&
        session.state != SessionState::AwaitingLocation) {
        return prompt_for_state(session);
    }

    if (input.point) {
        if (!is_valid_geo_point(*input.point)) {
            return prompt(ReplyCode::InvalidLocation, session.state);
        }
        return commit(session, resolve_coordinates(*input.point));
    }

    if (input.postal_code && looks_like_postal_code(*input.postal_code)) {
        return commit(session, resolve_postal_code(trim(*input.postal_code)));
    }

    return prompt(ReplyCode::InvalidLocation, session.state);
}

Reply SessionMachine::on_skip(Session& session) {
    switch (session.state) {
        case SessionState::AwaitingDescription:
            session.description.reset();
            session.state = SessionState::AwaitingLocation;
            return prompt(ReplyCode::EnterLocation, session.state);

        case SessionState::AwaitingConfirmation:
        case SessionState::AwaitingLocation:
            return commit(session, ResolvedLocation{});

        case SessionState::Idle:
        case SessionState::AwaitingName:
            break;
    }
    return prompt_for_state(session);
}

Reply SessionMachine::on_cancel(Session& session) {
    Reply r;
    r.kind = ReplyKind::Confirmation;
    if (session.state == SessionState::Idle) {
        r.code = ReplyCode::NothingToCancel;
    } else {
        Logger::info("User " + std::to_string(session.user_id) + " cancelled in " + to_string(session.state));
        session.reset();
        r.code = ReplyCode::Cancelled;
    }
    r.state = session.state;
    return r;
}

SessionMachine::ResolvedLocation SessionMachine::resolve_coordinates(const GeoPoint& point) {
    ResolvedLocation loc;
    loc.point = point;

    try {
        loc.address = deps_.geocoder.reverse(point);
    } catch (const CollaboratorUnavailable& e) {
        Logger::warn(std::string("Reverse geocoding failed, continuing without address: ") + e.what());
    }

    if (loc.address && loc.address->postal_code) {
        loc.postal_code = loc.address->postal_code;
    }
    return loc;
}

SessionMachine::ResolvedLocation SessionMachine::resolve_postal_code(const std::string& postal_code) {
    ResolvedLocation loc;
    loc.postal_code = postal_code;

    // Unavailable propagates; an unknown code is stored without coordinates
    std::optional<GeoPoint> point = deps_.geocoder.forward(postal_code);
    if (point && is_valid_geo_point(*point)) {
        loc.point = point;
        Logger::info("Postal code " + postal_code + " resolved to " + describe(*point));
    } else {
        Logger::warn("Postal code " + postal_code + " could not be resolved, storing without coordinates");
    }
    return loc;
}

Reply SessionMachine::commit(Session& session, const ResolvedLocation& location) {
    if (session.state == SessionState::AwaitingConfirmation) {
        return commit_sighting(session, location);
    }
    return commit_new_item(session, location);
}

Reply SessionMachine::commit_new_item(Session& session, const ResolvedLocation& location) {
    if (!session.name) {
        // Unreachable through dispatch; AwaitingLocation is entered only after a name
        throw std::logic_error("new item commit without a name");
    }

    if (auto dup = resolver_.resolve(session.pending_embedding)) {
        Logger::warn("Item " + std::to_string(dup->item_id) + " registered concurrently with similarity " +
                     std::to_string(dup->similarity) + "; registering a second item");
    }

    NewItem item;
    item.name = *session.name;
    item.description = session.description;
    item.embedding = session.pending_embedding;
    item.photo_ref = session.photo_ref;
    item.registered_by = session.user_id;

    Observation first;
    first.reported_by = session.user_id;
    first.photo_ref = session.photo_ref;
    first.location = location.point;
    first.postal_code = location.postal_code;

    Registration reg = deps_.items.register_item(item, first, deps_.clock.now());

    // Past this point the item exists; failures below must not turn into a retry
    try {
        deps_.index.insert(reg.item.id, reg.item.embedding);
    } catch (const std::exception& e) {
        Logger::error("Item " + std::to_string(reg.item.id) + " persisted but not indexed until next warm-up: " +
                      e.what());
    }

    Logger::success("Registered item " + std::to_string(reg.item.id) + " '" + reg.item.name + "' for user " +
                    std::to_string(session.user_id));

    Reply r;
    r.kind = ReplyKind::Confirmation;
    r.code = ReplyCode::ItemRegistered;

    ItemSummary summary;
    summary.id = reg.item.id;
    summary.name = reg.item.name;
    summary.description = reg.item.description;
    summary.registered_by = reg.item.registered_by;
    summary.history_count = 1;
    summary.latest_location = reg.first_record.location;
    r.item = summary;
    r.record = reg.first_record;
    r.address = location.address;
    r.thumbnail = session.thumbnail;

    session.reset();
    r.state = session.state;
    return r;
}

Reply SessionMachine::commit_sighting(Session& session, const ResolvedLocation& location) {
    if (!session.candidate) {
        throw std::logic_error("sighting commit without a candidate");
    }
    const Match candidate = *session.candidate;

    std::optional<Item> item = deps_.items.find(candidate.item_id);
    if (!item) {
        Logger::warn("Candidate item " + std::to_string(candidate.item_id) + " was deleted before commit");
        Reply r;
        r.kind = ReplyKind::Error;
        r.code = ReplyCode::UnknownItem;
        r.state = session.state;
        return r;
    }

    HistoryRecord rec = deps_.tracker.append(item->id, session.user_id, session.photo_ref,
                                             location.point, location.postal_code);
    Logger::success("Recorded sighting " + std::to_string(rec.id) + " of item " + std::to_string(item->id) +
                    (location.point ? " at " + describe(*location.point) : std::string(" without coordinates")));

    Reply r;
    r.kind = ReplyKind::Confirmation;
    r.code = ReplyCode::SightingRecorded;
    r.similarity = candidate.similarity;
    r.record = rec;
    r.address = location.address;

    // The record is committed; read failures below only thin out the reply
    try {
        r.item = deps_.tracker.summarize(*item);
        RouteGeometry route = deps_.routes.build_route(item->id);
        if (deps_.renderer && !route.empty()) {
            try {
                r.route_image = deps_.renderer->render(route);
            } catch (const CollaboratorUnavailable& e) {
                Logger::warn(std::string("Route rendering failed: ") + e.what());
            }
        }
        r.route = std::move(route);
    } catch (const PersistenceError& e) {
        Logger::warn("Sighting " + std::to_string(rec.id) + " stored, summary unavailable: " + e.what());
        ItemSummary s;
        s.id = item->id;
        s.name = item->name;
        s.description = item->description;
        s.registered_by = item->registered_by;
        s.history_count = session.candidate_history_count + 1;
        s.latest_location = rec.location;
        r.item = s;
    }

    session.reset();
    r.state = session.state;
    return r;
}

} // namespace Stonetrail
