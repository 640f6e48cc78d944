/**
 * @file types.cpp
 * @brief Enum names and value checks for the shared data model
 */

#include <core/reply.hpp>
#include <core/types.hpp>
#include <session/session.hpp>
#include <tracking/route_geometry.hpp>
#include <cmath>

namespace Stonetrail {

bool is_valid_geo_point(const GeoPoint& p) {
    return std::isfinite(p.latitude) && std::isfinite(p.longitude) &&
           p.latitude >= -90.0 && p.latitude <= 90.0 &&
           p.longitude >= -180.0 && p.longitude <= 180.0;
}

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle:                 return "idle";
        case SessionState::AwaitingConfirmation: return "awaiting_confirmation";
        case SessionState::AwaitingName:         return "awaiting_name";
        case SessionState::AwaitingDescription:  return "awaiting_description";
        case SessionState::AwaitingLocation:     return "awaiting_location";
    }
    return "unknown";
}

const char* to_string(ReplyKind kind) {
    switch (kind) {
        case ReplyKind::Prompt:       return "prompt";
        case ReplyKind::Confirmation: return "confirmation";
        case ReplyKind::Error:        return "error";
        case ReplyKind::List:         return "list";
    }
    return "unknown";
}

const char* to_string(ReplyCode code) {
    switch (code) {
        case ReplyCode::SendPhoto:           return "send_photo";
        case ReplyCode::ExistingItemFound:   return "existing_item_found";
        case ReplyCode::EnterName:           return "enter_name";
        case ReplyCode::NameTooShort:        return "name_too_short";
        case ReplyCode::EnterDescription:    return "enter_description";
        case ReplyCode::EnterLocation:       return "enter_location";
        case ReplyCode::InvalidLocation:     return "invalid_location";
        case ReplyCode::ItemRegistered:      return "item_registered";
        case ReplyCode::SightingRecorded:    return "sighting_recorded";
        case ReplyCode::Cancelled:           return "cancelled";
        case ReplyCode::NothingToCancel:     return "nothing_to_cancel";
        case ReplyCode::SessionExpired:      return "session_expired";
        case ReplyCode::LanguageChanged:     return "language_changed";
        case ReplyCode::RetryStep:           return "retry_step";
        case ReplyCode::UnsupportedLanguage: return "unsupported_language";
        case ReplyCode::UnknownItem:         return "unknown_item";
        case ReplyCode::Internal:            return "internal";
        case ReplyCode::SearchResults:       return "search_results";
        case ReplyCode::UserItems:           return "user_items";
    }
    return "unknown";
}

const char* to_string(MarkerRole role) {
    switch (role) {
        case MarkerRole::Start:    return "start";
        case MarkerRole::Waypoint: return "waypoint";
        case MarkerRole::End:      return "end";
    }
    return "unknown";
}

const char* to_string(EventKind kind) {
    switch (kind) {
        case EventKind::Photo:    return "photo";
        case EventKind::Text:     return "text";
        case EventKind::Location: return "location";
        case EventKind::Skip:     return "skip";
        case EventKind::Cancel:   return "cancel";
    }
    return "unknown";
}

} // namespace Stonetrail
