/**
 * @file reply.hpp
 * @brief Structured replies handed back to the transport
 *
 * The engine never formats user-facing text. A reply carries a kind, a
 * machine-readable code and typed payload; the transport localizes it using
 * the language code attached to the reply.
 */

#pragma once

#include <core/types.hpp>
#include <tracking/route_geometry.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Stonetrail {

enum class SessionState {
    Idle,
    AwaitingConfirmation,
    AwaitingName,
    AwaitingDescription,
    AwaitingLocation
};

const char* to_string(SessionState state);

enum class ReplyKind {
    Prompt,
    Confirmation,
    Error,
    List
};

const char* to_string(ReplyKind kind);

enum class ReplyCode {
    // Prompts
    SendPhoto,
    ExistingItemFound,
    EnterName,
    NameTooShort,
    EnterDescription,
    EnterLocation,
    InvalidLocation,
    // Confirmations
    ItemRegistered,
    SightingRecorded,
    Cancelled,
    NothingToCancel,
    SessionExpired,
    LanguageChanged,
    // Errors
    RetryStep,
    UnsupportedLanguage,
    UnknownItem,
    Internal,
    // Lists
    SearchResults,
    UserItems
};

const char* to_string(ReplyCode code);

/**
 * @brief One search hit with the item's display fields.
 */
struct MatchView {
    ItemId item_id = 0;
    std::string name;
    std::optional<std::string> description;
    float similarity = 0.0f;
};

struct Reply {
    ReplyKind kind = ReplyKind::Prompt;
    ReplyCode code = ReplyCode::SendPhoto;
    SessionState state = SessionState::Idle;
    std::string language;

    /// Set when the previous session expired before this event was handled.
    bool session_expired = false;

    std::optional<ItemSummary> item;
    std::optional<float> similarity;
    std::optional<bool> subject_found;
    std::optional<HistoryRecord> record;
    std::optional<Address> address;
    std::optional<RouteGeometry> route;
    std::vector<MatchView> matches;
    std::vector<ItemSummary> items;
    std::optional<std::string> pending_name;

    Bytes thumbnail;
    Bytes route_image;

    /// Failing collaborator or subsystem for RetryStep errors.
    std::optional<std::string> failure;

    bool is_error() const { return kind == ReplyKind::Error; }
};

} // namespace Stonetrail
