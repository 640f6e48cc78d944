/**
 * @file session_store.hpp
 * @brief TTL-evicting session cache with per-user exclusion
 */

#pragma once

#include <session/session.hpp>
#include <utils/time.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace Stonetrail {

/**
 * @brief Session store keyed by user id
 *
 * acquire() blocks only on the requesting user's slot, so at most one state
 * transition per user is in flight while other users proceed. A session
 * idle for longer than the TTL is discarded on the next acquire() or by
 * sweep_expired(), whichever comes first.
 */
class SessionStore {
    struct Slot {
        std::mutex mutex;
        std::optional<Session> session;
    };

public:
    SessionStore(const WallClock& clock, std::chrono::seconds ttl);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /**
     * @brief Exclusive access to one user's session for the duration of an event
     */
    class Handle {
    public:
        Handle(std::shared_ptr<Slot> slot, std::unique_lock<std::mutex> lock, bool expired);

        Handle(Handle&&) noexcept = default;
        Handle& operator=(Handle&&) = delete;

        /// Current session, std::nullopt when the user is Idle.
        const std::optional<Session>& current() const { return slot_->session; }

        /// True when a stale session was discarded while acquiring.
        bool expired() const { return expired_; }

        /**
         * @brief Store the session after a successful step (erases it when Idle)
         */
        void store(Session session, Timestamp now);

    private:
        std::shared_ptr<Slot> slot_;
        std::unique_lock<std::mutex> lock_;
        bool expired_;
    };

    Handle acquire(UserId user);

    /**
     * @brief Evict expired sessions of users with no event in flight
     * @return Number of sessions evicted
     */
    std::size_t sweep_expired();

    std::size_t live_sessions() const;

    std::chrono::seconds ttl() const { return ttl_; }

private:
    bool is_expired(const Session& s, Timestamp now) const;

    const WallClock& clock_;
    std::chrono::seconds ttl_;
    mutable std::mutex mutex_;
    std::unordered_map<UserId, std::shared_ptr<Slot>> slots_;
};

} // namespace Stonetrail
