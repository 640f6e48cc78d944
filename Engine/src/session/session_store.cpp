#include <session/session_store.hpp>
#include <utils/logger.hpp>

namespace Stonetrail {

SessionStore::SessionStore(const WallClock& clock, std::chrono::seconds ttl)
    : clock_(clock), ttl_(ttl) {}

SessionStore::Handle::Handle(std::shared_ptr<Slot> slot, std::unique_lock<std::mutex> lock, bool expired)
    : slot_(std::move(slot)), lock_(std::move(lock)), expired_(expired) {}

void SessionStore::Handle::store(Session session, Timestamp now) {
    if (session.state == SessionState::Idle) {
        slot_->session.reset();
        return;
    }
    session.last_activity = now;
    slot_->session = std::move(session);
}

bool SessionStore::is_expired(const Session& s, Timestamp now) const {
    return now - s.last_activity > ttl_;
}

SessionStore::Handle SessionStore::acquire(UserId user) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = slots_[user];
        if (!entry) entry = std::make_shared<Slot>();
        slot = entry;
    }

    std::unique_lock<std::mutex> slot_lock(slot->mutex);
    bool expired = false;
    if (slot->session && is_expired(*slot->session, clock_.now())) {
        Logger::debug("Session of user " + std::to_string(user) + " expired in state " +
                      to_string(slot->session->state));
        slot->session.reset();
        expired = true;
    }
    return Handle(std::move(slot), std::move(slot_lock), expired);
}

std::size_t SessionStore::sweep_expired() {
    const Timestamp now = clock_.now();
    std::size_t evicted = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = slots_.begin(); it != slots_.end();) {
        auto& slot = it->second;
        // A held handle shares ownership; skip users with an event in flight
        if (slot.use_count() != 1 || !slot->mutex.try_lock()) {
            ++it;
            continue;
        }

        bool drop = !slot->session;
        if (slot->session && is_expired(*slot->session, now)) {
            ++evicted;
            drop = true;
        }
        slot->mutex.unlock();

        if (drop) {
            it = slots_.erase(it);
        } else {
            ++it;
        }
    }

    if (evicted > 0) {
        Logger::info("Evicted " + std::to_string(evicted) + " expired session(s)");
    }
    return evicted;
}

std::size_t SessionStore::live_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t live = 0;
    for (const auto& [user, slot] : slots_) {
        if (!slot->mutex.try_lock()) {
            ++live;  // Event in flight
            continue;
        }
        if (slot->session) ++live;
        slot->mutex.unlock();
    }
    return live;
}

} // namespace Stonetrail
