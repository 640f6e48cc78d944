#include <engine/user_event_dispatcher.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>

namespace Stonetrail {

UserEventDispatcher::UserEventDispatcher(TrackingEngine& engine, std::size_t num_workers,
                                         std::chrono::milliseconds sweep_interval)
    : engine_(engine), sweep_interval_(sweep_interval) {
    if (num_workers == 0) num_workers = 1;
    workers_.reserve(num_workers);
    for (std::size_t i = 0; i < num_workers; ++i)
        workers_.emplace_back(&UserEventDispatcher::worker, this);
    sweeper_ = std::thread(&UserEventDispatcher::sweeper, this);
}

UserEventDispatcher::~UserEventDispatcher() {
    shutdown();
}

std::future<Reply> UserEventDispatcher::submit(UserId user, SessionEvent event) {
    return submit(user, Task([user, event = std::move(event)](TrackingEngine& engine) {
        return engine.dispatch(user, event);
    }));
}

std::future<Reply> UserEventDispatcher::submit(UserId user, Task task) {
    Pending pending{std::move(task), std::promise<Reply>()};
    std::future<Reply> future = pending.promise.get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            pending.promise.set_exception(
                std::make_exception_ptr(StonetrailError("dispatcher is shut down")));
            return future;
        }

        auto& queue = queues_[user];
        queue.tasks.push_back(std::move(pending));
        ++in_flight_;
        if (!queue.scheduled) {
            queue.scheduled = true;
            ready_.push_back(user);
        }
    }
    cv_.notify_all();
    return future;
}

void UserEventDispatcher::wait_all() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return in_flight_ == 0; });
}

void UserEventDispatcher::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    sweep_cv_.notify_all();

    for (auto& t : workers_)
        if (t.joinable()) t.join();
    if (sweeper_.joinable()) sweeper_.join();
}

void UserEventDispatcher::worker() {
    while (true) {
        UserId user = 0;
        Pending pending;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !ready_.empty() || stop_; });
            if (ready_.empty()) break;  // Stopped and drained

            user = ready_.front();
            ready_.pop_front();
            auto& queue = queues_[user];
            pending = std::move(queue.tasks.front());
            queue.tasks.pop_front();
            // The user stays scheduled while its task runs, so no other worker picks it up
        }

        try {
            pending.promise.set_value(pending.task(engine_));
        } catch (...) {
            pending.promise.set_exception(std::current_exception());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = queues_.find(user);
            if (it->second.tasks.empty()) {
                queues_.erase(it);
            } else {
                ready_.push_back(user);
            }
            --in_flight_;
        }
        cv_.notify_all();
    }
}

void UserEventDispatcher::sweeper() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_) {
        sweep_cv_.wait_for(lock, sweep_interval_, [this] { return stop_; });
        if (stop_) break;

        lock.unlock();
        try {
            engine_.sweep_expired_sessions();
        } catch (const std::exception& e) {
            Logger::error(std::string("Session sweep failed: ") + e.what());
        }
        ++sweeps_run_;
        lock.lock();
    }
}

} // namespace Stonetrail
