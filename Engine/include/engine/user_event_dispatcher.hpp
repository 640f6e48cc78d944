/**
 * @file user_event_dispatcher.hpp
 * @brief Worker pool that serializes events per user
 */

#pragma once

#include <engine/tracking_engine.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace Stonetrail {

/**
 * @brief Multi-worker event dispatcher.
 *
 * Events of one user run strictly in submission order, one at a time;
 * events of different users run in parallel across the workers. A
 * background sweeper evicts expired sessions every sweep interval.
 */
class UserEventDispatcher {
public:
    using Task = std::function<Reply(TrackingEngine&)>;

    UserEventDispatcher(TrackingEngine& engine, std::size_t num_workers,
                        std::chrono::milliseconds sweep_interval);
    ~UserEventDispatcher();

    UserEventDispatcher(const UserEventDispatcher&) = delete;
    UserEventDispatcher& operator=(const UserEventDispatcher&) = delete;

    std::future<Reply> submit(UserId user, SessionEvent event);
    std::future<Reply> submit(UserId user, Task task);

    /**
     * @brief Block until every submitted task has finished
     */
    void wait_all();

    /**
     * @brief Stop accepting work, drain queues and join all threads
     */
    void shutdown();

    std::size_t sweeps_run() const { return sweeps_run_.load(); }

private:
    struct Pending {
        Task task;
        std::promise<Reply> promise;
    };

    struct UserQueue {
        std::deque<Pending> tasks;
        bool scheduled = false;     // In ready_ or currently running
    };

    void worker();
    void sweeper();

    TrackingEngine& engine_;
    std::chrono::milliseconds sweep_interval_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable sweep_cv_;
    std::unordered_map<UserId, UserQueue> queues_;
    std::deque<UserId> ready_;
    std::size_t in_flight_ = 0;     // Queued + running tasks
    bool stop_ = false;

    std::vector<std::thread> workers_;
    std::thread sweeper_;
    std::atomic<std::size_t> sweeps_run_{0};
};

} // namespace Stonetrail
