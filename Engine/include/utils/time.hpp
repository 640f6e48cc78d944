#pragma once

#include <chrono>
#include <mutex>

namespace Stonetrail {

/**
 * @brief High-resolution timer used for step latency logging.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    void reset() {
        start_ = Clock::now();
    }

    double elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_).count();
    }

private:
    TimePoint start_;
};

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Wall-clock source for record timestamps and session expiry.
 *
 * Injected everywhere time matters so tests can drive TTL expiry and
 * history ordering deterministically.
 */
class WallClock {
public:
    virtual ~WallClock() = default;
    virtual Timestamp now() const = 0;
};

class SystemWallClock final : public WallClock {
public:
    Timestamp now() const override { return std::chrono::system_clock::now(); }
};

/**
 * @brief Manually advanced clock.
 */
class ManualWallClock final : public WallClock {
public:
    explicit ManualWallClock(Timestamp start = Timestamp{std::chrono::seconds(1700000000)})
        : now_(start) {}

    Timestamp now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

    void set(Timestamp t) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = t;
    }

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

inline double to_epoch_seconds(Timestamp t) {
    return std::chrono::duration<double>(t.time_since_epoch()).count();
}

inline Timestamp from_epoch_seconds(double seconds) {
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::duration<double>(seconds))};
}

} // namespace Stonetrail
