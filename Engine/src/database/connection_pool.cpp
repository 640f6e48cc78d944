#include <database/connection_pool.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>

namespace Stonetrail {

ConnectionPool::ConnectionPool(const std::string& conninfo, std::size_t size,
                               std::chrono::milliseconds acquire_timeout)
    : size_(size), acquire_timeout_(acquire_timeout) {
    if (size_ == 0) {
        throw PersistenceError("Connection pool size must be positive");
    }
    idle_.reserve(size_);
    for (std::size_t i = 0; i < size_; ++i) {
        idle_.push_back(std::make_unique<PostgresConnection>(conninfo));
    }
    Logger::success("Connection pool ready (" + std::to_string(size_) + " connections)");
}

ConnectionPool::Lease::Lease(ConnectionPool& pool, std::unique_ptr<PostgresConnection> conn)
    : pool_(&pool), conn_(std::move(conn)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), conn_(std::move(other.conn_)) {
    other.pool_ = nullptr;
}

ConnectionPool::Lease::~Lease() {
    if (pool_ && conn_) {
        pool_->release(std::move(conn_));
    }
}

ConnectionPool::Lease ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, acquire_timeout_, [this] { return !idle_.empty(); })) {
        throw PersistenceError("Timed out waiting for a database connection");
    }
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    lock.unlock();

    if (!conn->is_connected() && !conn->reset()) {
        // Keep the broken connection in the pool; the next acquire retries the reset
        release(std::move(conn));
        throw PersistenceError("Database connection lost");
    }
    return Lease(*this, std::move(conn));
}

void ConnectionPool::release(std::unique_ptr<PostgresConnection> conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(std::move(conn));
    }
    cv_.notify_one();
}

std::size_t ConnectionPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

} // namespace Stonetrail
