/**
 * @file connection_pool.hpp
 * @brief Fixed-size pool of PostgreSQL connections
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Stonetrail {

/**
 * @brief Blocking connection pool.
 *
 * Each lease owns one connection exclusively until it is destroyed. Broken
 * connections are reset on acquire.
 */
class ConnectionPool {
public:
    ConnectionPool(const std::string& conninfo, std::size_t size,
                   std::chrono::milliseconds acquire_timeout = std::chrono::seconds(10));

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    class Lease {
    public:
        Lease(ConnectionPool& pool, std::unique_ptr<PostgresConnection> conn);
        ~Lease();

        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        PostgresConnection& operator*() { return *conn_; }
        PostgresConnection* operator->() { return conn_.get(); }

    private:
        ConnectionPool* pool_;
        std::unique_ptr<PostgresConnection> conn_;
    };

    /**
     * @brief Borrow a connection; throws PersistenceError after the acquire timeout
     */
    Lease acquire();

    std::size_t size() const { return size_; }
    std::size_t available() const;

private:
    void release(std::unique_ptr<PostgresConnection> conn);

    std::size_t size_;
    std::chrono::milliseconds acquire_timeout_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<PostgresConnection>> idle_;
};

} // namespace Stonetrail
