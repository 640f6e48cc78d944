/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <libpq-fe.h>

namespace Stonetrail {

/// SQL parameter or column value; std::nullopt maps to NULL.
using SqlValue = std::optional<std::string>;
using SqlRow = std::vector<SqlValue>;

/**
 * @brief PostgreSQL connection wrapper
 *
 * All failures surface as PersistenceError. Not thread-safe: one connection
 * per thread, normally leased from a ConnectionPool.
 */
class PostgresConnection {
public:
    /**
     * @brief Connect with a libpq conninfo string or postgresql:// URL
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    // No copy
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    // Move OK
    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    bool is_connected() const;

    /**
     * @brief Re-establish a dropped connection. Returns true when connected afterwards.
     */
    bool reset();

    /**
     * @brief Execute statement(s) without parameters (no results)
     */
    void execute(const std::string& sql);

    /**
     * @brief Execute statement with parameters, returning affected row count
     */
    std::size_t execute(const std::string& sql, const std::vector<SqlValue>& params);

    /**
     * @brief Execute query with params and return the first column of the first row
     */
    std::optional<std::string> query_single(const std::string& sql, const std::vector<SqlValue>& params = {});

    /**
     * @brief Execute query with params and iterate rows
     * @param callback Called for each row; NULL columns arrive as std::nullopt
     */
    void query(const std::string& sql, const std::vector<SqlValue>& params,
               const std::function<void(const SqlRow&)>& callback);

    void begin();
    void commit();
    void rollback();

    /**
     * @brief RAII transaction guard; rolls back unless commit() was called
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        PostgresConnection& conn_;
        bool done_ = false;
    };

private:
    void connect(const std::string& conninfo);
    void disconnect();
    void require_connection() const;
    PGresult* exec_params(const std::string& sql, const std::vector<SqlValue>& params);
    void check_result(PGresult* result);

    PGconn* conn_ = nullptr;
    std::string conninfo_;
    std::string last_error_;
};

} // namespace Stonetrail
