/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>

namespace Stonetrail {

PostgresConnection::PostgresConnection(const std::string& conninfo) : conninfo_(conninfo) {
    connect(conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

PostgresConnection::PostgresConnection(PostgresConnection&& other) noexcept
    : conn_(other.conn_), conninfo_(std::move(other.conninfo_)), last_error_(std::move(other.last_error_)) {
    other.conn_ = nullptr;
}

PostgresConnection& PostgresConnection::operator=(PostgresConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        conn_ = other.conn_;
        conninfo_ = std::move(other.conninfo_);
        last_error_ = std::move(other.last_error_);
        other.conn_ = nullptr;
    }
    return *this;
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw PersistenceError("PostgreSQL connection failed: " + last_error_);
    }
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

bool PostgresConnection::reset() {
    if (!conn_) {
        try {
            connect(conninfo_);
        } catch (const PersistenceError& e) {
            Logger::warn(std::string("Reconnect failed: ") + e.what());
            return false;
        }
        return true;
    }
    PQreset(conn_);
    return is_connected();
}

void PostgresConnection::require_connection() const {
    if (!is_connected()) {
        throw PersistenceError("Not connected to database");
    }
}

void PostgresConnection::check_result(PGresult* result) {
    ExecStatusType status = PQresultStatus(result);

    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQclear(result);
        throw PersistenceError("PostgreSQL query failed: " + last_error_);
    }
}

PGresult* PostgresConnection::exec_params(const std::string& sql, const std::vector<SqlValue>& params) {
    require_connection();

    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p ? p->c_str() : nullptr);
    }

    PGresult* result = PQexecParams(
        conn_,
        sql.c_str(),
        static_cast<int>(params.size()),
        nullptr,
        param_values.data(),
        nullptr,
        nullptr,
        0  // Text format
    );

    check_result(result);
    return result;
}

void PostgresConnection::execute(const std::string& sql) {
    require_connection();

    PGresult* result = PQexec(conn_, sql.c_str());
    check_result(result);
    PQclear(result);
}

std::size_t PostgresConnection::execute(const std::string& sql, const std::vector<SqlValue>& params) {
    PGresult* result = exec_params(sql, params);

    std::size_t affected = 0;
    const char* tuples = PQcmdTuples(result);
    if (tuples && *tuples) {
        affected = static_cast<std::size_t>(std::stoull(tuples));
    }

    PQclear(result);
    return affected;
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql, const std::vector<SqlValue>& params) {
    PGresult* result = exec_params(sql, params);

    std::optional<std::string> value;

    if (PQntuples(result) > 0 && PQnfields(result) > 0 && !PQgetisnull(result, 0, 0)) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

void PostgresConnection::query(const std::string& sql, const std::vector<SqlValue>& params,
                               const std::function<void(const SqlRow&)>& callback) {
    PGresult* result = exec_params(sql, params);

    int nrows = PQntuples(result);
    int nfields = PQnfields(result);

    // Materialize first so a throwing callback cannot leak the result
    std::vector<SqlRow> rows;
    rows.reserve(nrows);
    for (int i = 0; i < nrows; ++i) {
        SqlRow row;
        row.reserve(nfields);

        for (int j = 0; j < nfields; ++j) {
            if (PQgetisnull(result, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(result, i, j)));
            }
        }

        rows.push_back(std::move(row));
    }

    PQclear(result);

    for (const auto& row : rows) {
        callback(row);
    }
}

void PostgresConnection::begin() {
    execute("BEGIN");
}

void PostgresConnection::commit() {
    execute("COMMIT");
}

void PostgresConnection::rollback() {
    execute("ROLLBACK");
}

// Transaction RAII
PostgresConnection::Transaction::Transaction(PostgresConnection& conn) : conn_(conn) {
    conn_.begin();
}

PostgresConnection::Transaction::~Transaction() {
    if (!done_) {
        try {
            conn_.rollback();
        } catch (const PersistenceError& e) {
            Logger::warn(std::string("Rollback failed: ") + e.what());
        }
    }
}

void PostgresConnection::Transaction::commit() {
    conn_.commit();
    done_ = true;
}

} // namespace Stonetrail
