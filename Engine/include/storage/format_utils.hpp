#pragma once

#include <core/types.hpp>
#include <database/postgres_connection.hpp>
#include <cstdint>
#include <string>

namespace Stonetrail {

// Shared formatting utilities for the storage layer.

// Format an embedding as a pgvector literal: [0.1,0.2,...]
std::string embedding_to_pgvector(const Embedding& v);

// Parse a pgvector text value back into floats. Throws PersistenceError on malformed input.
Embedding embedding_from_pgvector(const std::string& text);

// Timestamps travel as epoch seconds (double precision) in both directions.
std::string timestamp_to_sql(Timestamp t);
Timestamp timestamp_from_sql(const std::string& text);

inline SqlValue optional_text(const std::optional<std::string>& v) {
    return v;
}

// Round-trip safe decimal text for a double.
std::string format_double(double v);

inline SqlValue optional_double(const std::optional<double>& v) {
    if (!v) return std::nullopt;
    return format_double(*v);
}

std::int64_t parse_int64(const SqlValue& v, const char* column);
double parse_double(const std::string& v, const char* column);

} // namespace Stonetrail
