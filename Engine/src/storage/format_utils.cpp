#include <storage/format_utils.hpp>
#include <core/errors.hpp>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>
#include <sstream>

namespace Stonetrail {

std::string embedding_to_pgvector(const Embedding& v) {
    std::string out;
    out.reserve(v.size() * 12 + 2);
    out.push_back('[');
    char buf[32];
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out.push_back(',');
        int n = std::snprintf(buf, sizeof(buf), "%.9g", static_cast<double>(v[i]));
        out.append(buf, static_cast<size_t>(n));
    }
    out.push_back(']');
    return out;
}

Embedding embedding_from_pgvector(const std::string& text) {
    if (text.size() < 2 || text.front() != '[' || text.back() != ']') {
        throw PersistenceError("Malformed vector value: " + text.substr(0, 32));
    }

    Embedding out;
    std::string body = text.substr(1, text.size() - 2);
    if (body.empty()) return out;

    std::istringstream ss(body);
    std::string token;
    while (std::getline(ss, token, ',')) {
        try {
            size_t used = 0;
            float f = std::stof(token, &used);
            out.push_back(f);
        } catch (const std::exception&) {
            throw PersistenceError("Malformed vector component: " + token);
        }
    }
    return out;
}

std::string timestamp_to_sql(Timestamp t) {
    return format_double(to_epoch_seconds(t));
}

Timestamp timestamp_from_sql(const std::string& text) {
    return from_epoch_seconds(parse_double(text, "created_at"));
}

std::string format_double(double v) {
    char buf[32];
    int n = std::snprintf(buf, sizeof(buf), "%.17g", v);
    return std::string(buf, static_cast<size_t>(n));
}

std::int64_t parse_int64(const SqlValue& v, const char* column) {
    if (!v) {
        throw PersistenceError(std::string("Unexpected NULL in column ") + column);
    }
    std::int64_t out = 0;
    const char* first = v->data();
    const char* last = first + v->size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc() || ptr != last) {
        throw PersistenceError(std::string("Invalid integer in column ") + column + ": " + *v);
    }
    return out;
}

double parse_double(const std::string& v, const char* column) {
    try {
        size_t used = 0;
        double d = std::stod(v, &used);
        if (used != v.size() || !std::isfinite(d)) {
            throw std::invalid_argument(v);
        }
        return d;
    } catch (const std::exception&) {
        throw PersistenceError(std::string("Invalid number in column ") + column + ": " + v);
    }
}

} // namespace Stonetrail
