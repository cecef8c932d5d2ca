#pragma once

#ifdef __cplusplus

#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace roomsync {

// Millisecond precision on the wire; stored as REAL seconds since the epoch
using timestamp_t = std::chrono::system_clock::time_point;

// One SQLite cell
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string
>;

enum class column_type {
    integer,
    real,
    text
};

struct column_def {
    std::string name;
    column_type type;
    bool nullable = false;
    bool is_primary_key = false;
};

struct table_schema {
    std::string name;
    std::vector<column_def> columns;
};

// ============================================================================
// Cell conversion
// ============================================================================
//
// column_traits<T>::to builds a cell from a field, ::from reads one back and
// yields nullopt for NULL or a cell of the wrong storage class.

namespace detail {

template<typename T>
struct column_traits;

template<>
struct column_traits<std::string> {
    static column_value_t to(const std::string& v) { return v; }
    static std::optional<std::string> from(const column_value_t& v) {
        if (auto* s = std::get_if<std::string>(&v)) return *s;
        return std::nullopt;
    }
};

template<>
struct column_traits<int64_t> {
    static column_value_t to(int64_t v) { return v; }
    static std::optional<int64_t> from(const column_value_t& v) {
        if (auto* i = std::get_if<int64_t>(&v)) return *i;
        if (auto* d = std::get_if<double>(&v)) return static_cast<int64_t>(*d);
        return std::nullopt;
    }
};

template<>
struct column_traits<bool> {
    static column_value_t to(bool v) { return static_cast<int64_t>(v ? 1 : 0); }
    static std::optional<bool> from(const column_value_t& v) {
        if (auto* i = std::get_if<int64_t>(&v)) return *i != 0;
        return std::nullopt;
    }
};

template<>
struct column_traits<timestamp_t> {
    static column_value_t to(timestamp_t v) {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(v.time_since_epoch()).count();
        return static_cast<double>(millis) / 1000.0;
    }
    static std::optional<timestamp_t> from(const column_value_t& v) {
        double seconds;
        if (auto* d = std::get_if<double>(&v)) {
            seconds = *d;
        } else if (auto* i = std::get_if<int64_t>(&v)) {
            seconds = static_cast<double>(*i);
        } else {
            return std::nullopt;
        }
        return timestamp_t(std::chrono::milliseconds(std::llround(seconds * 1000.0)));
    }
};

} // namespace detail

template<typename T>
column_value_t to_column(const T& value) {
    return detail::column_traits<T>::to(value);
}

template<typename T>
column_value_t to_column(const std::optional<T>& value) {
    if (!value) return nullptr;
    return detail::column_traits<T>::to(*value);
}

/// Typed read of one column of a query row; nullopt when absent or NULL.
template<typename T, typename Row>
std::optional<T> column_as(const Row& row, const std::string& name) {
    auto it = row.find(name);
    if (it == row.end()) return std::nullopt;
    return detail::column_traits<T>::from(it->second);
}

} // namespace roomsync

#endif // __cplusplus
