#pragma once

#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <variant>
#include <chrono>
#include <cmath>

namespace trellis {

// Timestamp type (stored as REAL seconds since Unix epoch)
using timestamp_t = std::chrono::system_clock::time_point;

// Supported column types
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string
>;

// Column type enumeration
enum class column_type {
    integer,
    real,
    text
};

// Column definition for schema
struct column_def {
    std::string name;
    column_type type;
};

// Table schema
struct table_schema {
    std::string name;
    std::vector<column_def> columns;
    bool is_link_table = false;  // If true, skip id/created_at/updated_at columns
};

// Attribute value as carried by a record.
// Numbers are doubles; datetimes are time points.
using attribute_value = std::variant<
    std::nullptr_t,
    bool,
    double,
    std::string,
    timestamp_t
>;

// ============================================================================
// Helper functions for value conversion
// ============================================================================

namespace detail {
    inline column_value_t to_column_value(std::nullptr_t) { return nullptr; }
    inline column_value_t to_column_value(bool v) { return static_cast<int64_t>(v ? 1 : 0); }
    inline column_value_t to_column_value(double v) { return v; }
    inline column_value_t to_column_value(const std::string& v) { return v; }
    // Timestamp stored as double (seconds since epoch)
    inline column_value_t to_column_value(timestamp_t v) {
        auto duration = v.time_since_epoch();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
        return static_cast<double>(millis) / 1000.0;
    }

    inline timestamp_t timestamp_from_seconds(double seconds) {
        auto millis = static_cast<int64_t>(std::llround(seconds * 1000.0));
        return timestamp_t(std::chrono::milliseconds(millis));
    }

    /// Format as ISO-8601 UTC, e.g. "2021-03-04T10:11:12.345Z".
    std::string format_timestamp(timestamp_t t);

    /// Parse ISO-8601 ("YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM]",
    /// a space is accepted in place of 'T'). Returns nullopt when malformed.
    std::optional<timestamp_t> parse_timestamp(const std::string& text);
} // namespace detail

} // namespace trellis
