#pragma once

#ifdef __cplusplus

#include "errors.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <list>
#include <deque>
#include <set>
#include <map>
#include <unordered_map>
#include <variant>
#include <chrono>
#include <type_traits>
#include <utility>

namespace strata {

// Timestamp type (absolute instant, stored as UTC text)
using timestamp_t = std::chrono::system_clock::time_point;

// Raw byte payload
using blob_t = std::vector<uint8_t>;

// JSON document carried as a TEXT value (sequences, maps, nested records)
struct structured_text {
    std::string json;

    bool operator==(const structured_text& other) const { return json == other.json; }
    bool operator!=(const structured_text& other) const { return json != other.json; }
};

// Every value that can be bound to or read from the engine.
// std::nullptr_t is the absent value.
using storage_value = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    bool,
    std::string,
    timestamp_t,
    blob_t,
    structured_text
>;

// Column name -> value. Ordered so that generated SQL is deterministic.
using value_map = std::map<std::string, storage_value>;

inline bool is_null(const storage_value& v) {
    return std::holds_alternative<std::nullptr_t>(v);
}

// Column type lattice
enum class column_type {
    text,
    integer,
    real,
    double_precision,
    numeric,
    boolean,
    date,
    blob,
    any
};

/// SQL type name used in CREATE TABLE ("TEXT", "INTEGER", "DATETIME", ...).
std::string sql_type(column_type type);

/// Parse a declared SQL type. Case-insensitive substring match, TEXT when nothing matches.
column_type column_type_from_sql(std::string_view declared);

// Timestamp text forms (always UTC)
std::string format_timestamp(timestamp_t t);   // "YYYY-MM-DD HH:MM:SS.mmm"
std::string format_iso8601(timestamp_t t);     // "YYYY-MM-DDTHH:MM:SS.mmmZ"

/// Parse a timestamp from text. Tries numeric epoch seconds, ISO-8601,
/// then the fixed UTC patterns (date-time with and without millis, date only).
std::optional<timestamp_t> parse_timestamp(std::string_view text);

/// Instant from milliseconds since epoch. std::nullopt outside the clock's range.
std::optional<timestamp_t> timestamp_from_millis(int64_t millis);
std::optional<timestamp_t> checked_timestamp_from_seconds(double seconds);

/// Throws value_conversion_error when the instant is not representable.
timestamp_t timestamp_from_seconds(double seconds);
double timestamp_to_seconds(timestamp_t t);

std::string base64_encode(const blob_t& bytes);
std::optional<blob_t> base64_decode(std::string_view text);

/// Human-readable rendering for diagnostics and logs.
std::string describe(const storage_value& v);

namespace detail {
    template<typename T> struct always_false : std::false_type {};

    template<typename T> struct is_optional : std::false_type {};
    template<typename T> struct is_optional<std::optional<T>> : std::true_type {};

    template<typename T>
    struct unwrap_optional { using type = T; };
    template<typename T>
    struct unwrap_optional<std::optional<T>> { using type = T; };

    template<typename T>
    inline constexpr bool is_integer_v = std::is_integral_v<T> && !std::is_same_v<T, bool>;

    // Homogeneous sequences (std::vector<uint8_t> is a blob, not a sequence)
    template<typename T> struct is_sequence : std::false_type {};
    template<typename T, typename A>
    struct is_sequence<std::vector<T, A>> : std::bool_constant<!std::is_same_v<T, uint8_t>> {};
    template<typename T, typename A> struct is_sequence<std::list<T, A>> : std::true_type {};
    template<typename T, typename A> struct is_sequence<std::deque<T, A>> : std::true_type {};
    template<typename T, typename C, typename A> struct is_sequence<std::set<T, C, A>> : std::true_type {};

    // String-keyed maps
    template<typename T> struct is_string_map : std::false_type {};
    template<typename V, typename C, typename A>
    struct is_string_map<std::map<std::string, V, C, A>> : std::true_type {};
    template<typename V, typename H, typename E, typename A>
    struct is_string_map<std::unordered_map<std::string, V, H, E, A>> : std::true_type {};

    // Host types with a natural storage_value representation
    template<typename T>
    struct is_storage_representable : std::bool_constant<
        std::is_same_v<T, storage_value> ||
        std::is_same_v<T, std::nullptr_t> ||
        std::is_same_v<T, bool> ||
        is_integer_v<T> ||
        std::is_floating_point_v<T> ||
        std::is_convertible_v<const T&, std::string_view> ||
        std::is_same_v<T, timestamp_t> ||
        std::is_same_v<T, blob_t> ||
        std::is_same_v<T, structured_text>
    > {};
    template<typename T>
    struct is_storage_representable<std::optional<T>> : is_storage_representable<T> {};
} // namespace detail

/// Canonical raw representation of a host value, used for query parameters.
template<typename T>
storage_value make_storage_value(const T& value) {
    if constexpr (std::is_same_v<T, storage_value>) {
        return value;
    } else if constexpr (detail::is_optional<T>::value) {
        if (!value.has_value()) return nullptr;
        return make_storage_value(*value);
    } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
        return nullptr;
    } else if constexpr (std::is_same_v<T, bool>) {
        return value;
    } else if constexpr (detail::is_integer_v<T>) {
        if (!std::in_range<int64_t>(value)) {
            throw value_conversion_error("Integer " + std::to_string(value) + " is outside the 64-bit signed range");
        }
        return static_cast<int64_t>(value);
    } else if constexpr (std::is_floating_point_v<T>) {
        return static_cast<double>(value);
    } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        return std::string(std::string_view(value));
    } else if constexpr (std::is_same_v<T, timestamp_t> ||
                         std::is_same_v<T, blob_t> ||
                         std::is_same_v<T, structured_text>) {
        return value;
    } else {
        static_assert(detail::always_false<T>::value, "type has no storage representation");
    }
}

} // namespace strata

#endif // __cplusplus
