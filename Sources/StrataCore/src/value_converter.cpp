#include "strata/value_converter.hpp"
#include <cctype>
#include <cmath>
#include <limits>
#include <utility>

namespace strata {

type_inference infer_type(const storage_value& raw) {
    return std::visit([](auto&& v) -> type_inference {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return {column_type::text, true};
        } else if constexpr (std::is_same_v<T, structured_text>) {
            return {column_type::text, false};
        } else {
            return {detail::natural_column_type<T>(), false};
        }
    }, raw);
}

std::optional<storage_value> normalize_storage_value(const storage_value& raw, column_type type, bool auto_infer) {
    if (is_null(raw)) return storage_value{nullptr};

    auto wrap = [](auto&& converted) -> std::optional<storage_value> {
        if (!converted) return std::nullopt;
        return storage_value{*converted};
    };

    switch (type) {
        case column_type::integer:
            return wrap(detail::coerce_integer(raw));
        case column_type::real:
        case column_type::double_precision:
            return wrap(detail::coerce_real(raw));
        case column_type::boolean:
            return wrap(detail::coerce_bool(raw));
        case column_type::date:
            return wrap(detail::coerce_timestamp(raw));
        case column_type::blob:
            return wrap(detail::coerce_blob(raw, auto_infer));
        case column_type::text:
            if (std::holds_alternative<std::string>(raw) || std::holds_alternative<structured_text>(raw)) {
                return raw;
            }
            return wrap(detail::coerce_text(raw, auto_infer));
        case column_type::numeric:
            if (std::holds_alternative<int64_t>(raw) || std::holds_alternative<double>(raw)) {
                return raw;
            }
            return wrap(detail::coerce_real(raw));
        case column_type::any:
            return raw;
    }
    return raw;
}

namespace detail {

namespace {
std::string lowercase(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}
} // namespace

std::optional<bool> coerce_bool(const storage_value& raw) {
    if (auto b = std::get_if<bool>(&raw)) return *b;
    if (auto i = std::get_if<int64_t>(&raw)) return *i != 0;
    if (auto s = std::get_if<std::string>(&raw)) {
        auto lower = lowercase(*s);
        if (lower == "true" || lower == "1") return true;
        if (lower == "false" || lower == "0") return false;
    }
    return std::nullopt;
}

std::optional<int64_t> coerce_integer(const storage_value& raw) {
    if (auto i = std::get_if<int64_t>(&raw)) return *i;
    if (auto d = std::get_if<double>(&raw)) {
        // Only integral doubles inside the int64 range
        if (std::isfinite(*d) && std::trunc(*d) == *d &&
            *d >= -9223372036854775808.0 && *d < 9223372036854775808.0) {
            return static_cast<int64_t>(*d);
        }
    }
    return std::nullopt;
}

std::optional<double> coerce_real(const storage_value& raw) {
    if (auto d = std::get_if<double>(&raw)) return *d;
    if (auto i = std::get_if<int64_t>(&raw)) return static_cast<double>(*i);
    return std::nullopt;
}

std::optional<std::string> coerce_text(const storage_value& raw, bool auto_infer) {
    if (auto s = std::get_if<std::string>(&raw)) return *s;
    if (auto st = std::get_if<structured_text>(&raw)) return st->json;
    if (!auto_infer) return std::nullopt;

    if (auto i = std::get_if<int64_t>(&raw)) return std::to_string(*i);
    if (auto d = std::get_if<double>(&raw)) return format_number(*d);
    if (auto b = std::get_if<bool>(&raw)) return std::string(*b ? "true" : "false");
    if (auto t = std::get_if<timestamp_t>(&raw)) return format_timestamp(*t);
    if (auto bytes = std::get_if<blob_t>(&raw)) return std::string(bytes->begin(), bytes->end());
    return std::nullopt;
}

std::optional<timestamp_t> coerce_timestamp(const storage_value& raw) {
    if (auto t = std::get_if<timestamp_t>(&raw)) return *t;
    if (auto d = std::get_if<double>(&raw)) return checked_timestamp_from_seconds(*d);
    if (auto i = std::get_if<int64_t>(&raw)) return checked_timestamp_from_seconds(static_cast<double>(*i));
    if (auto s = std::get_if<std::string>(&raw)) return parse_timestamp(*s);
    return std::nullopt;
}

std::optional<blob_t> coerce_blob(const storage_value& raw, bool auto_infer) {
    if (auto bytes = std::get_if<blob_t>(&raw)) return *bytes;
    if (!auto_infer) return std::nullopt;

    if (auto s = std::get_if<std::string>(&raw)) {
        if (auto decoded = base64_decode(*s)) return decoded;
        return blob_t(s->begin(), s->end());
    }
    return std::nullopt;
}

std::optional<std::string> structured_source(const storage_value& raw) {
    if (auto st = std::get_if<structured_text>(&raw)) return st->json;
    if (auto s = std::get_if<std::string>(&raw)) return *s;
    return std::nullopt;
}

storage_value convert_storage_value(const storage_value& value, column_type type, bool is_optional) {
    if (is_null(value)) {
        if (is_optional) return nullptr;
        throw_missing_value(type);
    }

    switch (type) {
        case column_type::text:
            if (std::holds_alternative<std::string>(value) || std::holds_alternative<structured_text>(value)) {
                return value;
            }
            if (auto bytes = std::get_if<blob_t>(&value)) {
                return base64_encode(*bytes);
            }
            if (auto text = coerce_text(value, true)) return *text;
            break;
        case column_type::integer:
            if (auto i = std::get_if<int64_t>(&value)) return *i;
            break;
        case column_type::real:
        case column_type::double_precision:
            if (auto d = coerce_real(value)) return *d;
            break;
        case column_type::numeric:
            if (std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value)) {
                return value;
            }
            break;
        case column_type::boolean:
            if (std::holds_alternative<bool>(value)) return value;
            break;
        case column_type::date:
            if (std::holds_alternative<timestamp_t>(value)) return value;
            break;
        case column_type::blob:
            if (std::holds_alternative<blob_t>(value)) return value;
            break;
        case column_type::any:
            return value;
    }
    throw_incompatible("storage value " + describe(value), type);
}

nlohmann::json storage_value_to_json(const storage_value& value) {
    return std::visit([](auto&& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, blob_t>) {
            return base64_encode(v);
        } else if constexpr (std::is_same_v<T, structured_text>) {
            return nlohmann::json::parse(v.json);
        } else {
            return nlohmann::json(v);
        }
    }, value);
}

storage_value storage_value_from_json(const nlohmann::json& j) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return nullptr;
        case nlohmann::json::value_t::boolean:
            return j.get<bool>();
        case nlohmann::json::value_t::number_integer:
            return j.get<int64_t>();
        case nlohmann::json::value_t::number_unsigned: {
            auto u = j.get<uint64_t>();
            if (std::in_range<int64_t>(u)) return static_cast<int64_t>(u);
            return static_cast<double>(u);
        }
        case nlohmann::json::value_t::number_float:
            return j.get<double>();
        case nlohmann::json::value_t::string:
            return j.get<std::string>();
        default:
            // arrays, objects, binary
            return structured_text{j.dump()};
    }
}

std::string format_number(double value) {
    // Shortest representation that round-trips
    return nlohmann::json(value).dump();
}

void throw_incompatible(const std::string& type_name, column_type type) {
    throw value_conversion_error("Cannot convert " + type_name + " to " + sql_type(type) + " column");
}

void throw_missing_value(column_type type) {
    throw value_conversion_error("Non-optional " + sql_type(type) + " column has no value");
}

} // namespace detail
} // namespace strata
