#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include "schema.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <typeinfo>
#include <utility>

// Timestamps inside structured-text are seconds since epoch (double).
namespace nlohmann {
template <>
struct adl_serializer<strata::timestamp_t> {
    static void to_json(json& j, const strata::timestamp_t& t) {
        j = strata::timestamp_to_seconds(t);
    }

    static void from_json(const json& j, strata::timestamp_t& t) {
        std::optional<strata::timestamp_t> parsed;
        if (j.is_number()) {
            parsed = strata::checked_timestamp_from_seconds(j.get<double>());
        } else if (j.is_string()) {
            parsed = strata::parse_timestamp(j.get<std::string>());
        }
        if (!parsed) {
            throw strata::decoding_error(strata::decoding_error_kind::type_mismatch, "", "timestamp", {},
                                         "Unparseable timestamp: " + j.dump());
        }
        t = *parsed;
    }
};
} // namespace nlohmann

namespace strata {

// Result of type inference: column type plus whether the value was a nullable wrapper
struct type_inference {
    column_type type;
    bool is_optional;
};

namespace detail {
    template<typename T, typename = void>
    struct is_streamable : std::false_type {};
    template<typename T>
    struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
        : std::true_type {};

    // Values stored as structured-text (JSON): containers, records, and
    // any other type nlohmann can serialize.
    template<typename T>
    struct is_structured : std::bool_constant<
        is_sequence<T>::value ||
        is_string_map<T>::value ||
        is_record_v<T> ||
        (!is_storage_representable<T>::value && std::is_constructible_v<nlohmann::json, const T&>)
    > {};

    template<typename T>
    constexpr column_type natural_column_type() {
        if constexpr (std::is_same_v<T, bool>) {
            return column_type::boolean;
        } else if constexpr (is_integer_v<T>) {
            return column_type::integer;
        } else if constexpr (std::is_same_v<T, float>) {
            return column_type::real;
        } else if constexpr (std::is_floating_point_v<T>) {
            return column_type::double_precision;
        } else if constexpr (std::is_same_v<T, timestamp_t>) {
            return column_type::date;
        } else if constexpr (std::is_same_v<T, blob_t>) {
            return column_type::blob;
        } else {
            // strings, containers, records, everything else
            return column_type::text;
        }
    }

    template<typename T>
    std::string type_name_of() {
        if constexpr (is_optional<T>::value) {
            return "optional<" + type_name_of<typename T::value_type>() + ">";
        } else if constexpr (is_record_v<T>) {
            return record_traits<T>::type_name;
        } else if constexpr (std::is_same_v<T, bool>) {
            return "bool";
        } else if constexpr (is_integer_v<T>) {
            return (std::is_signed_v<T> ? "int" : "uint") + std::to_string(sizeof(T) * 8);
        } else if constexpr (std::is_floating_point_v<T>) {
            return std::is_same_v<T, float> ? "float" : "double";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "string";
        } else if constexpr (std::is_same_v<T, timestamp_t>) {
            return "timestamp";
        } else if constexpr (std::is_same_v<T, blob_t>) {
            return "blob";
        } else if constexpr (std::is_same_v<T, storage_value>) {
            return "storage_value";
        } else if constexpr (is_sequence<T>::value) {
            return "sequence<" + type_name_of<typename T::value_type>() + ">";
        } else if constexpr (is_string_map<T>::value) {
            return "map<string, " + type_name_of<typename T::mapped_type>() + ">";
        } else {
            return typeid(T).name();
        }
    }

    // Non-template coercions, value_converter.cpp
    std::optional<bool> coerce_bool(const storage_value& raw);
    std::optional<int64_t> coerce_integer(const storage_value& raw);
    std::optional<double> coerce_real(const storage_value& raw);
    std::optional<std::string> coerce_text(const storage_value& raw, bool auto_infer);
    std::optional<timestamp_t> coerce_timestamp(const storage_value& raw);
    std::optional<blob_t> coerce_blob(const storage_value& raw, bool auto_infer);

    /// JSON source text held by a raw value (text or structured-text).
    std::optional<std::string> structured_source(const storage_value& raw);

    storage_value convert_storage_value(const storage_value& value, column_type type, bool is_optional);

    nlohmann::json storage_value_to_json(const storage_value& value);
    storage_value storage_value_from_json(const nlohmann::json& j);

    std::string format_number(double value);

    [[noreturn]] void throw_incompatible(const std::string& type_name, column_type type);
    [[noreturn]] void throw_missing_value(column_type type);

    template<typename T>
    nlohmann::json to_json_tree(const T& value) {
        if constexpr (is_optional<T>::value) {
            if (!value.has_value()) return nullptr;
            return to_json_tree(*value);
        } else if constexpr (std::is_same_v<T, storage_value>) {
            return storage_value_to_json(value);
        } else if constexpr (is_record_v<T>) {
            nlohmann::json j = nlohmann::json::object();
            record_traits<T>::for_each_field([&](const char* name, auto member) {
                j[name] = to_json_tree(value.*member);
            });
            return j;
        } else if constexpr (is_sequence<T>::value) {
            nlohmann::json j = nlohmann::json::array();
            for (const auto& element : value) {
                j.push_back(to_json_tree(element));
            }
            return j;
        } else if constexpr (is_string_map<T>::value) {
            nlohmann::json j = nlohmann::json::object();
            for (const auto& [key, element] : value) {
                j[key] = to_json_tree(element);
            }
            return j;
        } else if constexpr (std::is_same_v<T, blob_t>) {
            return base64_encode(value);
        } else {
            return nlohmann::json(value);
        }
    }

    template<typename T>
    void from_json_tree(const nlohmann::json& j, T& out) {
        if constexpr (is_optional<T>::value) {
            if (j.is_null()) {
                out.reset();
            } else {
                typename T::value_type inner{};
                from_json_tree(j, inner);
                out = std::move(inner);
            }
        } else if constexpr (std::is_same_v<T, storage_value>) {
            out = storage_value_from_json(j);
        } else if constexpr (is_record_v<T>) {
            if (!j.is_object()) {
                throw decoding_error(decoding_error_kind::type_mismatch, "", type_name_of<T>(), {},
                                     std::string("Expected JSON object, got ") + j.type_name());
            }
            record_traits<T>::for_each_field([&](const char* name, auto member) {
                using M = std::remove_cv_t<std::remove_reference_t<decltype(out.*member)>>;
                auto it = j.find(name);
                if (it == j.end() || it->is_null()) {
                    if constexpr (is_optional<M>::value) {
                        (out.*member).reset();
                    } else {
                        auto k = it == j.end() ? decoding_error_kind::key_not_found
                                               : decoding_error_kind::value_not_found;
                        throw decoding_error(k, name, type_name_of<M>(), {},
                                             std::string("No value for key '") + name + "'");
                    }
                } else {
                    from_json_tree(*it, out.*member);
                }
            });
        } else if constexpr (is_sequence<T>::value) {
            if (!j.is_array()) {
                throw decoding_error(decoding_error_kind::type_mismatch, "", type_name_of<T>(), {},
                                     std::string("Expected JSON array, got ") + j.type_name());
            }
            out.clear();
            for (const auto& element : j) {
                typename T::value_type item{};
                from_json_tree(element, item);
                out.insert(out.end(), std::move(item));
            }
        } else if constexpr (is_string_map<T>::value) {
            if (!j.is_object()) {
                throw decoding_error(decoding_error_kind::type_mismatch, "", type_name_of<T>(), {},
                                     std::string("Expected JSON object, got ") + j.type_name());
            }
            out.clear();
            for (auto it = j.begin(); it != j.end(); ++it) {
                typename T::mapped_type item{};
                from_json_tree(it.value(), item);
                out.emplace(it.key(), std::move(item));
            }
        } else if constexpr (std::is_same_v<T, blob_t>) {
            if (j.is_string()) {
                auto bytes = base64_decode(j.get<std::string>());
                if (!bytes) {
                    throw decoding_error(decoding_error_kind::data_corrupted, "", "blob", {},
                                         "Invalid base64 payload");
                }
                out = std::move(*bytes);
            } else {
                out = j.get<blob_t>();
            }
        } else {
            out = j.get<T>();
        }
    }
} // namespace detail

/// Serialize a container, record or other JSON-capable value to structured-text.
/// Throws value_conversion_error when the value has no valid JSON form
/// (invalid UTF-8, malformed embedded structured-text).
template<typename T>
std::string to_structured_text(const T& value) {
    try {
        return detail::to_json_tree(value).dump();
    } catch (const nlohmann::json::exception& e) {
        throw value_conversion_error("Cannot encode " + detail::type_name_of<T>() +
                                     " as structured text: " + e.what());
    }
}

// ============================================================================
// Type inference
// ============================================================================

type_inference infer_type(const storage_value& raw);

template<typename T>
type_inference infer_type(const T& value) {
    if constexpr (detail::is_optional<T>::value) {
        if (!value.has_value()) {
            return {column_type::text, true};
        }
        return {infer_type(*value).type, true};
    } else {
        return {detail::natural_column_type<T>(), false};
    }
}

// ============================================================================
// Host value -> storage value
// ============================================================================

/// Convert a host value for a column of the given type.
/// Throws value_conversion_error when a required value is absent or the
/// value is incompatible with the column type.
template<typename T>
storage_value to_storage_value(const T& value, column_type type, bool is_optional) {
    if constexpr (detail::is_optional<T>::value) {
        if (!value.has_value()) {
            if (is_optional) return nullptr;
            detail::throw_missing_value(type);
        }
        return to_storage_value(*value, type, is_optional);
    } else if constexpr (std::is_same_v<T, storage_value>) {
        return detail::convert_storage_value(value, type, is_optional);
    } else {
        switch (type) {
            case column_type::text:
                if constexpr (std::is_convertible_v<const T&, std::string_view>) {
                    return std::string(std::string_view(value));
                } else if constexpr (std::is_same_v<T, structured_text>) {
                    return value;
                } else if constexpr (detail::is_structured<T>::value) {
                    return structured_text{to_structured_text(value)};
                } else if constexpr (std::is_same_v<T, bool>) {
                    return std::string(value ? "true" : "false");
                } else if constexpr (detail::is_integer_v<T>) {
                    return std::to_string(value);
                } else if constexpr (std::is_floating_point_v<T>) {
                    return detail::format_number(static_cast<double>(value));
                } else if constexpr (std::is_same_v<T, timestamp_t>) {
                    return format_timestamp(value);
                } else if constexpr (std::is_same_v<T, blob_t>) {
                    return base64_encode(value);
                } else if constexpr (detail::is_streamable<T>::value) {
                    std::ostringstream ss;
                    ss << value;
                    return ss.str();
                }
                break;
            case column_type::integer:
                if constexpr (detail::is_integer_v<T>) {
                    return make_storage_value(value);
                }
                break;
            case column_type::real:
            case column_type::double_precision:
                if constexpr (detail::is_integer_v<T> || std::is_floating_point_v<T>) {
                    return static_cast<double>(value);
                }
                break;
            case column_type::numeric:
                if constexpr (std::is_floating_point_v<T>) {
                    return static_cast<double>(value);
                } else if constexpr (detail::is_integer_v<T>) {
                    return make_storage_value(value);
                }
                break;
            case column_type::boolean:
                if constexpr (std::is_same_v<T, bool>) {
                    return value;
                }
                break;
            case column_type::date:
                if constexpr (std::is_same_v<T, timestamp_t>) {
                    return value;
                }
                break;
            case column_type::blob:
                if constexpr (std::is_same_v<T, blob_t>) {
                    return value;
                }
                break;
            case column_type::any:
                if constexpr (detail::is_storage_representable<T>::value) {
                    return make_storage_value(value);
                } else if constexpr (detail::is_structured<T>::value) {
                    return structured_text{to_structured_text(value)};
                } else if constexpr (detail::is_streamable<T>::value) {
                    std::ostringstream ss;
                    ss << value;
                    return ss.str();
                }
                break;
        }
        detail::throw_incompatible(detail::type_name_of<T>(), type);
    }
}

// ============================================================================
// Storage value -> host value
// ============================================================================

/// Convert a raw engine value to T. std::nullopt when the value is null or
/// cannot be coerced; never throws for conversion failures.
template<typename T>
std::optional<T> from_storage_value(const storage_value& raw, bool auto_infer = false) {
    static_assert(!detail::is_optional<T>::value, "decode the wrapped type");

    if (is_null(raw)) return std::nullopt;

    if constexpr (std::is_same_v<T, storage_value>) {
        return raw;
    } else if constexpr (std::is_same_v<T, bool>) {
        return detail::coerce_bool(raw);
    } else if constexpr (detail::is_integer_v<T>) {
        auto v = detail::coerce_integer(raw);
        if (!v || !std::in_range<T>(*v)) return std::nullopt;
        return static_cast<T>(*v);
    } else if constexpr (std::is_floating_point_v<T>) {
        auto v = detail::coerce_real(raw);
        if (!v) return std::nullopt;
        return static_cast<T>(*v);
    } else if constexpr (std::is_same_v<T, std::string>) {
        return detail::coerce_text(raw, auto_infer);
    } else if constexpr (std::is_same_v<T, timestamp_t>) {
        return detail::coerce_timestamp(raw);
    } else if constexpr (std::is_same_v<T, blob_t>) {
        return detail::coerce_blob(raw, auto_infer);
    } else if constexpr (std::is_same_v<T, structured_text>) {
        auto text = detail::structured_source(raw);
        if (!text) return std::nullopt;
        return structured_text{*text};
    } else {
        auto text = detail::structured_source(raw);
        if (!text) return std::nullopt;
        try {
            T out{};
            detail::from_json_tree(nlohmann::json::parse(*text), out);
            return out;
        } catch (const nlohmann::json::exception& e) {
            STRATA_LOG_DEBUG("convert", "structured decode of %s failed: %s",
                             detail::type_name_of<T>().c_str(), e.what());
            return std::nullopt;
        } catch (const decoding_error& e) {
            STRATA_LOG_DEBUG("convert", "structured decode of %s failed: %s",
                             detail::type_name_of<T>().c_str(), e.what());
            return std::nullopt;
        }
    }
}

/// Re-express a raw value in the representation of a declared column type
/// (e.g. INTEGER 1 in a BOOLEAN column becomes true). std::nullopt on failure.
std::optional<storage_value> normalize_storage_value(const storage_value& raw, column_type type, bool auto_infer);

} // namespace strata

#endif // __cplusplus
