#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include "schema.hpp"
#include "engine.hpp"
#include "value_converter.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strata {

// Keyed view over one row (or a flat field -> value map) that decodes
// fields straight into host types, without an intermediate JSON document.
//
// Fields declared in the table definition are decoded strictly against the
// declared type. Other fields use inference when auto_infer is set.
// Sequences, maps and nested records are read back from structured-text.
class decode_context {
public:
    decode_context(const value_map& values,
                   const table_definition* definition = nullptr,
                   bool auto_infer = false);

    explicit decode_context(const row& source,
                            const table_definition* definition = nullptr,
                            bool auto_infer = true);

    /// Field present in the source (possibly holding NULL).
    bool contains(const std::string& field) const;

    /// Field absent or NULL.
    bool is_nil(const std::string& field) const;

    std::vector<std::string> all_fields() const;

    /// Declared type from the table definition, else inferred from the raw value.
    type_inference resolve(const std::string& field, const storage_value& raw) const;

    /// Decode one field. std::optional<U> targets yield std::nullopt for absent or
    /// NULL fields; other targets throw decoding_error (key_not_found,
    /// value_not_found or type_mismatch).
    template<typename T>
    T decode(const std::string& field) const {
        if constexpr (detail::is_optional<T>::value) {
            using U = typename T::value_type;
            auto raw = lookup(field);
            if (!raw || is_null(*raw)) return std::nullopt;
            return T{convert<U>(field, *raw)};
        } else {
            auto raw = lookup(field);
            if (!raw) {
                fail(decoding_error_kind::key_not_found, field, detail::type_name_of<T>(),
                     "No value associated with key '" + field + "'");
            }
            if (is_null(*raw)) {
                fail(decoding_error_kind::value_not_found, field, detail::type_name_of<T>(),
                     "Expected " + detail::type_name_of<T>() + " value for '" + field + "' but found null");
            }
            return convert<T>(field, *raw);
        }
    }

private:
    std::optional<storage_value> lookup(const std::string& field) const;
    bool infer_for(const std::string& field) const;

    [[noreturn]] void fail(decoding_error_kind kind, const std::string& field,
                           const std::string& target_type, const std::string& msg) const;

    template<typename T>
    T convert(const std::string& field, const storage_value& raw) const {
        std::optional<T> converted;
        if constexpr (std::is_same_v<T, storage_value>) {
            converted = normalize_storage_value(raw, resolve(field, raw).type, infer_for(field));
        } else {
            converted = from_storage_value<T>(raw, infer_for(field));
        }
        if (!converted) {
            fail(decoding_error_kind::type_mismatch, field, detail::type_name_of<T>(),
                 "Cannot convert " + describe(raw) + " in '" + field + "' to " + detail::type_name_of<T>());
        }
        return std::move(*converted);
    }

    std::variant<const value_map*, const row*> source_;
    const table_definition* definition_;
    bool auto_infer_;
};

/// Build a record from a decode context, field by field.
template<typename T>
T decode_record(const decode_context& ctx) {
    static_assert(is_record_v<T>, "T must be declared with STRATA_RECORD");
    T record{};
    record_traits<T>::for_each_field([&](const char* name, auto member) {
        using M = std::remove_cv_t<std::remove_reference_t<decltype(record.*member)>>;
        record.*member = ctx.decode<M>(name);
    });
    return record;
}

} // namespace strata

#endif // __cplusplus
