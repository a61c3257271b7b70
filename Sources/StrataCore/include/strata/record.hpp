#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include "schema.hpp"
#include "engine.hpp"
#include "value_converter.hpp"
#include "direct_decoder.hpp"
#include <optional>
#include <string>
#include <vector>

namespace strata {

namespace detail {
    template<typename T, typename Field>
    storage_value field_to_storage(const Field& value, const char* name) {
        const auto& def = definition_of<T>();
        if (def) {
            if (const auto* column = def->find_column(name)) {
                return to_storage_value(value, column->type, !column->is_not_null);
            }
        }
        // Schema-less field
        auto inferred = infer_type(value);
        return to_storage_value(value, inferred.type, inferred.is_optional);
    }
} // namespace detail

/// Column -> value map for a record. Declared columns use their declared
/// type and nullability; other fields fall back to inference.
template<typename T>
value_map to_storage_values(const T& record) {
    static_assert(is_record_v<T>, "T must be declared with STRATA_RECORD");
    value_map values;
    record_traits<T>::for_each_field([&](const char* name, auto member) {
        values[name] = detail::field_to_storage<T>(record.*member, name);
    });
    return values;
}

/// Storage value of the record's id field.
/// Throws schema_error when the id field is missing or NULL.
template<typename T>
storage_value record_id(const T& record) {
    static_assert(is_record_v<T>, "T must be declared with STRATA_RECORD");
    const std::string id_field = id_field_of<T>();
    std::optional<storage_value> id;
    record_traits<T>::for_each_field([&](const char* name, auto member) {
        if (id_field == name) {
            id = detail::field_to_storage<T>(record.*member, name);
        }
    });
    if (!id) {
        throw schema_error(std::string(record_traits<T>::type_name) + " has no id field '" + id_field + "'");
    }
    if (is_null(*id)) {
        throw schema_error(std::string(record_traits<T>::type_name) + " id field '" + id_field + "' is null");
    }
    return *id;
}

/// Build a record from an engine row. Decoding failures are rethrown as
/// record_conversion_error carrying the type name and the row's columns.
template<typename T>
T from_storage(const row& source) {
    static_assert(is_record_v<T>, "T must be declared with STRATA_RECORD");
    const auto& def = definition_of<T>();
    try {
        decode_context ctx(source, def ? &*def : nullptr, true);
        return decode_record<T>(ctx);
    } catch (const decoding_error& e) {
        throw record_conversion_error(record_traits<T>::type_name, source.column_names(), e.what());
    }
}

/// Same as from_storage, for a flat field -> value map.
template<typename T>
T from_storage(const value_map& values) {
    static_assert(is_record_v<T>, "T must be declared with STRATA_RECORD");
    const auto& def = definition_of<T>();
    try {
        decode_context ctx(values, def ? &*def : nullptr, true);
        return decode_record<T>(ctx);
    } catch (const decoding_error& e) {
        throw record_conversion_error(record_traits<T>::type_name, e.available_columns(), e.what());
    }
}

/// Table definition for a record: the declared one, else one derived from
/// the field types (id field becomes the primary key, std::optional fields
/// are nullable).
template<typename T>
table_definition table_definition_of() {
    const auto& def = definition_of<T>();
    if (def) return *def;

    const std::string id_field = id_field_of<T>();
    std::vector<column_def> columns;
    record_traits<T>::for_each_field([&](const char* name, auto member) {
        using M = std::remove_cv_t<std::remove_reference_t<decltype(std::declval<T&>().*member)>>;
        column_def col;
        col.name = name;
        col.type = detail::natural_column_type<typename detail::unwrap_optional<M>::type>();
        col.is_primary_key = (id_field == name);
        col.is_not_null = !detail::is_optional<M>::value;
        columns.push_back(std::move(col));
    });
    return table_definition(table_name_of<T>(), std::move(columns));
}

} // namespace strata

#endif // __cplusplus
