#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <type_traits>

namespace strata {

// Column definition for schema
struct column_def {
    std::string name;
    column_type type = column_type::text;
    bool is_primary_key = false;
    bool is_not_null = false;
    bool is_unique = false;
    std::optional<storage_value> default_value;
};

// CREATE TABLE modifiers
struct table_options {
    bool if_not_exists = true;
    bool temporary = false;
    bool without_rowid = false;
    bool strict = false;
};

// Immutable table schema. Column names are unique.
class table_definition {
public:
    table_definition(std::string name, std::vector<column_def> columns, table_options options = {});

    const std::string& name() const { return name_; }
    const std::vector<column_def>& columns() const { return columns_; }
    const table_options& options() const { return options_; }

    /// nullptr when the table has no such column.
    const column_def* find_column(const std::string& column) const;

private:
    std::string name_;
    std::vector<column_def> columns_;
    table_options options_;
    std::unordered_map<std::string, size_t> index_;
};

// Field table for a record type. Specialized by STRATA_RECORD.
template<typename T>
struct record_traits {
    static constexpr bool is_record = false;
};

template<typename T>
inline constexpr bool is_record_v = record_traits<T>::is_record;

namespace detail {
    template<typename T, typename = void>
    struct has_table_name : std::false_type {};
    template<typename T>
    struct has_table_name<T, std::void_t<decltype(T::table_name())>> : std::true_type {};

    template<typename T, typename = void>
    struct has_id_field : std::false_type {};
    template<typename T>
    struct has_id_field<T, std::void_t<decltype(T::id_field())>> : std::true_type {};

    template<typename T, typename = void>
    struct has_definition : std::false_type {};
    template<typename T>
    struct has_definition<T, std::void_t<decltype(T::definition())>> : std::true_type {};

    // "app::Note" -> "note"
    std::string default_table_name(const char* type_name);
} // namespace detail

template<typename T>
std::string table_name_of() {
    static_assert(is_record_v<T>, "T must be declared with STRATA_RECORD");
    if constexpr (detail::has_table_name<T>::value) {
        return std::string(T::table_name());
    } else {
        return detail::default_table_name(record_traits<T>::type_name);
    }
}

template<typename T>
std::string id_field_of() {
    static_assert(is_record_v<T>, "T must be declared with STRATA_RECORD");
    if constexpr (detail::has_id_field<T>::value) {
        return std::string(T::id_field());
    } else {
        return "id";
    }
}

/// Declared table definition, or std::nullopt when the record relies on inference.
template<typename T>
const std::optional<table_definition>& definition_of() {
    static_assert(is_record_v<T>, "T must be declared with STRATA_RECORD");
    static const std::optional<table_definition> def = []() -> std::optional<table_definition> {
        if constexpr (detail::has_definition<T>::value) {
            return T::definition();
        } else {
            return std::nullopt;
        }
    }();
    return def;
}

/// Names of the record's fields, in declaration order.
template<typename T>
std::vector<std::string> field_names_of() {
    std::vector<std::string> names;
    record_traits<T>::for_each_field([&](const char* name, auto) {
        names.emplace_back(name);
    });
    return names;
}

} // namespace strata

// ============================================================================
// STRATA_RECORD Macro
//
// Usage:
//   struct Note {
//       std::string id;
//       std::string title;
//       strata::timestamp_t createdAt;
//   };
//   STRATA_RECORD(Note, id, title, createdAt);
// ============================================================================

#define S_GET_MACRO(_0, _1, _2, _3, _4, _5, _6, _7, _8, _9, _10, _11, _12, _13, _14, _15, _16, \
                    _17, _18, _19, _20, NAME, ...) NAME

#define SFE_0(WHAT, cls)
#define SFE_1(WHAT, cls, X) WHAT(cls, X)
#define SFE_2(WHAT, cls, X, ...) WHAT(cls, X) SFE_1(WHAT, cls, __VA_ARGS__)
#define SFE_3(WHAT, cls, X, ...) WHAT(cls, X) SFE_2(WHAT, cls, __VA_ARGS__)
#define SFE_4(WHAT, cls, X, ...) WHAT(cls, X) SFE_3(WHAT, cls, __VA_ARGS__)
#define SFE_5(WHAT, cls, X, ...) WHAT(cls, X) SFE_4(WHAT, cls, __VA_ARGS__)
#define SFE_6(WHAT, cls, X, ...) WHAT(cls, X) SFE_5(WHAT, cls, __VA_ARGS__)
#define SFE_7(WHAT, cls, X, ...) WHAT(cls, X) SFE_6(WHAT, cls, __VA_ARGS__)
#define SFE_8(WHAT, cls, X, ...) WHAT(cls, X) SFE_7(WHAT, cls, __VA_ARGS__)
#define SFE_9(WHAT, cls, X, ...) WHAT(cls, X) SFE_8(WHAT, cls, __VA_ARGS__)
#define SFE_10(WHAT, cls, X, ...) WHAT(cls, X) SFE_9(WHAT, cls, __VA_ARGS__)
#define SFE_11(WHAT, cls, X, ...) WHAT(cls, X) SFE_10(WHAT, cls, __VA_ARGS__)
#define SFE_12(WHAT, cls, X, ...) WHAT(cls, X) SFE_11(WHAT, cls, __VA_ARGS__)
#define SFE_13(WHAT, cls, X, ...) WHAT(cls, X) SFE_12(WHAT, cls, __VA_ARGS__)
#define SFE_14(WHAT, cls, X, ...) WHAT(cls, X) SFE_13(WHAT, cls, __VA_ARGS__)
#define SFE_15(WHAT, cls, X, ...) WHAT(cls, X) SFE_14(WHAT, cls, __VA_ARGS__)
#define SFE_16(WHAT, cls, X, ...) WHAT(cls, X) SFE_15(WHAT, cls, __VA_ARGS__)
#define SFE_17(WHAT, cls, X, ...) WHAT(cls, X) SFE_16(WHAT, cls, __VA_ARGS__)
#define SFE_18(WHAT, cls, X, ...) WHAT(cls, X) SFE_17(WHAT, cls, __VA_ARGS__)
#define SFE_19(WHAT, cls, X, ...) WHAT(cls, X) SFE_18(WHAT, cls, __VA_ARGS__)
#define SFE_20(WHAT, cls, X, ...) WHAT(cls, X) SFE_19(WHAT, cls, __VA_ARGS__)

#define S_FOR_EACH(action, cls, ...) \
    S_GET_MACRO(_0, __VA_ARGS__, \
        SFE_20, SFE_19, SFE_18, SFE_17, SFE_16, SFE_15, SFE_14, SFE_13, SFE_12, SFE_11, \
        SFE_10, SFE_9, SFE_8, SFE_7, SFE_6, SFE_5, SFE_4, SFE_3, SFE_2, SFE_1, SFE_0)(action, cls, __VA_ARGS__)

#define STRATA_VISIT_FIELD(cls, prop) \
    visit(#prop, &cls::prop);

// Field table registration macro (use at global namespace scope)
#define STRATA_RECORD(cls, ...) \
    template<> \
    struct strata::record_traits<cls> { \
        static constexpr bool is_record = true; \
        static constexpr const char* type_name = #cls; \
        \
        /* visit(name, member pointer) for every field, in declaration order */ \
        template<typename Visitor> \
        static void for_each_field(Visitor&& visit) { \
            S_FOR_EACH(STRATA_VISIT_FIELD, cls, __VA_ARGS__) \
        } \
    }

#endif // __cplusplus
