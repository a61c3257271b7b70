#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strata {

// Parameterized SQL text plus its positional arguments
struct compiled_query {
    std::string sql;
    std::vector<storage_value> args;
};

// WHERE clause fragment
struct compiled_clause {
    std::string clause;
    std::vector<storage_value> args;
};

enum class query_operator {
    equals,
    not_equals,
    like,
    greater_than,
    less_than,
    in_set
};

// One predicate term: field <op> value
class query_filter {
public:
    using value_type = std::variant<storage_value, std::vector<storage_value>>;

    template<typename V>
    static query_filter equals(std::string field, const V& value) {
        return query_filter(std::move(field), query_operator::equals, make_storage_value(value));
    }

    template<typename V>
    static query_filter not_equals(std::string field, const V& value) {
        return query_filter(std::move(field), query_operator::not_equals, make_storage_value(value));
    }

    /// Pattern is passed through; the caller supplies '%' / '_' wildcards.
    static query_filter like(std::string field, std::string pattern) {
        return query_filter(std::move(field), query_operator::like, storage_value{std::move(pattern)});
    }

    template<typename V>
    static query_filter greater_than(std::string field, const V& value) {
        return query_filter(std::move(field), query_operator::greater_than, make_storage_value(value));
    }

    template<typename V>
    static query_filter less_than(std::string field, const V& value) {
        return query_filter(std::move(field), query_operator::less_than, make_storage_value(value));
    }

    static query_filter in_set(std::string field, std::vector<storage_value> values) {
        return query_filter(std::move(field), query_operator::in_set, std::move(values));
    }

    template<typename V>
    static query_filter in_set(std::string field, const std::vector<V>& values) {
        std::vector<storage_value> raw;
        raw.reserve(values.size());
        for (const auto& v : values) {
            raw.push_back(make_storage_value(v));
        }
        return in_set(std::move(field), std::move(raw));
    }

    const std::string& field() const { return field_; }
    query_operator op() const { return op_; }
    const value_type& value() const { return value_; }

    /// "field = ?" etc. An empty in_set compiles to the always-false "1=0".
    compiled_clause build() const;

private:
    query_filter(std::string field, query_operator op, value_type value)
        : field_(std::move(field)), op_(op), value_(std::move(value)) {}

    std::string field_;
    query_operator op_;
    value_type value_;
};

enum class sort_order {
    ascending,
    descending
};

struct sort_field {
    std::string field;
    sort_order order = sort_order::ascending;
};

// Ordered list of sort keys; earlier keys take precedence
class query_sort {
public:
    query_sort(std::string field, sort_order order = sort_order::ascending)
        : fields_{sort_field{std::move(field), order}} {}

    explicit query_sort(std::vector<sort_field> fields) : fields_(std::move(fields)) {}

    const std::vector<sort_field>& fields() const { return fields_; }

    /// "ORDER BY a ASC, b DESC"
    std::string build() const;

private:
    std::vector<sort_field> fields_;
};

// Query actions. Each one carries everything it needs to compile.
namespace action {

struct select {
    std::vector<std::string> fields{"*"};
    std::vector<query_filter> filters;
    std::optional<query_sort> sort;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
};

struct insert {
    value_map values;
};

struct insert_many {
    std::vector<value_map> rows;
};

struct update {
    value_map values;
    std::vector<query_filter> filters;
};

struct remove {
    std::vector<query_filter> filters;
};

struct remove_many {
    std::string field;
    std::vector<storage_value> ids;
};

struct upsert {
    value_map values;
    std::vector<std::string> conflict_columns;
    std::optional<std::vector<std::string>> update_columns;  // default: values minus conflict columns
};

} // namespace action

using query_action = std::variant<
    action::select,
    action::insert,
    action::insert_many,
    action::update,
    action::remove,
    action::remove_many,
    action::upsert
>;

struct query {
    std::string table;
    query_action action;

    /// Compile to SQL text and positional arguments. Deterministic for equal inputs.
    compiled_query build() const;
};

} // namespace strata

#endif // __cplusplus
