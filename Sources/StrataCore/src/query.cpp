#include "strata/query.hpp"
#include <algorithm>
#include <set>
#include <sstream>

namespace strata {

namespace {

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::ostringstream out;
    bool first = true;
    for (const auto& part : parts) {
        if (!first) out << separator;
        out << part;
        first = false;
    }
    return out.str();
}

std::string placeholders(size_t count) {
    std::vector<std::string> marks(count, "?");
    return join(marks, ", ");
}

// Filters AND-joined, args appended in filter order
void append_where(std::ostringstream& sql, std::vector<storage_value>& args,
                  const std::vector<query_filter>& filters) {
    if (filters.empty()) return;

    std::vector<std::string> clauses;
    clauses.reserve(filters.size());
    for (const auto& filter : filters) {
        auto compiled = filter.build();
        clauses.push_back(std::move(compiled.clause));
        args.insert(args.end(),
                    std::make_move_iterator(compiled.args.begin()),
                    std::make_move_iterator(compiled.args.end()));
    }
    sql << " WHERE " << join(clauses, " AND ");
}

const char* operator_sql(query_operator op) {
    switch (op) {
        case query_operator::equals: return "=";
        case query_operator::not_equals: return "!=";
        case query_operator::like: return "LIKE";
        case query_operator::greater_than: return ">";
        case query_operator::less_than: return "<";
        case query_operator::in_set: return "IN";
    }
    return "=";
}

struct action_compiler {
    const std::string& table;

    compiled_query operator()(const action::select& a) const {
        compiled_query out;
        std::ostringstream sql;
        sql << "SELECT " << (a.fields.empty() ? std::string("*") : join(a.fields, ", "))
            << " FROM " << table;
        append_where(sql, out.args, a.filters);
        if (a.sort && !a.sort->fields().empty()) {
            sql << " " << a.sort->build();
        }
        if (a.limit) {
            sql << " LIMIT " << *a.limit;
        }
        if (a.offset) {
            sql << " OFFSET " << *a.offset;
        }
        out.sql = sql.str();
        return out;
    }

    compiled_query operator()(const action::insert& a) const {
        compiled_query out;
        if (a.values.empty()) return out;
        std::vector<std::string> columns;
        for (const auto& [column, value] : a.values) {
            columns.push_back(column);
            out.args.push_back(value);
        }
        std::ostringstream sql;
        sql << "INSERT INTO " << table << " (" << join(columns, ", ") << ") VALUES ("
            << placeholders(columns.size()) << ")";
        out.sql = sql.str();
        return out;
    }

    compiled_query operator()(const action::insert_many& a) const {
        compiled_query out;
        if (a.rows.empty()) return out;

        // Union of keys across all rows, sorted
        std::set<std::string> column_set;
        for (const auto& row : a.rows) {
            for (const auto& [column, _] : row) {
                column_set.insert(column);
            }
        }
        std::vector<std::string> columns(column_set.begin(), column_set.end());

        std::vector<std::string> tuples;
        tuples.reserve(a.rows.size());
        const std::string tuple = "(" + placeholders(columns.size()) + ")";
        for (const auto& row : a.rows) {
            for (const auto& column : columns) {
                auto it = row.find(column);
                out.args.push_back(it != row.end() ? it->second : storage_value{nullptr});
            }
            tuples.push_back(tuple);
        }

        std::ostringstream sql;
        sql << "INSERT INTO " << table << " (" << join(columns, ", ") << ") VALUES "
            << join(tuples, ", ");
        out.sql = sql.str();
        return out;
    }

    compiled_query operator()(const action::update& a) const {
        compiled_query out;
        if (a.values.empty()) return out;
        std::vector<std::string> assignments;
        for (const auto& [column, value] : a.values) {
            assignments.push_back(column + " = ?");
            out.args.push_back(value);
        }
        std::ostringstream sql;
        sql << "UPDATE " << table << " SET " << join(assignments, ", ");
        append_where(sql, out.args, a.filters);
        out.sql = sql.str();
        return out;
    }

    compiled_query operator()(const action::remove& a) const {
        compiled_query out;
        std::ostringstream sql;
        sql << "DELETE FROM " << table;
        append_where(sql, out.args, a.filters);
        out.sql = sql.str();
        return out;
    }

    compiled_query operator()(const action::remove_many& a) const {
        compiled_query out;
        std::ostringstream sql;
        sql << "DELETE FROM " << table << " WHERE ";
        if (a.ids.empty()) {
            sql << "1=0";
        } else {
            sql << a.field << " IN (" << placeholders(a.ids.size()) << ")";
            out.args = a.ids;
        }
        out.sql = sql.str();
        return out;
    }

    compiled_query operator()(const action::upsert& a) const {
        compiled_query out;
        std::vector<std::string> columns;
        for (const auto& [column, value] : a.values) {
            columns.push_back(column);
            out.args.push_back(value);
        }

        std::vector<std::string> update_columns;
        if (a.update_columns) {
            update_columns = *a.update_columns;
            std::sort(update_columns.begin(), update_columns.end());
        } else {
            for (const auto& column : columns) {
                if (std::find(a.conflict_columns.begin(), a.conflict_columns.end(), column)
                        == a.conflict_columns.end()) {
                    update_columns.push_back(column);
                }
            }
        }

        std::ostringstream sql;
        sql << "INSERT INTO " << table << " (" << join(columns, ", ") << ") VALUES ("
            << placeholders(columns.size()) << ") ON CONFLICT(" << join(a.conflict_columns, ", ") << ")";
        if (update_columns.empty()) {
            sql << " DO NOTHING";
        } else {
            std::vector<std::string> assignments;
            for (const auto& column : update_columns) {
                assignments.push_back(column + " = excluded." + column);
            }
            sql << " DO UPDATE SET " << join(assignments, ", ");
        }
        out.sql = sql.str();
        return out;
    }
};

} // namespace

compiled_clause query_filter::build() const {
    compiled_clause out;
    if (op_ == query_operator::in_set) {
        const auto* values = std::get_if<std::vector<storage_value>>(&value_);
        if (values == nullptr || values->empty()) {
            out.clause = "1=0";
            return out;
        }
        out.clause = field_ + " IN (" + placeholders(values->size()) + ")";
        out.args = *values;
        return out;
    }

    out.clause = field_ + " " + operator_sql(op_) + " ?";
    out.args.push_back(std::get<storage_value>(value_));
    return out;
}

std::string query_sort::build() const {
    std::vector<std::string> terms;
    terms.reserve(fields_.size());
    for (const auto& f : fields_) {
        terms.push_back(f.field + (f.order == sort_order::ascending ? " ASC" : " DESC"));
    }
    return "ORDER BY " + join(terms, ", ");
}

compiled_query query::build() const {
    return std::visit(action_compiler{table}, action);
}

} // namespace strata
