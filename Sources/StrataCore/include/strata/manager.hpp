#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include "schema.hpp"
#include "engine.hpp"
#include "configuration.hpp"
#include "query.hpp"
#include "record.hpp"
#include "log.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// Record CRUD and raw query execution over one database_queue.
// Every call compiles one query and submits it as a single read or write unit.
class database_manager {
public:
    /// Use an explicitly provided queue.
    explicit database_manager(std::shared_ptr<database_queue> queue);

    /// Obtain a queue from the registered default factory.
    /// Throws engine_unavailable_error when strata::init() has not run.
    explicit database_manager(const configuration& config);

    database_manager(const database_manager&) = delete;
    database_manager& operator=(const database_manager&) = delete;

    bool table_exists(const std::string& name);

    /// Throws schema_conflict_error if the table exists and the definition
    /// does not request if_not_exists.
    void create_table(const table_definition& definition);

    template<typename T>
    void create_table() {
        create_table(table_definition_of<T>());
    }

    template<typename T>
    void add(const T& record) {
        static_assert(is_record_v<T>, "T must be declared with STRATA_RECORD");
        write(query{table_name_of<T>(), action::insert{to_storage_values(record)}});
    }

    /// Batched insert. No-op for an empty list.
    template<typename T>
    void add(const std::vector<T>& records) {
        static_assert(is_record_v<T>, "T must be declared with STRATA_RECORD");
        if (records.empty()) return;
        action::insert_many batch;
        batch.rows.reserve(records.size());
        for (const auto& record : records) {
            batch.rows.push_back(to_storage_values(record));
        }
        write(query{table_name_of<T>(), std::move(batch)});
    }

    /// Insert, or update every non-id column when the id already exists.
    template<typename T>
    void save(const T& record) {
        static_assert(is_record_v<T>, "T must be declared with STRATA_RECORD");
        action::upsert upsert_action;
        upsert_action.values = to_storage_values(record);
        upsert_action.conflict_columns = {id_field_of<T>()};
        write(query{table_name_of<T>(), std::move(upsert_action)});
    }

    template<typename T>
    std::vector<T> fetch(std::vector<query_filter> filters = {},
                         std::optional<query_sort> sort = std::nullopt,
                         std::optional<int64_t> limit = std::nullopt,
                         std::optional<int64_t> offset = std::nullopt) {
        action::select select_action;
        select_action.filters = std::move(filters);
        select_action.sort = std::move(sort);
        select_action.limit = limit;
        select_action.offset = offset;
        return read<T>(query{table_name_of<T>(), std::move(select_action)});
    }

    template<typename T>
    void remove(const T& record) {
        static_assert(is_record_v<T>, "T must be declared with STRATA_RECORD");
        action::remove remove_action;
        remove_action.filters.push_back(query_filter::equals(id_field_of<T>(), record_id(record)));
        write(query{table_name_of<T>(), std::move(remove_action)});
    }

    /// Batched delete keyed on the id field.
    template<typename T>
    void remove(const std::vector<T>& records) {
        static_assert(is_record_v<T>, "T must be declared with STRATA_RECORD");
        action::remove_many batch;
        batch.field = id_field_of<T>();
        batch.ids.reserve(records.size());
        for (const auto& record : records) {
            batch.ids.push_back(record_id(record));
        }
        write(query{table_name_of<T>(), std::move(batch)});
    }

    template<typename T>
    std::vector<T> read(const query& q) {
        auto compiled = q.build();
        return read<T>(compiled.sql, compiled.args);
    }

    template<typename T>
    std::vector<T> read(const std::string& sql, const std::vector<storage_value>& args = {}) {
        STRATA_LOG_DEBUG("manager", "read: %s", sql.c_str());
        return queue_->read([&](connection& conn) {
            return decode_rows<T>(conn.fetch_rows(sql, args));
        });
    }

    void write(const query& q);
    void write(const std::string& sql, const std::vector<storage_value>& args = {});

    /// Raw rows, undecoded.
    std::vector<row_ptr> debug_fetch_rows(const std::string& sql, const std::vector<storage_value>& args = {});

    const std::shared_ptr<database_queue>& queue() const { return queue_; }

private:
    template<typename T>
    static std::vector<T> decode_rows(const std::vector<row_ptr>& rows) {
        std::vector<T> records;
        records.reserve(rows.size());
        for (size_t i = 0; i < rows.size(); ++i) {
            try {
                records.push_back(from_storage<T>(*rows[i]));
            } catch (const record_conversion_error& e) {
                STRATA_LOG_ERROR("manager", "row %zu: %s", i, e.what());
                throw;
            }
        }
        return records;
    }

    std::shared_ptr<database_queue> queue_;
};

} // namespace strata

#endif // __cplusplus
