#pragma once

#ifdef __cplusplus

#include "engine.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace strata {

// Row materialized from a sqlite3 statement; keeps result column order
class sqlite_row : public row {
public:
    explicit sqlite_row(std::vector<std::pair<std::string, storage_value>> columns)
        : columns_(std::move(columns)) {}

    std::optional<storage_value> get(const std::string& column) const override;
    std::vector<std::string> column_names() const override;

private:
    std::vector<std::pair<std::string, storage_value>> columns_;
};

class sqlite_connection : public connection {
public:
    /// Open mode for database connections
    enum class open_mode {
        read_write,  ///< Full read/write access (default)
        read_only    ///< Read-only access
    };

    explicit sqlite_connection(const configuration& config);
    ~sqlite_connection() override;

    // Non-copyable
    sqlite_connection(const sqlite_connection&) = delete;
    sqlite_connection& operator=(const sqlite_connection&) = delete;

    void execute(const std::string& sql, const std::vector<storage_value>& args = {}) override;
    bool table_exists(const std::string& name) override;
    void create_table(const std::string& name,
                      const table_options& options,
                      const std::function<void(table_builder&)>& columns) override;
    std::vector<row_ptr> fetch_rows(const std::string& sql,
                                    const std::vector<storage_value>& args = {}) override;

    // Transaction support
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

private:
    sqlite3_stmt* prepare(const std::string& sql, const std::vector<storage_value>& args);
    void bind_value(sqlite3_stmt* stmt, int index, const storage_value& value);
    storage_value extract_column(sqlite3_stmt* stmt, int index);

    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(sqlite_connection& conn);
    ~transaction();

    void commit();

private:
    sqlite_connection& conn_;
    bool completed_ = false;
};

// One serialized connection. Writes run inside BEGIN IMMEDIATE ... COMMIT.
class sqlite_queue : public database_queue {
public:
    explicit sqlite_queue(const configuration& config);

protected:
    void read_impl(const std::function<void(connection&)>& body) override;
    void write_impl(const std::function<void(connection&)>& body) override;

private:
    std::mutex mutex_;
    std::unique_ptr<sqlite_connection> conn_;
};

class sqlite_factory : public database_factory {
public:
    std::shared_ptr<database_queue> make_queue(const configuration& config) override;
};

/// SQL literal for a DEFAULT clause.
std::string sql_literal(const storage_value& value);

} // namespace strata

#endif // __cplusplus
