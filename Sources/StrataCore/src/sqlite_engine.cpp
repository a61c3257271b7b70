#include "strata/sqlite_engine.hpp"
#include "strata/log.hpp"
#include <cstdio>
#include <sstream>

namespace strata {

// ============================================================================
// sqlite_row
// ============================================================================

std::optional<storage_value> sqlite_row::get(const std::string& column) const {
    for (const auto& [name, value] : columns_) {
        if (name == column) return value;
    }
    return std::nullopt;
}

std::vector<std::string> sqlite_row::column_names() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& [name, _] : columns_) {
        names.push_back(name);
    }
    return names;
}

// ============================================================================
// sqlite_connection
// ============================================================================

sqlite_connection::sqlite_connection(const configuration& config)
    : path_(config.path),
      mode_(config.read_only ? open_mode::read_only : open_mode::read_write) {
    int flags = SQLITE_OPEN_FULLMUTEX;  // Always use serialized threading mode
    if (mode_ == open_mode::read_only) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }

    int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        STRATA_LOG_ERROR("sqlite", "Failed to open %s: %s", path_.c_str(), error.c_str());
        throw engine_error("Failed to open database: " + error);
    }

    if (config.foreign_keys) {
        execute("PRAGMA foreign_keys = ON");
    }

    // WAL needs a real file and a writable connection
    if (mode_ == open_mode::read_write && path_ != ":memory:" && !config.journal_mode.empty()) {
        execute("PRAGMA journal_mode = " + config.journal_mode);
    }

    // Set busy timeout to handle lock contention
    sqlite3_busy_timeout(db_, config.busy_timeout_ms);

    STRATA_LOG_INFO("sqlite", "Opened %s (%s)", path_.c_str(),
                    mode_ == open_mode::read_only ? "read-only" : "read-write");
}

sqlite_connection::~sqlite_connection() {
    if (db_) {
        sqlite3_close(db_);
    }
}

sqlite3_stmt* sqlite_connection::prepare(const std::string& sql, const std::vector<storage_value>& args) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        STRATA_LOG_ERROR("sqlite", "%s in %s", error.c_str(), sql.c_str());
        throw engine_error("Failed to prepare statement: " + error + " (SQL: " + sql + ")");
    }

    int index = 1;
    for (const auto& arg : args) {
        bind_value(stmt, index++, arg);
    }
    return stmt;
}

void sqlite_connection::execute(const std::string& sql, const std::vector<storage_value>& args) {
    if (args.empty()) {
        // Fast path for parameterless statements (may contain several)
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            STRATA_LOG_ERROR("sqlite", "%s in %s", error.c_str(), sql.c_str());
            throw engine_error("SQL execution failed: " + error + " (SQL: " + sql + ")");
        }
        return;
    }

    sqlite3_stmt* stmt = prepare(sql, args);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        std::string error = sqlite3_errmsg(db_);
        STRATA_LOG_ERROR("sqlite", "Execution failed: %s", error.c_str());
        throw engine_error("Execution failed: " + error + " (SQL: " + sql + ")");
    }
}

bool sqlite_connection::table_exists(const std::string& name) {
    // TEMP tables live in sqlite_temp_master
    sqlite3_stmt* stmt = prepare("SELECT name FROM sqlite_master WHERE type='table' AND name=?1 "
                                 "UNION ALL "
                                 "SELECT name FROM sqlite_temp_master WHERE type='table' AND name=?1",
                                 {storage_value{name}});
    bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
    sqlite3_finalize(stmt);
    return exists;
}

namespace {

// Collects column SQL for CREATE TABLE
class sqlite_table_builder : public table_builder {
public:
    void column(const column_def& col) override {
        std::ostringstream sql;
        sql << col.name << " " << sql_type(col.type);
        if (col.is_primary_key) {
            sql << " PRIMARY KEY";
        }
        if (col.is_not_null) {
            sql << " NOT NULL";
        }
        if (col.is_unique) {
            sql << " UNIQUE";
        }
        if (col.default_value) {
            sql << " DEFAULT " << sql_literal(*col.default_value);
        }
        columns_.push_back(sql.str());
    }

    const std::vector<std::string>& columns() const { return columns_; }

private:
    std::vector<std::string> columns_;
};

} // namespace

void sqlite_connection::create_table(const std::string& name,
                                     const table_options& options,
                                     const std::function<void(table_builder&)>& columns) {
    sqlite_table_builder builder;
    columns(builder);
    if (builder.columns().empty()) {
        throw schema_error("Table " + name + " has no columns");
    }

    std::ostringstream sql;
    sql << "CREATE ";
    if (options.temporary) {
        sql << "TEMP ";
    }
    sql << "TABLE ";
    if (options.if_not_exists) {
        sql << "IF NOT EXISTS ";
    }
    sql << name << " (";
    bool first = true;
    for (const auto& col : builder.columns()) {
        if (!first) sql << ", ";
        sql << col;
        first = false;
    }
    sql << ")";

    // Table options are comma-separated after the column list
    std::vector<const char*> suffixes;
    if (options.without_rowid) suffixes.push_back("WITHOUT ROWID");
    if (options.strict) suffixes.push_back("STRICT");
    for (size_t i = 0; i < suffixes.size(); ++i) {
        sql << (i == 0 ? " " : ", ") << suffixes[i];
    }

    execute(sql.str());
}

std::vector<row_ptr> sqlite_connection::fetch_rows(const std::string& sql,
                                                   const std::vector<storage_value>& args) {
    sqlite3_stmt* stmt = prepare(sql, args);

    std::vector<row_ptr> results;
    int col_count = sqlite3_column_count(stmt);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        std::vector<std::pair<std::string, storage_value>> columns;
        columns.reserve(col_count);
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            columns.emplace_back(name ? name : "", extract_column(stmt, i));
        }
        results.push_back(std::make_unique<sqlite_row>(std::move(columns)));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        STRATA_LOG_ERROR("sqlite", "Query failed: %s", error.c_str());
        throw engine_error("Query failed: " + error);
    }

    return results;
}

void sqlite_connection::bind_value(sqlite3_stmt* stmt, int index, const storage_value& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, bool>) {
            sqlite3_bind_int64(stmt, index, v ? 1 : 0);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, timestamp_t>) {
            std::string text = format_timestamp(v);
            sqlite3_bind_text(stmt, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, blob_t>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        } else if constexpr (std::is_same_v<T, structured_text>) {
            sqlite3_bind_text(stmt, index, v.json.c_str(), static_cast<int>(v.json.size()), SQLITE_TRANSIENT);
        }
    }, value);
}

storage_value sqlite_connection::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            int size = sqlite3_column_bytes(stmt, index);
            return std::string(text ? text : "", text ? static_cast<size_t>(size) : 0);
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return bytes ? blob_t(bytes, bytes + size) : blob_t{};
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

void sqlite_connection::begin_transaction() {
    // BEGIN IMMEDIATE takes the write lock up front; busy_timeout covers contention
    int rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        STRATA_LOG_ERROR("sqlite", "Failed to begin transaction: %s", error.c_str());
        throw engine_error("Failed to begin transaction: " + error);
    }
}

void sqlite_connection::commit() {
    execute("COMMIT");
}

void sqlite_connection::rollback() {
    execute("ROLLBACK");
}

bool sqlite_connection::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active
    return sqlite3_get_autocommit(db_) == 0;
}

// ============================================================================
// transaction
// ============================================================================

transaction::transaction(sqlite_connection& conn) : conn_(conn) {
    conn_.begin_transaction();
}

transaction::~transaction() {
    if (!completed_ && conn_.is_in_transaction()) {
        try {
            conn_.rollback();
        } catch (const db_error& e) {
            STRATA_LOG_ERROR("sqlite", "Rollback failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    conn_.commit();
    completed_ = true;
}

// ============================================================================
// sqlite_queue / sqlite_factory
// ============================================================================

sqlite_queue::sqlite_queue(const configuration& config)
    : conn_(std::make_unique<sqlite_connection>(config)) {}

void sqlite_queue::read_impl(const std::function<void(connection&)>& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    body(*conn_);
}

void sqlite_queue::write_impl(const std::function<void(connection&)>& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    transaction txn(*conn_);
    body(*conn_);
    txn.commit();
}

std::shared_ptr<database_queue> sqlite_factory::make_queue(const configuration& config) {
    return std::make_shared<sqlite_queue>(config);
}

// ============================================================================
// Literals
// ============================================================================

std::string sql_literal(const storage_value& value) {
    auto quote = [](const std::string& text) {
        std::string out = "'";
        for (char c : text) {
            if (c == '\'') out += '\'';
            out += c;
        }
        out += "'";
        return out;
    };

    return std::visit([&](auto&& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream ss;
            ss.precision(17);
            ss << v;
            return ss.str();
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "1" : "0";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return quote(v);
        } else if constexpr (std::is_same_v<T, timestamp_t>) {
            return quote(format_timestamp(v));
        } else if constexpr (std::is_same_v<T, blob_t>) {
            static const char hex[] = "0123456789ABCDEF";
            std::string out = "X'";
            for (uint8_t b : v) {
                out += hex[b >> 4];
                out += hex[b & 0x0F];
            }
            out += "'";
            return out;
        } else {
            return quote(v.json);
        }
    }, value);
}

} // namespace strata
