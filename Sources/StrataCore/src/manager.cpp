#include "strata/manager.hpp"

namespace strata {

database_manager::database_manager(std::shared_ptr<database_queue> queue)
    : queue_(std::move(queue)) {
    if (!queue_) {
        throw engine_unavailable_error();
    }
}

database_manager::database_manager(const configuration& config) {
    if (config.logging != log_level::off) {
        set_log_level(config.logging);
    }
    queue_ = engine_registry::instance().factory()->make_queue(config);
    STRATA_LOG_DEBUG("manager", "Opened queue for %s", config.path.c_str());
}

bool database_manager::table_exists(const std::string& name) {
    return queue_->read([&](connection& conn) {
        return conn.table_exists(name);
    });
}

void database_manager::create_table(const table_definition& definition) {
    queue_->write([&](connection& conn) {
        const auto& options = definition.options();
        if (!options.if_not_exists && conn.table_exists(definition.name())) {
            throw schema_conflict_error(definition.name());
        }
        STRATA_LOG_DEBUG("manager", "create table %s (%zu columns)",
                         definition.name().c_str(), definition.columns().size());
        conn.create_table(definition.name(), options, [&](table_builder& builder) {
            for (const auto& column : definition.columns()) {
                builder.column(column);
            }
        });
    });
}

void database_manager::write(const query& q) {
    auto compiled = q.build();
    if (compiled.sql.empty()) {
        // Empty batch
        return;
    }
    write(compiled.sql, compiled.args);
}

void database_manager::write(const std::string& sql, const std::vector<storage_value>& args) {
    STRATA_LOG_DEBUG("manager", "write: %s", sql.c_str());
    queue_->write([&](connection& conn) {
        conn.execute(sql, args);
    });
}

std::vector<row_ptr> database_manager::debug_fetch_rows(const std::string& sql,
                                                        const std::vector<storage_value>& args) {
    STRATA_LOG_DEBUG("manager", "debug fetch: %s", sql.c_str());
    return queue_->read([&](connection& conn) {
        return conn.fetch_rows(sql, args);
    });
}

} // namespace strata
