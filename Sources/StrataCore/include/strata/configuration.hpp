#pragma once

#ifdef __cplusplus

#include "log.hpp"
#include <string>

namespace strata {

struct configuration {
    /// Database file path. Use ":memory:" for in-memory database.
    std::string path = ":memory:";

    /// Read-only mode. When true:
    /// - Database is opened with SQLITE_OPEN_READONLY
    /// - No journal mode change
    /// - write() and create_table() fail in the engine
    bool read_only = false;

    /// How long a statement waits on a locked database before failing.
    int busy_timeout_ms = 5000;

    /// Journal mode for file databases (ignored for ":memory:").
    std::string journal_mode = "WAL";

    bool foreign_keys = true;

    /// Applied by database_manager when not off.
    log_level logging = log_level::off;
};

} // namespace strata

#endif // __cplusplus
