#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "schema.hpp"
#include "configuration.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace strata {

// One result row, addressable by column name
class row {
public:
    virtual ~row() = default;

    /// std::nullopt when the row has no such column; a present column
    /// holding NULL yields storage_value{nullptr}.
    virtual std::optional<storage_value> get(const std::string& column) const = 0;

    /// Column names in result order.
    virtual std::vector<std::string> column_names() const = 0;
};

using row_ptr = std::unique_ptr<row>;

// Receives column definitions during connection::create_table
class table_builder {
public:
    virtual ~table_builder() = default;
    virtual void column(const column_def& column) = 0;
};

// Engine connection
class connection {
public:
    virtual ~connection() = default;

    virtual void execute(const std::string& sql, const std::vector<storage_value>& args = {}) = 0;
    virtual bool table_exists(const std::string& name) = 0;
    virtual void create_table(const std::string& name,
                              const table_options& options,
                              const std::function<void(table_builder&)>& columns) = 0;
    virtual std::vector<row_ptr> fetch_rows(const std::string& sql,
                                            const std::vector<storage_value>& args = {}) = 0;
};

// Engine queue/session. Bodies run synchronously; the implementation
// decides how reads and writes are serialized.
class database_queue {
public:
    virtual ~database_queue() = default;

    template<typename F>
    auto read(F&& body) -> std::invoke_result_t<F&, connection&> {
        return run(std::forward<F>(body), false);
    }

    template<typename F>
    auto write(F&& body) -> std::invoke_result_t<F&, connection&> {
        return run(std::forward<F>(body), true);
    }

protected:
    virtual void read_impl(const std::function<void(connection&)>& body) = 0;
    virtual void write_impl(const std::function<void(connection&)>& body) = 0;

private:
    void dispatch(const std::function<void(connection&)>& fn, bool is_write) {
        if (is_write) {
            write_impl(fn);
        } else {
            read_impl(fn);
        }
    }

    template<typename F>
    auto run(F&& body, bool is_write) -> std::invoke_result_t<F&, connection&> {
        using R = std::invoke_result_t<F&, connection&>;
        if constexpr (std::is_void_v<R>) {
            dispatch([&body](connection& conn) { body(conn); }, is_write);
        } else {
            std::optional<R> result;
            dispatch([&body, &result](connection& conn) { result.emplace(body(conn)); }, is_write);
            return std::move(*result);
        }
    }
};

// Creates queues for a configuration
class database_factory {
public:
    virtual ~database_factory() = default;
    virtual std::shared_ptr<database_queue> make_queue(const configuration& config) = 0;
};

// Process-wide default factory (single guarded slot)
class engine_registry {
public:
    static engine_registry& instance();

    void set_factory(std::shared_ptr<database_factory> factory);

    /// Throws engine_unavailable_error when no factory is registered.
    std::shared_ptr<database_factory> factory() const;

    bool has_factory() const;
    void reset();

private:
    engine_registry() = default;

    mutable std::mutex mutex_;
    std::shared_ptr<database_factory> factory_;
};

/// Register the SQLite factory as the process default.
void init();

/// Register a custom factory as the process default.
void init(std::shared_ptr<database_factory> factory);

/// Clear the process default factory.
void shutdown();

} // namespace strata

#endif // __cplusplus
