#include "strata/engine.hpp"
#include "strata/errors.hpp"
#include "strata/log.hpp"
#include "strata/sqlite_engine.hpp"

namespace strata {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::off};

engine_registry& engine_registry::instance() {
    static engine_registry registry;
    return registry;
}

void engine_registry::set_factory(std::shared_ptr<database_factory> factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    factory_ = std::move(factory);
}

std::shared_ptr<database_factory> engine_registry::factory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!factory_) {
        throw engine_unavailable_error();
    }
    return factory_;
}

bool engine_registry::has_factory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factory_ != nullptr;
}

void engine_registry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    factory_.reset();
}

void init() {
    init(std::make_shared<sqlite_factory>());
}

void init(std::shared_ptr<database_factory> factory) {
    STRATA_LOG_DEBUG("strata", "Registering default database factory");
    engine_registry::instance().set_factory(std::move(factory));
}

void shutdown() {
    STRATA_LOG_DEBUG("strata", "Clearing default database factory");
    engine_registry::instance().reset();
}

} // namespace strata
