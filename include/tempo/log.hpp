#pragma once

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace tempo::log {

/// Name under which the library logger is registered with spdlog
inline constexpr const char* LOGGER_NAME = "tempo";

/**
 * @brief Library logger
 *
 * Applications that want tempo output elsewhere register their own spdlog logger
 * named "tempo" before the first parse; otherwise a stderr color logger is created
 * on first use. Its level is the one configured for "tempo" in spdlog's registry
 * (e.g. SPDLOG_LEVEL=tempo=debug via spdlog::cfg::load_env_levels()), or warn when
 * nothing was configured.
 */
inline std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        // The registry hands out the global level unless one was configured by name
        if (created->level() == spdlog::get_level()) {
            created->set_level(spdlog::level::warn);
        }
        return created;
    }();
    return instance;
}

inline void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace tempo::log
