#ifndef NBTCRAFT_LOG_HPP
#define NBTCRAFT_LOG_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace nbtcraft {

/// @brief The library's logger, named "nbtcraft".
/// Created on first use with a colored stdout sink at level `warn`. If the application has already
/// registered a logger under that name, that one is used instead.
inline std::shared_ptr<spdlog::logger>& logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get("nbtcraft"))
            return existing;
        auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        sink->set_pattern("%^[%T] [%n] [%l]%$ %v");
        auto created = std::make_shared<spdlog::logger>("nbtcraft", sink);
        created->set_level(spdlog::level::warn);
        created->flush_on(spdlog::level::warn);
        spdlog::register_logger(created);
        return created;
    }();
    return instance;
}

inline void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

/// @brief Parses a level name ("trace", "debug", "info", "warn", "error", "critical", "off").
/// Unknown names map to `off`, as spdlog does.
inline spdlog::level::level_enum parse_log_level(const std::string& name) {
    return spdlog::level::from_str(name);
}

}

#define NBTCRAFT_LOG_TRACE(...) ::nbtcraft::logger()->trace(__VA_ARGS__)
#define NBTCRAFT_LOG_DEBUG(...) ::nbtcraft::logger()->debug(__VA_ARGS__)
#define NBTCRAFT_LOG_INFO(...)  ::nbtcraft::logger()->info(__VA_ARGS__)
#define NBTCRAFT_LOG_WARN(...)  ::nbtcraft::logger()->warn(__VA_ARGS__)
#define NBTCRAFT_LOG_ERROR(...) ::nbtcraft::logger()->error(__VA_ARGS__)

#endif
