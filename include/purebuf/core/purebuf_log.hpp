#pragma once

#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace Purebuf {

/**
 * @brief Name of the spdlog logger used by the codec.
 */
inline constexpr const char* LoggerName = "purebuf";

/**
 * @brief Returns the codec logger, creating it on first use.
 *
 * The logger writes to stderr and starts at the warn level, so decoding stays
 * silent unless the application lowers it. An application that registers its
 * own logger named "purebuf" before first use gets that one instead.
 */
[[nodiscard]] inline const std::shared_ptr<spdlog::logger>& Logger() {
    static const std::shared_ptr<spdlog::logger> logger = [] {
        if (auto existing = spdlog::get(LoggerName)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(LoggerName);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return logger;
}

inline void SetLogLevel(spdlog::level::level_enum level) {
    Logger()->set_level(level);
}

}  // namespace Purebuf
