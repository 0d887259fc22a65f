#ifndef VEXEL_LOG_HPP_
#define VEXEL_LOG_HPP_

#include <vexel/vexel_export.h>

#include <functional>
#include <string>
#include <string_view>

namespace vexel {

// ============================================================================
// Logging
// ============================================================================

enum class log_level {
    debug,
    info,
    warn,
    error,
    off
};

[[nodiscard]] VEXEL_EXPORT const char* to_string(log_level level) noexcept;

using log_handler = std::function<void(log_level, std::string_view)>;

/**
 * Replace the process-wide log handler.
 * Passing an empty handler restores the default stderr handler.
 */
VEXEL_EXPORT void set_log_handler(log_handler handler);

/**
 * Messages below this level are discarded before reaching the handler.
 * Default is warn.
 */
VEXEL_EXPORT void set_log_level(log_level level) noexcept;
[[nodiscard]] VEXEL_EXPORT log_level get_log_level() noexcept;

VEXEL_EXPORT void log(log_level level, std::string_view message);

[[nodiscard]] inline bool log_enabled(log_level level) noexcept {
    return level >= get_log_level() && level != log_level::off;
}

inline void log_debug(std::string_view message) { log(log_level::debug, message); }
inline void log_info(std::string_view message) { log(log_level::info, message); }
inline void log_warn(std::string_view message) { log(log_level::warn, message); }
inline void log_error(std::string_view message) { log(log_level::error, message); }

} // namespace vexel

#endif // VEXEL_LOG_HPP_
