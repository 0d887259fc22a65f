#include <vexel/log.hpp>

#include <atomic>
#include <iostream>
#include <mutex>

namespace vexel {

namespace {

std::atomic<log_level> g_level{log_level::warn};

std::mutex& handler_mutex() {
    static std::mutex m;
    return m;
}

log_handler& current_handler() {
    static log_handler handler;
    return handler;
}

void default_handler(log_level level, std::string_view message) {
    std::cerr << "[vexel] " << to_string(level) << " " << message << "\n";
}

} // namespace

const char* to_string(log_level level) noexcept {
    switch (level) {
        case log_level::debug: return "DEBUG";
        case log_level::info:  return "INFO";
        case log_level::warn:  return "WARN";
        case log_level::error: return "ERROR";
        case log_level::off:   return "OFF";
    }
    return "UNKNOWN";
}

void set_log_handler(log_handler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex());
    current_handler() = std::move(handler);
}

void set_log_level(log_level level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

log_level get_log_level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

void log(log_level level, std::string_view message) {
    if (!log_enabled(level)) {
        return;
    }

    // Invoked outside the lock so a handler may log or replace itself
    log_handler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex());
        handler = current_handler();
    }
    if (handler) {
        handler(level, message);
    } else {
        default_handler(level, message);
    }
}

} // namespace vexel
