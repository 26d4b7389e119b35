/**
 * @file logger_adapter.hpp
 * @brief Adapter for diagnostic logging using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with metaview. Library code logs through the static helpers; nothing is
 * written until the application calls initialize().
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <metaview/compat/format.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace metaview::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{false};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{10};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Use asynchronous logging
    bool async_mode{false};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};

    /// Base name of the rotating log file inside log_directory
    std::string file_name{"metaview.log"};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Process-wide logging facade over logger_system
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.min_level = log_level::debug;
 * logger_adapter::initialize(config);
 *
 * logger_adapter::debug("Decoded {} elements from {}", count, path);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    /**
     * @brief Attach the configured writers and start the logger
     *
     * A second call while initialized is ignored.
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the logger
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void fatal(compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::fatal, fmt, std::forward<Args>(args)...);
    }

    static void log(log_level level, const std::string& message);

    /**
     * @return false while the logger is not initialized
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Levels
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

    /// Upper-case name, as accepted by parse_log_level()
    [[nodiscard]] static auto log_level_to_string(log_level level) -> std::string;

    /**
     * @brief Parse a level name such as "debug", "WARN" or "warning"
     * @return The level, or nullopt for an unknown name
     */
    [[nodiscard]] static auto parse_log_level(std::string_view name)
        -> std::optional<log_level>;

private:
    /// Formats only when the level passes, so disabled calls cost one check
    template <typename... Args>
    static void emit(log_level level, compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(level)) {
            log(level, compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace metaview::integration
