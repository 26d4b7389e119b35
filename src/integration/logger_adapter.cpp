/**
 * @file logger_adapter.cpp
 * @brief Implementation of the logging adapter
 */

#include <metaview/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <mutex>

namespace metaview::integration {

namespace {

struct level_entry {
    log_level level;
    kcenon::logger::log_level backend;
    std::string_view name;
};

// Ordered by severity; the last entry doubles as the fallback
constexpr std::array level_table{
    level_entry{log_level::trace, kcenon::logger::log_level::trace, "TRACE"},
    level_entry{log_level::debug, kcenon::logger::log_level::debug, "DEBUG"},
    level_entry{log_level::info, kcenon::logger::log_level::info, "INFO"},
    level_entry{log_level::warn, kcenon::logger::log_level::warn, "WARN"},
    level_entry{log_level::error, kcenon::logger::log_level::error, "ERROR"},
    level_entry{log_level::fatal, kcenon::logger::log_level::fatal, "FATAL"},
    level_entry{log_level::off, kcenon::logger::log_level::off, "OFF"},
};

auto entry_for(log_level level) -> const level_entry& {
    const auto it = std::find_if(level_table.begin(), level_table.end(),
                                 [level](const level_entry& e) { return e.level == level; });
    return it == level_table.end() ? level_table.back() : *it;
}

}  // namespace

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);
        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        logger_ = std::make_unique<kcenon::logger::logger>(config.async_mode,
                                                           config.buffer_size);
        logger_->set_min_level(entry_for(config.min_level).backend);
        attach_writers();

        logger_->start();
        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);
        if (!initialized_) {
            return;
        }

        logger_->flush();
        logger_->stop();
        logger_.reset();
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool { return initialized_.load(); }

    void log(log_level level, const std::string& message) {
        std::lock_guard lock(mutex_);
        if (logger_ && is_level_enabled(level)) {
            logger_->log(entry_for(level).backend, message);
        }
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return initialized_.load() && level != log_level::off &&
               static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        std::lock_guard lock(mutex_);
        if (logger_) {
            logger_->flush();
        }
    }

    void set_min_level(log_level level) {
        std::lock_guard lock(mutex_);
        min_level_.store(level);
        config_.min_level = level;
        if (logger_) {
            logger_->set_min_level(entry_for(level).backend);
        }
    }

    [[nodiscard]] auto min_level() const noexcept -> log_level { return min_level_.load(); }

    [[nodiscard]] auto config() const -> const logger_config& { return config_; }

private:
    // Caller holds mutex_
    void attach_writers() {
        if (config_.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }
        if (config_.enable_file) {
            std::filesystem::create_directories(config_.log_directory);
            logger_->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                (config_.log_directory / config_.file_name).string(),
                config_.max_file_size_mb * 1024 * 1024, config_.max_files));
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
    logger_config config_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    std::mutex mutex_;
};

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Static Interface
// =============================================================================

void logger_adapter::initialize(const logger_config& config) { pimpl_->initialize(config); }

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool { return pimpl_->is_initialized(); }

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

void logger_adapter::set_min_level(log_level level) { pimpl_->set_min_level(level); }

auto logger_adapter::get_min_level() noexcept -> log_level { return pimpl_->min_level(); }

auto logger_adapter::get_config() -> const logger_config& { return pimpl_->config(); }

// =============================================================================
// Level Names
// =============================================================================

auto logger_adapter::log_level_to_string(log_level level) -> std::string {
    return std::string{entry_for(level).name};
}

auto logger_adapter::parse_log_level(std::string_view name) -> std::optional<log_level> {
    std::string upper{name};
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "WARNING") {
        return log_level::warn;
    }

    const auto it = std::find_if(level_table.begin(), level_table.end(),
                                 [&upper](const level_entry& e) { return e.name == upper; });
    if (it == level_table.end()) {
        return std::nullopt;
    }
    return it->level;
}

}  // namespace metaview::integration
