// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"

#if FILE_RIPPER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::file_ripper {

/**
 * @brief Log categories for the transfer engine
 */
struct log_category {
    static constexpr std::string_view engine = "file_ripper.engine";
    static constexpr std::string_view scan = "file_ripper.scan";
    static constexpr std::string_view worker = "file_ripper.worker";
    static constexpr std::string_view transfer = "file_ripper.transfer";
    static constexpr std::string_view multipart = "file_ripper.multipart";
    static constexpr std::string_view monitor = "file_ripper.monitor";
    static constexpr std::string_view transport = "file_ripper.transport";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

inline auto escape_json(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured context attached to a log record
 *
 * Every field is optional; only the populated ones are rendered.
 */
struct transfer_log_context {
    std::string path;
    std::optional<std::string> direction;
    std::optional<std::size_t> worker_id;
    std::optional<std::size_t> session_index;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> bytes;
    std::optional<std::size_t> range_index;
    std::optional<double> rate_mbs;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    /**
     * @brief Render the populated fields as a JSON object
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto separator = [&]() {
            if (!first) oss << ",";
            first = false;
        };
        auto add_string = [&](const char* name, std::string_view value) {
            separator();
            oss << "\"" << name << "\":\"" << detail::escape_json(value) << "\"";
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            separator();
            oss << "\"" << name << "\":" << value;
        };

        if (!path.empty()) add_string("path", path);
        if (direction) add_string("direction", *direction);
        if (worker_id) add_uint("worker_id", *worker_id);
        if (session_index) add_uint("session_index", *session_index);
        if (attempt) add_uint("attempt", *attempt);
        if (bytes) add_uint("bytes", *bytes);
        if (range_index) add_uint("range_index", *range_index);
        if (rate_mbs) {
            separator();
            oss << std::fixed << std::setprecision(2) << "\"rate_mbs\":" << *rate_mbs;
        }
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) add_string("error_message", *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Human readable line
    json    ///< One JSON object per record
};

class file_ripper_logger;

/**
 * @brief Global logger accessor
 */
file_ripper_logger& get_logger();

/**
 * @brief Logging front end for the transfer engine
 *
 * Records go to kcenon logger_system when it is built in, otherwise to
 * stderr. A callback can observe every accepted record regardless of the
 * backend, which is what the unit tests hook into.
 */
class file_ripper_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;

    file_ripper_logger() = default;
    ~file_ripper_logger() = default;

    file_ripper_logger(const file_ripper_logger&) = delete;
    file_ripper_logger& operator=(const file_ripper_logger&) = delete;

    /**
     * @brief Initialize the backend
     *
     * Safe to call multiple times. The engine calls it on construction.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if FILE_RIPPER_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    /**
     * @brief Flush and release the backend
     */
    void shutdown() {
#if FILE_RIPPER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if FILE_RIPPER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    /**
     * @brief Install a callback that sees every record above the level
     *
     * Pass an empty function to remove it.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        std::string record = get_output_format() == log_output_format::json
            ? format_json(level, category, message, context)
            : format_text(category, message, context);

#if FILE_RIPPER_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), record, file, line, function);
            } else {
                logger_->log(to_logger_level(level), record);
            }
            return;
        }
#endif
        if (get_output_format() == log_output_format::text) {
            record = get_timestamp() + " [" + std::string(log_level_to_string(level)) + "] " + record;
        }
        output_to_stderr(record);
    }

    void flush() {
#if FILE_RIPPER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static auto format_text(std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        return oss.str();
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_iso8601_timestamp() << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\"" << detail::escape_json(message) << "\"";
        if (context) {
            auto ctx_json = context->to_json();
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }
        oss << "}";
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if FILE_RIPPER_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline file_ripper_logger& get_logger() {
    static file_ripper_logger instance;
    return instance;
}

// Logging macros for convenience
#define FR_LOG(level, category, message) \
    kcenon::file_ripper::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define FR_LOG_CTX(level, category, message, context) \
    kcenon::file_ripper::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define FR_LOG_TRACE(category, message) \
    FR_LOG(kcenon::file_ripper::log_level::trace, category, message)

#define FR_LOG_DEBUG(category, message) \
    FR_LOG(kcenon::file_ripper::log_level::debug, category, message)

#define FR_LOG_INFO(category, message) \
    FR_LOG(kcenon::file_ripper::log_level::info, category, message)

#define FR_LOG_WARN(category, message) \
    FR_LOG(kcenon::file_ripper::log_level::warn, category, message)

#define FR_LOG_ERROR(category, message) \
    FR_LOG(kcenon::file_ripper::log_level::error, category, message)

#define FR_LOG_DEBUG_CTX(category, message, ctx) \
    FR_LOG_CTX(kcenon::file_ripper::log_level::debug, category, message, ctx)

#define FR_LOG_INFO_CTX(category, message, ctx) \
    FR_LOG_CTX(kcenon::file_ripper::log_level::info, category, message, ctx)

#define FR_LOG_WARN_CTX(category, message, ctx) \
    FR_LOG_CTX(kcenon::file_ripper::log_level::warn, category, message, ctx)

#define FR_LOG_ERROR_CTX(category, message, ctx) \
    FR_LOG_CTX(kcenon::file_ripper::log_level::error, category, message, ctx)

}  // namespace kcenon::file_ripper
