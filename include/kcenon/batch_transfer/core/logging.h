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
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

// logger_system integration requires common_system
#if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define BATCH_TRANSFER_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::batch_transfer {

/**
 * @brief Log categories, one per component
 */
struct log_category {
    static constexpr std::string_view orchestrator = "batch_transfer.orchestrator";
    static constexpr std::string_view session = "batch_transfer.session";
    static constexpr std::string_view controller = "batch_transfer.controller";
    static constexpr std::string_view profile = "batch_transfer.profile";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    off = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::off: return "OFF";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name as given on a command line
 *
 * Accepts the names printed by log_level_to_string() in any case, plus
 * "warning".
 */
inline auto parse_log_level(std::string_view name) -> std::optional<log_level> {
    std::string lowered;
    lowered.reserve(name.size());
    for (char c : name) {
        lowered += (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }
    if (lowered == "trace") return log_level::trace;
    if (lowered == "debug") return log_level::debug;
    if (lowered == "info") return log_level::info;
    if (lowered == "warn" || lowered == "warning") return log_level::warn;
    if (lowered == "error") return log_level::error;
    if (lowered == "off") return log_level::off;
    return std::nullopt;
}

namespace detail {

/**
 * @brief Escape a string for embedding between JSON double quotes
 */
inline auto escape_json_string(std::string_view input) -> std::string {
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
 * @brief Run and file details attached to a log line
 *
 * Rendered as a compact JSON object after the message.
 */
struct batch_log_context {
    std::optional<uint64_t> run_id;
    std::optional<std::size_t> file_index;
    std::optional<std::size_t> total_files;
    std::string filename;
    std::optional<std::string> remote_path;
    std::optional<std::string> error_message;
    std::optional<std::string> server_address;

    [[nodiscard]] auto empty() const -> bool {
        return !run_id && !file_index && !total_files && filename.empty() && !remote_path &&
               !error_message && !server_address;
    }

    [[nodiscard]] auto to_json() const -> std::string {
        std::string out = "{";
        auto separator = [&out] {
            if (out.size() > 1) out += ',';
        };
        auto add_number = [&](const char* name, uint64_t value) {
            separator();
            out += '"';
            out += name;
            out += "\":";
            out += std::to_string(value);
        };
        auto add_text = [&](const char* name, std::string_view value) {
            separator();
            out += '"';
            out += name;
            out += "\":\"";
            out += detail::escape_json_string(value);
            out += '"';
        };

        if (run_id) add_number("run_id", *run_id);
        if (file_index) add_number("file_index", *file_index);
        if (total_files) add_number("total_files", *total_files);
        if (!filename.empty()) add_text("filename", filename);
        if (remote_path) add_text("remote_path", *remote_path);
        if (error_message) add_text("error_message", *error_message);
        if (server_address) add_text("server_address", *server_address);

        out += '}';
        return out;
    }
};

/**
 * @brief Process-wide diagnostic log of the library
 *
 * Separate from the per-run event stream delivered to observers. Lines go
 * to logger_system when it is built in, to stderr otherwise, or to a
 * callback installed with set_callback().
 */
class batch_transfer_logger {
public:
    using log_callback = std::function<void(
        log_level, std::string_view, std::string_view, const batch_log_context*)>;

    batch_transfer_logger() = default;
    ~batch_transfer_logger() = default;

    batch_transfer_logger(const batch_transfer_logger&) = delete;
    batch_transfer_logger& operator=(const batch_transfer_logger&) = delete;

    /**
     * @brief Set up the logger_system backend
     *
     * Safe to call multiple times. Called by batch_controller on construction.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef BATCH_TRANSFER_USE_LOGGER_SYSTEM
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

    void shutdown() {
#ifdef BATCH_TRANSFER_USE_LOGGER_SYSTEM
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
#ifdef BATCH_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_ && level != log_level::off) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        auto min = min_level_.load();
        return min != log_level::off && level != log_level::off &&
               static_cast<int>(level) >= static_cast<int>(min);
    }

    /**
     * @brief Route log lines to a callback instead of the backend
     *
     * Pass an empty function to restore the backend.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const batch_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
        if (!is_enabled(level)) return;

        log_callback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = callback_;
        }
        if (callback) {
            callback(level, category, message, context);
            return;
        }

        auto text = format_line(category, message, context);

#ifdef BATCH_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), text);
            }
            return;
        }
#endif
        write_stderr(level, text);
    }

    void flush() {
#ifdef BATCH_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

    /**
     * @brief Render "[category] message {context}"
     */
    [[nodiscard]] static auto format_line(std::string_view category,
                                          std::string_view message,
                                          const batch_log_context* context) -> std::string {
        std::string text;
        text.reserve(category.size() + message.size() + 4);
        text += '[';
        text += category;
        text += "] ";
        text += message;
        if (context && !context->empty()) {
            text += ' ';
            text += context->to_json();
        }
        return text;
    }

private:
    static void write_stderr(log_level level, const std::string& text) {
        auto now = std::chrono::system_clock::now();
        auto seconds = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &seconds);
#else
        localtime_r(&seconds, &tm_buf);
#endif
        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);
        char millis[8];
        std::snprintf(millis, sizeof(millis), ".%03d", static_cast<int>(ms));

        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << stamp << millis << " [" << log_level_to_string(level) << "] " << text
                  << '\n';
    }

#ifdef BATCH_TRANSFER_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            default: return kcenon::logger::log_level::critical;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;
};

inline batch_transfer_logger& get_logger() {
    static batch_transfer_logger instance;
    return instance;
}

#define BT_LOG(level, category, message) \
    kcenon::batch_transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define BT_LOG_CTX(level, category, message, context) \
    kcenon::batch_transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define BT_LOG_TRACE(category, message) \
    BT_LOG(kcenon::batch_transfer::log_level::trace, category, message)

#define BT_LOG_DEBUG(category, message) \
    BT_LOG(kcenon::batch_transfer::log_level::debug, category, message)

#define BT_LOG_INFO(category, message) \
    BT_LOG(kcenon::batch_transfer::log_level::info, category, message)

#define BT_LOG_WARN(category, message) \
    BT_LOG(kcenon::batch_transfer::log_level::warn, category, message)

#define BT_LOG_ERROR(category, message) \
    BT_LOG(kcenon::batch_transfer::log_level::error, category, message)

#define BT_LOG_DEBUG_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::batch_transfer::log_level::debug, category, message, ctx)

#define BT_LOG_INFO_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::batch_transfer::log_level::info, category, message, ctx)

#define BT_LOG_WARN_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::batch_transfer::log_level::warn, category, message, ctx)

#define BT_LOG_ERROR_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::batch_transfer::log_level::error, category, message, ctx)

}  // namespace kcenon::batch_transfer
