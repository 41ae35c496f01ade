/**
 * @file types.h
 * @brief Core type definitions for batch_transfer
 */

#ifndef KCENON_BATCH_TRANSFER_CORE_TYPES_H
#define KCENON_BATCH_TRANSFER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::batch_transfer {

/**
 * @brief Error codes for batch transfer operations
 */
enum class error_code {
    success = 0,

    // File errors (-100 to -119)
    file_not_found = -100,
    file_access_denied = -101,
    file_read_error = -105,
    file_write_error = -106,

    // Configuration errors (-140 to -159)
    invalid_configuration = -141,
    invalid_request = -142,

    // Session errors (-160 to -179)
    connect_failed = -160,
    connection_timeout = -161,
    authentication_failed = -162,
    connection_lost = -163,
    session_closed = -164,
    upload_failed = -165,

    // Run control errors (-180 to -199)
    unknown_run = -180,
    no_pending_checkpoint = -181,
    run_already_finished = -182,
    wait_timeout = -183,

    // Profile errors (-200 to -219)
    profile_not_found = -200,
    profile_parse_error = -201,

    // Internal errors (-220 to -239)
    internal_error = -220,
    not_initialized = -221,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_request:
            return "invalid request";
        case error_code::connect_failed:
            return "connect failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::authentication_failed:
            return "authentication failed";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::session_closed:
            return "session closed";
        case error_code::upload_failed:
            return "upload failed";
        case error_code::unknown_run:
            return "unknown run";
        case error_code::no_pending_checkpoint:
            return "no pending checkpoint";
        case error_code::run_already_finished:
            return "run already finished";
        case error_code::wait_timeout:
            return "wait timeout";
        case error_code::profile_not_found:
            return "profile not found";
        case error_code::profile_parse_error:
            return "profile parse error";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::batch_transfer

#endif  // KCENON_BATCH_TRANSFER_CORE_TYPES_H
