/**
 * @file remote_session.h
 * @brief Remote file session contract consumed by the orchestrator
 */

#ifndef KCENON_BATCH_TRANSFER_SESSION_REMOTE_SESSION_H
#define KCENON_BATCH_TRANSFER_SESSION_REMOTE_SESSION_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "kcenon/batch_transfer/core/types.h"

namespace kcenon::batch_transfer {

/**
 * @brief Authentication method for a session
 */
enum class auth_method {
    password,
    private_key
};

[[nodiscard]] constexpr auto to_string(auth_method method) noexcept -> const char* {
    switch (method) {
        case auth_method::password: return "password";
        case auth_method::private_key: return "key";
        default: return "unknown";
    }
}

/**
 * @brief Connection settings for one remote session
 */
struct session_options {
    std::string host;
    uint16_t port = 22;
    std::string username;
    auth_method auth = auth_method::password;
    std::string password;
    std::filesystem::path key_path;
    std::string key_passphrase;
    std::string remote_dir;

    [[nodiscard]] auto endpoint_string() const -> std::string {
        return host + ":" + std::to_string(port);
    }
};

/**
 * @brief An authenticated connection able to upload files
 *
 * A session is owned by exactly one run and used from that run's execution
 * context only.
 */
class remote_session {
public:
    virtual ~remote_session() = default;

    /**
     * @brief Report whether the underlying transport is still usable
     */
    [[nodiscard]] virtual auto is_active() -> bool = 0;

    /**
     * @brief Upload a local file, overwriting any remote file of the same name
     */
    [[nodiscard]] virtual auto upload(const std::filesystem::path& local_path,
                                      const std::string& remote_path) -> result<void> = 0;

    /**
     * @brief Resolve the session's default remote directory
     */
    [[nodiscard]] virtual auto home_directory() -> result<std::string> = 0;

    /**
     * @brief Close the session; calling it twice is harmless
     */
    virtual auto close() -> result<void> = 0;
};

/**
 * @brief Opens remote sessions
 */
class session_connector {
public:
    virtual ~session_connector() = default;

    [[nodiscard]] virtual auto connect(const session_options& options)
        -> result<std::unique_ptr<remote_session>> = 0;
};

/**
 * @brief Connect, report the remote home directory and close again
 *
 * Used to test a set of connection settings without starting a batch.
 */
[[nodiscard]] auto probe_connection(session_connector& connector,
                                    const session_options& options) -> result<std::string>;

}  // namespace kcenon::batch_transfer

#endif  // KCENON_BATCH_TRANSFER_SESSION_REMOTE_SESSION_H
