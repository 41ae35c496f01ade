/**
 * @file sftp_session.h
 * @brief SFTP implementation of remote_session on top of libssh2
 *
 * Available when built with BATCH_TRANSFER_ENABLE_SFTP.
 */

#ifndef KCENON_BATCH_TRANSFER_SESSION_SFTP_SESSION_H
#define KCENON_BATCH_TRANSFER_SESSION_SFTP_SESSION_H

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include "kcenon/batch_transfer/session/remote_session.h"

// libssh2 handle types, kept out of the public include graph
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace kcenon::batch_transfer {

/**
 * @brief Tunables for SFTP sessions
 */
struct sftp_config {
    std::chrono::milliseconds timeout{30000};  ///< Blocking libssh2 call timeout
    std::size_t block_size = 32 * 1024;        ///< Upload write size
    int keepalive_interval_seconds = 15;       ///< SSH keepalive period
};

/**
 * @brief One authenticated SSH connection with an SFTP channel
 *
 * Created by sftp_connector. Not thread-safe: owned by a single run.
 */
class sftp_session : public remote_session {
public:
    ~sftp_session() override;

    sftp_session(const sftp_session&) = delete;
    auto operator=(const sftp_session&) -> sftp_session& = delete;

    /**
     * @brief Checks the socket and sends an SSH keepalive
     */
    [[nodiscard]] auto is_active() -> bool override;

    [[nodiscard]] auto upload(const std::filesystem::path& local_path,
                              const std::string& remote_path) -> result<void> override;

    /**
     * @brief Resolves "." on the server
     */
    [[nodiscard]] auto home_directory() -> result<std::string> override;

    auto close() -> result<void> override;

private:
    friend class sftp_connector;

    sftp_session(int sock, _LIBSSH2_SESSION* session, _LIBSSH2_SFTP* sftp,
                 sftp_config config);

    [[nodiscard]] auto last_error() const -> std::string;

    int sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr;
    _LIBSSH2_SFTP* sftp_ = nullptr;
    sftp_config config_;
};

/**
 * @brief Opens sftp_session instances
 *
 * Host keys are accepted without verification; the fingerprint is logged at
 * debug level.
 */
class sftp_connector : public session_connector {
public:
    explicit sftp_connector(sftp_config config = {});

    [[nodiscard]] auto connect(const session_options& options)
        -> result<std::unique_ptr<remote_session>> override;

private:
    sftp_config config_;
};

}  // namespace kcenon::batch_transfer

#endif  // KCENON_BATCH_TRANSFER_SESSION_SFTP_SESSION_H
