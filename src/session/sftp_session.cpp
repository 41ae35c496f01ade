/**
 * @file sftp_session.cpp
 * @brief libssh2-backed SFTP session
 */

#include "kcenon/batch_transfer/session/sftp_session.h"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <mutex>
#include <vector>

#include "kcenon/batch_transfer/core/logging.h"

namespace kcenon::batch_transfer {

namespace {

// libssh2_init() is process-wide; libssh2_exit() is left to process exit.
auto ensure_libssh2() -> result<void> {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] { rc = libssh2_init(0); });
    if (rc != 0) {
        return unexpected{error{error_code::internal_error,
                                "libssh2_init failed (" + std::to_string(rc) + ")"}};
    }
    return {};
}

auto session_error(LIBSSH2_SESSION* session) -> std::string {
    char* msg = nullptr;
    int len = 0;
    int rc = libssh2_session_last_error(session, &msg, &len, 0);
    if (msg == nullptr || len == 0) {
        return "libssh2 error " + std::to_string(rc);
    }
    return std::string(msg, static_cast<std::size_t>(len));
}

auto tcp_connect(const std::string& host, uint16_t port) -> result<int> {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* found = nullptr;
    auto service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &found);
    if (rc != 0) {
        return unexpected{error{error_code::connect_failed,
                                "Cannot resolve " + host + ": " + gai_strerror(rc)}};
    }

    std::string last_error = "no addresses";
    int sock = -1;
    for (auto* ai = found; ai != nullptr; ai = ai->ai_next) {
        sock = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        if (::connect(sock, ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }
        last_error = std::strerror(errno);
        ::close(sock);
        sock = -1;
    }
    ::freeaddrinfo(found);

    if (sock < 0) {
        return unexpected{error{error_code::connect_failed,
                                "Cannot connect to " + host + ":" + service + ": " +
                                    last_error}};
    }
    return sock;
}

// Releases a partially built connection on failure paths.
void discard(int sock, LIBSSH2_SESSION* session, LIBSSH2_SFTP* sftp) {
    if (sftp != nullptr) {
        libssh2_sftp_shutdown(sftp);
    }
    if (session != nullptr) {
        libssh2_session_disconnect(session, "connection aborted");
        libssh2_session_free(session);
    }
    if (sock >= 0) {
        ::close(sock);
    }
}

auto authenticate(LIBSSH2_SESSION* session, const session_options& options) -> result<void> {
    int rc = 0;
    if (options.auth == auth_method::private_key) {
        const auto key = options.key_path.string();
        rc = libssh2_userauth_publickey_fromfile(
            session, options.username.c_str(), nullptr, key.c_str(),
            options.key_passphrase.empty() ? nullptr : options.key_passphrase.c_str());
    } else {
        rc = libssh2_userauth_password(session, options.username.c_str(),
                                       options.password.c_str());
    }
    if (rc != 0) {
        return unexpected{error{error_code::authentication_failed,
                                "Authentication failed: " + session_error(session)}};
    }
    return {};
}

auto fingerprint_hex(LIBSSH2_SESSION* session) -> std::string {
    const char* hash = libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (hash == nullptr) {
        return "unavailable";
    }
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    for (int i = 0; i < 32; ++i) {
        auto byte = static_cast<unsigned char>(hash[i]);
        if (i > 0) {
            out += ':';
        }
        out += digits[byte >> 4];
        out += digits[byte & 0x0F];
    }
    return out;
}

}  // namespace

// ============================================================================
// sftp_session
// ============================================================================

sftp_session::sftp_session(int sock, LIBSSH2_SESSION* session, LIBSSH2_SFTP* sftp,
                           sftp_config config)
    : sock_(sock), session_(session), sftp_(sftp), config_(config) {}

sftp_session::~sftp_session() {
    auto closed = close();
    if (!closed.has_value()) {
        BT_LOG_DEBUG(log_category::session,
                     "Ignoring close error in destructor: " + closed.error().message);
    }
}

auto sftp_session::is_active() -> bool {
    if (sock_ < 0 || session_ == nullptr || sftp_ == nullptr) {
        return false;
    }

    // A readable socket with zero bytes pending means the peer closed it.
    char probe = 0;
    auto peeked = ::recv(sock_, &probe, 1, MSG_PEEK | MSG_DONTWAIT);
    if (peeked == 0) {
        return false;
    }
    if (peeked < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
        return false;
    }

    int next = 0;
    return libssh2_keepalive_send(session_, &next) == 0;
}

auto sftp_session::upload(const std::filesystem::path& local_path,
                          const std::string& remote_path) -> result<void> {
    if (sftp_ == nullptr) {
        return unexpected{error{error_code::session_closed, "Session is closed"}};
    }

    std::ifstream input(local_path, std::ios::binary);
    if (!input) {
        return unexpected{error{error_code::file_read_error,
                                "Cannot open " + local_path.string()}};
    }

    LIBSSH2_SFTP_HANDLE* handle = libssh2_sftp_open_ex(
        sftp_, remote_path.c_str(), static_cast<unsigned int>(remote_path.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR | LIBSSH2_SFTP_S_IRGRP |
            LIBSSH2_SFTP_S_IROTH,
        LIBSSH2_SFTP_OPENFILE);
    if (handle == nullptr) {
        return unexpected{error{error_code::upload_failed,
                                "Cannot open remote file " + remote_path + ": " +
                                    last_error()}};
    }

    std::vector<char> buffer(config_.block_size);
    result<void> outcome;
    uint64_t total = 0;
    while (outcome.has_value()) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = input.gcount();
        if (got <= 0) {
            if (input.bad()) {
                outcome = unexpected{error{error_code::file_read_error,
                                           "Read error on " + local_path.string()}};
            }
            break;
        }

        const char* cursor = buffer.data();
        auto remaining = static_cast<std::size_t>(got);
        while (remaining > 0) {
            auto written = libssh2_sftp_write(handle, cursor, remaining);
            if (written < 0) {
                outcome = unexpected{error{error_code::upload_failed,
                                           "Write failed on " + remote_path + ": " +
                                               last_error()}};
                break;
            }
            cursor += written;
            remaining -= static_cast<std::size_t>(written);
            total += static_cast<uint64_t>(written);
        }
    }

    if (libssh2_sftp_close_handle(handle) != 0 && outcome.has_value()) {
        outcome = unexpected{error{error_code::upload_failed,
                                   "Closing " + remote_path + " failed: " + last_error()}};
    }

    if (outcome.has_value()) {
        batch_log_context ctx;
        ctx.filename = local_path.filename().string();
        ctx.remote_path = remote_path;
        BT_LOG_DEBUG_CTX(log_category::session,
                         "Uploaded " + std::to_string(total) + " bytes", ctx);
    }
    return outcome;
}

auto sftp_session::home_directory() -> result<std::string> {
    if (sftp_ == nullptr) {
        return unexpected{error{error_code::session_closed, "Session is closed"}};
    }
    std::vector<char> buffer(4096);
    int len = libssh2_sftp_realpath(sftp_, ".", buffer.data(),
                                    static_cast<unsigned int>(buffer.size()));
    if (len < 0) {
        return unexpected{error{error_code::connection_lost,
                                "realpath failed: " + last_error()}};
    }
    return std::string(buffer.data(), static_cast<std::size_t>(len));
}

auto sftp_session::close() -> result<void> {
    result<void> outcome;

    if (sftp_ != nullptr) {
        if (libssh2_sftp_shutdown(sftp_) != 0) {
            outcome = unexpected{error{error_code::session_closed,
                                       "SFTP shutdown failed: " + last_error()}};
        }
        sftp_ = nullptr;
    }
    if (session_ != nullptr) {
        if (libssh2_session_disconnect(session_, "normal shutdown") != 0 &&
            outcome.has_value()) {
            outcome = unexpected{error{error_code::session_closed,
                                       "Disconnect failed: " + last_error()}};
        }
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ >= 0) {
        ::close(sock_);
        sock_ = -1;
    }
    return outcome;
}

auto sftp_session::last_error() const -> std::string {
    if (session_ == nullptr) {
        return "session closed";
    }
    return session_error(session_);
}

// ============================================================================
// sftp_connector
// ============================================================================

sftp_connector::sftp_connector(sftp_config config) : config_(config) {}

auto sftp_connector::connect(const session_options& options)
    -> result<std::unique_ptr<remote_session>> {
    auto ready = ensure_libssh2();
    if (!ready.has_value()) {
        return unexpected{ready.error()};
    }

    batch_log_context ctx;
    ctx.server_address = options.endpoint_string();

    auto sock = tcp_connect(options.host, options.port);
    if (!sock.has_value()) {
        ctx.error_message = sock.error().message;
        BT_LOG_WARN_CTX(log_category::session, "TCP connect failed", ctx);
        return unexpected{sock.error()};
    }

    LIBSSH2_SESSION* session = libssh2_session_init();
    if (session == nullptr) {
        discard(sock.value(), nullptr, nullptr);
        return unexpected{error{error_code::internal_error, "libssh2_session_init failed"}};
    }
    libssh2_session_set_blocking(session, 1);
    libssh2_session_set_timeout(session, static_cast<long>(config_.timeout.count()));

    if (libssh2_session_handshake(session, sock.value()) != 0) {
        auto message = "SSH handshake failed: " + session_error(session);
        discard(sock.value(), session, nullptr);
        return unexpected{error{error_code::connect_failed, message}};
    }
    BT_LOG_DEBUG_CTX(log_category::session,
                     "Host key SHA256 " + fingerprint_hex(session), ctx);

    auto authed = authenticate(session, options);
    if (!authed.has_value()) {
        discard(sock.value(), session, nullptr);
        return unexpected{authed.error()};
    }

    LIBSSH2_SFTP* sftp = libssh2_sftp_init(session);
    if (sftp == nullptr) {
        auto message = "SFTP subsystem unavailable: " + session_error(session);
        discard(sock.value(), session, nullptr);
        return unexpected{error{error_code::connect_failed, message}};
    }

    if (config_.keepalive_interval_seconds > 0) {
        libssh2_keepalive_config(session, 1,
                                 static_cast<unsigned>(config_.keepalive_interval_seconds));
    }

    BT_LOG_INFO_CTX(log_category::session, "SFTP session established", ctx);
    return std::unique_ptr<remote_session>(
        new sftp_session(sock.value(), session, sftp, config_));
}

}  // namespace kcenon::batch_transfer
