/**
 * @file profile_store.h
 * @brief Named connection profiles persisted as JSON
 */

#ifndef KCENON_BATCH_TRANSFER_PROFILE_PROFILE_STORE_H
#define KCENON_BATCH_TRANSFER_PROFILE_PROFILE_STORE_H

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "kcenon/batch_transfer/core/types.h"
#include "kcenon/batch_transfer/session/remote_session.h"

namespace kcenon::batch_transfer {

/**
 * @brief Saved connection settings keyed by name
 *
 * The store is an in-memory copy of one JSON file; nothing touches the disk
 * except load() and save(). Profiles keep the order they were first added
 * in. File layout:
 *
 * @code
 * {
 *   "default": "staging",
 *   "profiles": {
 *     "staging": {"host": "...", "port": 22, "username": "...",
 *                 "auth": "password", "password": "...",
 *                 "key_path": "", "remote_dir": "/upload"}
 *   }
 * }
 * @endcode
 *
 * A "presets" object is accepted in place of "profiles" when loading.
 *
 * @note Thread-safe.
 */
class profile_store {
public:
    explicit profile_store(std::filesystem::path file);

    /**
     * @brief Default location: $HOME/.batch_transfer/profiles.json
     */
    [[nodiscard]] static auto default_path() -> std::filesystem::path;

    /**
     * @brief Replace the in-memory profiles with the file's content
     *
     * A missing file loads as an empty store.
     */
    [[nodiscard]] auto load() -> result<void>;

    /**
     * @brief Write the profiles to the file, creating parent directories
     */
    [[nodiscard]] auto save() const -> result<void>;

    /**
     * @brief Add or replace a profile
     *
     * The first profile stored becomes the default when none is set.
     */
    [[nodiscard]] auto upsert(const std::string& name, const session_options& options)
        -> result<void>;

    /**
     * @brief Remove a profile
     *
     * Removing the default moves the default to the first remaining profile.
     */
    [[nodiscard]] auto remove(const std::string& name) -> result<void>;

    /**
     * @brief Make an existing profile the default
     */
    [[nodiscard]] auto set_default(const std::string& name) -> result<void>;

    [[nodiscard]] auto find(const std::string& name) const -> std::optional<session_options>;
    [[nodiscard]] auto contains(const std::string& name) const -> bool;
    [[nodiscard]] auto names() const -> std::vector<std::string>;
    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto default_name() const -> std::string;
    [[nodiscard]] auto default_profile() const -> std::optional<session_options>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return file_; }

private:
    using entry = std::pair<std::string, session_options>;

    auto locate(const std::string& name) -> std::vector<entry>::iterator;
    auto locate(const std::string& name) const -> std::vector<entry>::const_iterator;

    std::filesystem::path file_;
    mutable std::shared_mutex mutex_;
    std::vector<entry> profiles_;
    std::string default_;
};

}  // namespace kcenon::batch_transfer

#endif  // KCENON_BATCH_TRANSFER_PROFILE_PROFILE_STORE_H
