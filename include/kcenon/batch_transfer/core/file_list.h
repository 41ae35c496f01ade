/**
 * @file file_list.h
 * @brief Helpers for assembling a batch's file list
 */

#ifndef KCENON_BATCH_TRANSFER_CORE_FILE_LIST_H
#define KCENON_BATCH_TRANSFER_CORE_FILE_LIST_H

#include <filesystem>
#include <string>
#include <vector>

#include "kcenon/batch_transfer/core/types.h"

namespace kcenon::batch_transfer {

/**
 * @brief List the regular files of a directory, sorted by name
 *
 * Not recursive. @p extension (e.g. ".csv") is matched case-insensitively;
 * an empty extension accepts every file.
 */
[[nodiscard]] auto collect_files(const std::filesystem::path& directory,
                                 const std::string& extension = ".csv")
    -> result<std::vector<std::filesystem::path>>;

/**
 * @brief Append paths that are not already in @p list, keeping order
 * @return Number of paths appended
 */
auto append_unique(std::vector<std::filesystem::path>& list,
                   const std::vector<std::filesystem::path>& additions) -> std::size_t;

}  // namespace kcenon::batch_transfer

#endif  // KCENON_BATCH_TRANSFER_CORE_FILE_LIST_H
