/**
 * @file file_list.cpp
 * @brief Implementation of file list helpers
 */

#include "kcenon/batch_transfer/core/file_list.h"

#include <algorithm>
#include <cctype>

namespace kcenon::batch_transfer {

namespace {

auto to_lower(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

auto collect_files(const std::filesystem::path& directory, const std::string& extension)
    -> result<std::vector<std::filesystem::path>> {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return unexpected{error{error_code::file_not_found,
                                "Not a directory: " + directory.string()}};
    }

    const auto wanted = to_lower(extension);
    std::vector<std::filesystem::path> files;

    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        return unexpected{error{error_code::file_access_denied,
                                "Cannot list " + directory.string() + ": " + ec.message()}};
    }
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }
        if (!wanted.empty() && to_lower(entry.path().extension().string()) != wanted) {
            continue;
        }
        files.push_back(entry.path());
    }

    std::sort(files.begin(), files.end(),
              [](const auto& a, const auto& b) { return a.filename() < b.filename(); });
    return files;
}

auto append_unique(std::vector<std::filesystem::path>& list,
                   const std::vector<std::filesystem::path>& additions) -> std::size_t {
    std::size_t added = 0;
    for (const auto& path : additions) {
        if (std::find(list.begin(), list.end(), path) == list.end()) {
            list.push_back(path);
            ++added;
        }
    }
    return added;
}

}  // namespace kcenon::batch_transfer
