#ifndef PSA_UTILS_PATH_UTILS_H
#define PSA_UTILS_PATH_UTILS_H

#include <filesystem>
#include <string>
#include <string_view>

namespace psa::utils
{
    namespace fs = std::filesystem;

    /**
     * Lexically normalize `path` (collapse `.`, `..` and duplicate separators).
     */
    std::string normalize_path(std::string_view path);

    /**
     * Resolve `path` against the filesystem, following symlinks where the path exists.
     *
     * Falls back to the lexically normalized absolute path when canonicalization fails.
     */
    std::string canonical_path(std::string_view path);

    /**
     * Express `path` relative to `base`.
     *
     * @return The relative path, or `path` unchanged if it cannot be relativized.
     */
    std::string get_relative_path(std::string_view path, std::string_view base);

    bool is_directory(std::string_view path);

    std::string to_posix_separators(std::string_view path);

}

#endif //PSA_UTILS_PATH_UTILS_H
