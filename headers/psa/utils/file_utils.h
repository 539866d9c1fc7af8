#ifndef PSA_UTILS_FILE_UTILS_H
#define PSA_UTILS_FILE_UTILS_H

#include <optional>
#include <string>
#include <string_view>

namespace psa::utils
{
    /**
     * Read the entire file at `path` as bytes.
     *
     * @param path Path of the file to read.
     * @return The file contents, or std::nullopt if the file cannot be opened.
     */
    std::optional<std::string> read_file(std::string_view path);

    /**
     * Write `content` to the file at `path`, replacing any existing content.
     * Missing parent directories are created.
     *
     * @return True on success, false on failure.
     */
    bool write_file(std::string_view path, std::string_view content);

    /**
     * Write `content` to a sibling temporary file and rename it over `path`.
     *
     * Readers never observe a partially written file. The temporary file is
     * removed if any step fails.
     *
     * @return True on success, false on failure.
     */
    bool write_file_atomic(std::string_view path, std::string_view content);

}

#endif //PSA_UTILS_FILE_UTILS_H
