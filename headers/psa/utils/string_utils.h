#ifndef PSA_UTILS_STRING_UTILS_H
#define PSA_UTILS_STRING_UTILS_H

#include <string>
#include <string_view>
#include <vector>

namespace psa::utils
{
    /**
     * Split a string into substrings separated by a delimiter.
     *
     * @param str Input text to split.
     * @param delimiter The character to split on.
     * @return The substrings between delimiters. Empty tokens are preserved.
     */
    std::vector<std::string> split(std::string_view str, char delimiter);

    /**
     * Join strings with a separator.
     *
     * @param strings Strings to concatenate.
     * @param separator Text inserted between consecutive elements.
     * @return The joined string, or an empty string when `strings` is empty.
     */
    std::string join(const std::vector<std::string>& strings, std::string_view separator);

    /**
     * Remove leading and trailing whitespace.
     */
    std::string trim(std::string_view str);

    bool starts_with(std::string_view str, std::string_view prefix);
    bool ends_with(std::string_view str, std::string_view suffix);
    bool contains(std::string_view str, std::string_view substr);

    std::string to_lower(std::string_view str);

    /**
     * Replace every occurrence of `from` in `str` with `to`.
     */
    std::string replace_all(std::string_view str, std::string_view from, std::string_view to);

    /**
     * Check whether `str` is an ASCII identifier: a letter or underscore
     * followed by letters, digits or underscores.
     */
    bool is_identifier(std::string_view str);

    /**
     * Check whether `bytes` is well-formed UTF-8.
     *
     * Overlong encodings, surrogate code points and values above U+10FFFF are rejected.
     */
    bool is_valid_utf8(std::string_view bytes);

    /**
     * Number of lines in `text`. A final line without a trailing newline counts.
     */
    std::size_t count_lines(std::string_view text);

}

#endif //PSA_UTILS_STRING_UTILS_H
