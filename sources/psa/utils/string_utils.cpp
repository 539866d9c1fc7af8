#include "psa/utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace psa::utils {

std::vector<std::string> split(const std::string_view str, const char delimiter) {
    std::vector<std::string> result;
    size_t start = 0;
    size_t end = str.find(delimiter);

    while (end != std::string_view::npos) {
        result.emplace_back(str.substr(start, end - start));
        start = end + 1;
        end = str.find(delimiter, start);
    }

    result.emplace_back(str.substr(start));
    return result;
}

std::string join(const std::vector<std::string>& strings, const std::string_view separator) {
    if (strings.empty()) return "";

    std::ostringstream oss;
    oss << strings[0];

    for (size_t i = 1; i < strings.size(); ++i) {
        oss << separator << strings[i];
    }

    return oss.str();
}

std::string trim(const std::string_view str) {
    const auto start = std::ranges::find_if_not(str, [](const unsigned char ch) {
        return std::isspace(ch);
    });

    const auto end = std::find_if_not(str.rbegin(), str.rend(), [](const unsigned char ch) {
        return std::isspace(ch);
    }).base();

    return start < end ? std::string(start, end) : std::string();
}

bool starts_with(const std::string_view str, const std::string_view prefix) {
    return str.size() >= prefix.size() &&
           str.substr(0, prefix.size()) == prefix;
}

bool ends_with(const std::string_view str, const std::string_view suffix) {
    return str.size() >= suffix.size() &&
           str.substr(str.size() - suffix.size()) == suffix;
}

bool contains(const std::string_view str, const std::string_view substr) {
    return str.find(substr) != std::string_view::npos;
}

std::string to_lower(const std::string_view str) {
    std::string result(str);
    std::ranges::transform(result, result.begin(),
                           [](const unsigned char c) { return std::tolower(c); });
    return result;
}

std::string replace_all(const std::string_view str, const std::string_view from, const std::string_view to) {
    if (from.empty()) return std::string(str);

    std::string result;
    size_t start = 0;
    size_t pos = str.find(from);

    while (pos != std::string_view::npos) {
        result.append(str.substr(start, pos - start));
        result.append(to);
        start = pos + from.size();
        pos = str.find(from, start);
    }

    result.append(str.substr(start));
    return result;
}

bool is_identifier(const std::string_view str) {
    if (str.empty()) return false;

    const auto head = static_cast<unsigned char>(str.front());
    if (!std::isalpha(head) && head != '_') return false;

    return std::ranges::all_of(str.substr(1), [](const unsigned char ch) {
        return std::isalnum(ch) || ch == '_';
    });
}

bool is_valid_utf8(const std::string_view bytes) {
    size_t i = 0;
    const size_t n = bytes.size();

    while (i < n) {
        const auto lead = static_cast<unsigned char>(bytes[i]);

        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t length;
        char32_t code_point;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (i + length > n) return false;

        for (size_t k = 1; k < length; ++k) {
            const auto cont = static_cast<unsigned char>(bytes[i + k]);
            if ((cont & 0xC0) != 0x80) return false;
            code_point = (code_point << 6) | (cont & 0x3F);
        }

        // overlong forms
        if ((length == 2 && code_point < 0x80) ||
            (length == 3 && code_point < 0x800) ||
            (length == 4 && code_point < 0x10000)) {
            return false;
        }

        if (code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }

        i += length;
    }

    return true;
}

std::size_t count_lines(const std::string_view text) {
    const auto newlines = static_cast<std::size_t>(std::ranges::count(text, '\n'));
    return !text.empty() && text.back() != '\n' ? newlines + 1 : newlines;
}

}  // namespace psa::utils
