#include "psa/utils/path_utils.h"
#include <algorithm>

namespace psa::utils {

std::string normalize_path(const std::string_view path) {
    try {
        return fs::path(path).lexically_normal().string();
    } catch (const std::exception&) {
        return std::string(path);
    }
}

std::string canonical_path(const std::string_view path) {
    std::error_code ec;
    auto resolved = fs::weakly_canonical(fs::path(path), ec);
    if (ec) {
        resolved = fs::absolute(fs::path(path), ec).lexically_normal();
        if (ec) return normalize_path(path);
    }
    return resolved.string();
}

std::string get_relative_path(const std::string_view path, const std::string_view base) {
    try {
        const fs::path p(path);
        const fs::path b(base);
        auto rel = p.lexically_relative(b);
        if (rel.empty()) {
            return std::string(path);
        }
        return rel.string();
    } catch (const std::exception&) {
        return std::string(path);
    }
}

bool is_directory(const std::string_view path) {
    std::error_code ec;
    return fs::is_directory(fs::path(path), ec);
}

std::string to_posix_separators(const std::string_view path) {
    std::string result(path);
    std::ranges::replace(result, '\\', '/');
    return result;
}

}  // namespace psa::utils
