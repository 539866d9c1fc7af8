#include "psa/utils/file_utils.h"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace psa::utils {

namespace fs = std::filesystem;

std::optional<std::string> read_file(const std::string_view path) {
    std::ifstream file(std::string(path), std::ios::in | std::ios::binary);

    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return ss.str();
}

bool write_file(const std::string_view path, const std::string_view content) {
    const fs::path p(path);

    if (!p.parent_path().empty()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
        if (ec) return false;
    }

    std::ofstream file(p, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return file.good();
}

bool write_file_atomic(const std::string_view path, const std::string_view content) {
    static std::atomic<unsigned> counter{0};

    const fs::path target(path);
    fs::path temp = target;
    temp += ".tmp." + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()))
          + "." + std::to_string(counter.fetch_add(1));

    if (!write_file(temp.string(), content)) {
        std::error_code ec;
        fs::remove(temp, ec);
        return false;
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code remove_ec;
        fs::remove(temp, remove_ec);
        return false;
    }

    return true;
}

}  // namespace psa::utils
