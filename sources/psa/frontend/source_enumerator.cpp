#include "psa/frontend/source_enumerator.h"
#include "psa/utils/logging.h"
#include "psa/utils/path_utils.h"

#include <algorithm>
#include <filesystem>

namespace psa::frontend {

    namespace fs = std::filesystem;

    SourceEnumerator::SourceEnumerator(core::Config config)
        : config_(std::move(config)) {}

    core::Result<std::vector<std::string>> SourceEnumerator::enumerate(const std::string& root) const {
        if (!utils::is_directory(root)) {
            return core::Result<std::vector<std::string>>::failure(core::make_error_with_context(
                core::ErrorCode::INVALID_PATH, "Not a directory: " + root, root));
        }

        const fs::path canonical_root(utils::canonical_path(root));
        std::vector<std::string> files;

        std::error_code ec;
        fs::recursive_directory_iterator it(canonical_root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return core::Result<std::vector<std::string>>::failure(core::make_error_with_context(
                core::ErrorCode::FILE_READ_ERROR, "Cannot list directory: " + ec.message(), root));
        }

        for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
            if (ec) {
                utils::logger()->warn("Directory walk under {} stopped early: {}", root, ec.message());
                break;
            }

            const auto& entry = *it;
            const std::string relative = utils::to_posix_separators(
                entry.path().lexically_relative(canonical_root).string());

            std::error_code status_ec;
            if (entry.is_directory(status_ec)) {
                if (config_.is_path_ignored(relative)) {
                    it.disable_recursion_pending();
                }
                continue;
            }

            if (!entry.is_regular_file(status_ec) || entry.path().extension() != ".py") {
                continue;
            }

            if (config_.is_path_ignored(relative)) {
                continue;
            }

            files.push_back(utils::canonical_path(entry.path().string()));
        }

        std::ranges::sort(files);
        files.erase(std::ranges::unique(files).begin(), files.end());

        utils::logger()->info("Found {} Python files under {}", files.size(), canonical_root.string());
        return core::Result<std::vector<std::string>>::success(std::move(files));
    }

}
