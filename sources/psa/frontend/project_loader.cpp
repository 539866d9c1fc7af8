#include "psa/frontend/project_loader.h"
#include "psa/frontend/source_enumerator.h"
#include "psa/utils/file_utils.h"
#include "psa/utils/logging.h"
#include "psa/utils/string_utils.h"
#include "psa/utils/parallel.hpp"

#include <algorithm>

namespace psa::frontend {

    ProjectLoader::ProjectLoader(core::Config config)
        : config_(std::move(config)) {}

    analysis::SourceUnit ProjectLoader::load_file(const std::string& path) const {
        analysis::SourceUnit unit;
        unit.path = path;

        const auto content = utils::read_file(path);
        if (!content) {
            unit.error = core::make_error_with_context(
                core::ErrorCode::FILE_READ_ERROR, "Cannot read file: " + path, path);
            return unit;
        }
        unit.bytes = content->size();
        unit.lines = utils::count_lines(*content);

        auto parsed = parser_.parse(*content, path);
        if (parsed.is_success()) {
            unit.tree = std::move(parsed).value();
            utils::logger()->debug("Parsed {} ({} nodes)", path, syntax::count_nodes(*unit.tree));
        } else {
            unit.error = parsed.error();
        }

        return unit;
    }

    core::Result<std::vector<analysis::SourceUnit>> ProjectLoader::load(const std::string& root) const {
        const SourceEnumerator enumerator(config_);
        auto files = enumerator.enumerate(root);
        if (files.is_failure()) {
            return core::Result<std::vector<analysis::SourceUnit>>::failure(files.error());
        }

        parallel::ThreadPool pool(static_cast<unsigned int>(std::max(config_.performance.num_threads, 0)));

        try {
            auto units = parallel::map(files.value(), [this](const std::string& path) {
                return load_file(path);
            }, pool);

            const auto failed = std::ranges::count_if(units, [](const analysis::SourceUnit& unit) {
                return unit.error.has_value();
            });
            utils::logger()->info("Parsed {} files, {} could not be parsed", units.size() - static_cast<std::size_t>(failed), failed);

            return core::Result<std::vector<analysis::SourceUnit>>::success(std::move(units));
        } catch (const std::exception& e) {
            return core::Result<std::vector<analysis::SourceUnit>>::failure(
                core::ErrorCode::INTERNAL_ERROR, std::string("Parsing failed: ") + e.what());
        }
    }

}
