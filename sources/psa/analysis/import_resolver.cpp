#include "psa/analysis/import_resolver.h"
#include "psa/utils/logging.h"
#include "psa/utils/path_utils.h"
#include "psa/utils/string_utils.h"

#include <algorithm>

namespace psa::analysis {

    namespace fs = std::filesystem;

    ImportResolver::ImportResolver(const std::string& project_root)
        : root_(utils::canonical_path(project_root)),
          root_string_(root_.string()) {}

    std::optional<std::string> ImportResolver::resolve(
        const std::string& module,
        const int level,
        const std::string& importing_file
    ) const {
        if (level < 0) {
            return std::nullopt;
        }

        auto base = start_directory(level, fs::path(importing_file));
        if (!base) {
            return std::nullopt;
        }

        if (module.empty()) {
            if (level == 0) return std::nullopt;
            return accept(*base / "__init__.py");
        }

        fs::path target = *base;
        for (const auto& segment : utils::split(module, '.')) {
            if (!utils::is_identifier(segment)) {
                return std::nullopt;
            }
            target /= segment;
        }

        fs::path module_file = target;
        module_file += ".py";
        if (auto resolved = accept(module_file)) {
            return resolved;
        }

        return accept(target / "__init__.py");
    }

    std::vector<std::string> ImportResolver::resolve_import(
        const core::ImportDeclaration& declaration,
        const std::string& importing_file
    ) const {
        std::vector<std::string> targets;

        auto add = [&](const std::optional<std::string>& target) {
            if (target && *target != importing_file) {
                targets.push_back(*target);
            }
        };

        if (!declaration.is_from_import) {
            for (const auto& alias : declaration.names) {
                auto segments = utils::split(alias.name, '.');
                std::optional<std::string> resolved;

                while (!segments.empty() && !resolved) {
                    resolved = resolve(utils::join(segments, "."), 0, importing_file);
                    segments.pop_back();
                }

                add(resolved);
            }
        } else if (declaration.is_wildcard) {
            add(resolve(declaration.module, declaration.level, importing_file));
        } else {
            for (const auto& alias : declaration.names) {
                const std::string submodule = declaration.module.empty()
                    ? alias.name
                    : declaration.module + "." + alias.name;

                auto resolved = resolve(submodule, declaration.level, importing_file);
                if (!resolved) {
                    resolved = resolve(declaration.module, declaration.level, importing_file);
                }
                add(resolved);
            }
        }

        std::ranges::sort(targets);
        targets.erase(std::ranges::unique(targets).begin(), targets.end());

        for (const auto& target : targets) {
            utils::logger()->debug("{}:{} import resolves to {}", importing_file, declaration.line, target);
        }

        return targets;
    }

    std::optional<fs::path> ImportResolver::start_directory(
        const int level,
        const fs::path& importing_file
    ) const {
        if (level == 0) {
            return root_;
        }

        fs::path directory = importing_file.parent_path();
        if (!is_inside_root(directory)) {
            return std::nullopt;
        }

        for (int i = 1; i < level; ++i) {
            if (directory == root_) {
                return std::nullopt;
            }
            directory = directory.parent_path();
        }

        return directory;
    }

    std::optional<std::string> ImportResolver::accept(const fs::path& candidate) const {
        std::error_code ec;
        if (!fs::is_regular_file(candidate, ec) || ec) {
            return std::nullopt;
        }

        const fs::path resolved(utils::canonical_path(candidate.string()));
        if (!is_inside_root(resolved)) {
            return std::nullopt;
        }

        return resolved.string();
    }

    bool ImportResolver::is_inside_root(const fs::path& path) const {
        if (path == root_) {
            return true;
        }

        const auto relative = path.lexically_relative(root_);
        if (relative.empty()) {
            return false;
        }

        const auto first = *relative.begin();
        return first != ".." && first != ".";
    }

}
