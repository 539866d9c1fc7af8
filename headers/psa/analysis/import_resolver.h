#ifndef PSA_ANALYSIS_IMPORT_RESOLVER_H
#define PSA_ANALYSIS_IMPORT_RESOLVER_H

#include "psa/core/types.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace psa::analysis {

    /**
     * @class ImportResolver
     * Maps import references to files inside one project root.
     *
     * Resolution only consults the filesystem under the root; anything that
     * does not land on an existing `.py` file inside it is external and
     * yields no result. Stateless after construction, so one instance is
     * shared by all worker threads.
     */
    class ImportResolver {
    public:
        /**
         * @param project_root Directory that bounds resolution. Canonicalized on construction.
         */
        explicit ImportResolver(const std::string& project_root);

        /**
         * Resolves a dotted module reference.
         *
         * Level 0 starts from the project root. Level N > 0 starts from the
         * importing file's directory and ascends N-1 parents; leaving the root
         * makes the import external. `<p>.py` is preferred over `<p>/__init__.py`.
         * An empty module resolves to the start directory's `__init__.py`.
         *
         * @param module Dotted path, possibly empty for relative imports.
         * @param level Number of leading dots.
         * @param importing_file Canonical path of the file containing the import.
         * @return Canonical path of the target file, or std::nullopt if external.
         */
        [[nodiscard]] std::optional<std::string> resolve(
            const std::string& module,
            int level,
            const std::string& importing_file
        ) const;

        /**
         * Resolves every dependency introduced by one import declaration.
         *
         *  - `import a.b.c` uses the longest prefix that resolves.
         *  - `from pkg import name` tries the submodule `pkg.name`, then `pkg`.
         *  - `from . import name` tries `name` in the start directory, then its `__init__.py`.
         *
         * Targets equal to the importing file are dropped.
         *
         * @return Distinct target files, sorted.
         */
        [[nodiscard]] std::vector<std::string> resolve_import(
            const core::ImportDeclaration& declaration,
            const std::string& importing_file
        ) const;

        [[nodiscard]] const std::string& project_root() const { return root_string_; }

    private:
        [[nodiscard]] std::optional<std::filesystem::path> start_directory(
            int level,
            const std::filesystem::path& importing_file
        ) const;

        [[nodiscard]] std::optional<std::string> accept(const std::filesystem::path& candidate) const;
        [[nodiscard]] bool is_inside_root(const std::filesystem::path& path) const;

        std::filesystem::path root_;
        std::string root_string_;
    };

}

#endif //PSA_ANALYSIS_IMPORT_RESOLVER_H
