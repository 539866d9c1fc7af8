#ifndef PSA_FRONTEND_PROJECT_LOADER_H
#define PSA_FRONTEND_PROJECT_LOADER_H

#include "psa/analysis/project_analyzer.h"
#include "psa/core/config.h"
#include "psa/core/result.h"
#include "psa/frontend/python_parser.h"

#include <string>
#include <vector>

namespace psa::frontend {

    /**
     * @class ProjectLoader
     * Enumerates a project and parses every file into a SourceUnit.
     *
     * Files that fail to read, decode or parse still produce a unit carrying
     * the error, so the analyzer can report them as skipped.
     */
    class ProjectLoader {
    public:
        explicit ProjectLoader(core::Config config);

        /**
         * @param root Project directory.
         * @return One unit per Python file in enumeration order, or the enumeration error.
         */
        [[nodiscard]] core::Result<std::vector<analysis::SourceUnit>> load(const std::string& root) const;

        /**
         * Parses a single file into a unit.
         */
        [[nodiscard]] analysis::SourceUnit load_file(const std::string& path) const;

    private:
        core::Config config_;
        PythonParser parser_;
    };

}

#endif //PSA_FRONTEND_PROJECT_LOADER_H
