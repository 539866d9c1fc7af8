#ifndef PSA_FRONTEND_SOURCE_ENUMERATOR_H
#define PSA_FRONTEND_SOURCE_ENUMERATOR_H

#include "psa/core/config.h"
#include "psa/core/result.h"

#include <string>
#include <vector>

namespace psa::frontend {

    /**
     * @class SourceEnumerator
     * Lists the Python files of a project directory.
     *
     * Directories named in `filters.ignore_dirs` are not descended into, and
     * files whose root-relative path contains one of `filters.ignore_paths`
     * are dropped. Unreadable directories are skipped silently.
     */
    class SourceEnumerator {
    public:
        explicit SourceEnumerator(core::Config config);

        /**
         * @param root Project directory.
         * @return Canonical absolute paths of every `.py` file, sorted, or INVALID_PATH.
         */
        [[nodiscard]] core::Result<std::vector<std::string>> enumerate(const std::string& root) const;

    private:
        core::Config config_;
    };

}

#endif //PSA_FRONTEND_SOURCE_ENUMERATOR_H
