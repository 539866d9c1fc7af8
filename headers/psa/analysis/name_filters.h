#ifndef PSA_ANALYSIS_NAME_FILTERS_H
#define PSA_ANALYSIS_NAME_FILTERS_H

#include "psa/core/config.h"

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace psa::analysis {

    /**
     * @class BuiltinSet
     * Names that are always defined: Python 3 builtin functions, types,
     * exceptions, constants and module-level dunders, plus any configured extras.
     *
     * Immutable after construction; safe to share between threads.
     */
    class BuiltinSet {
    public:
        BuiltinSet();
        explicit BuiltinSet(const std::vector<std::string>& extra_names);

        [[nodiscard]] bool contains(const std::string& name) const;
        [[nodiscard]] std::size_t size() const { return names_.size(); }

        /**
         * The fixed set shipped with the analyzer, without extras.
         */
        static const std::vector<std::string>& python_builtins();

    private:
        std::unordered_set<std::string> names_;
    };

    /**
     * Whether `name` is excluded from the unused-symbol report under `convention`.
     *
     * DUNDER matches `__x__` (at least one character between the underscores),
     * UNDERSCORE matches any name starting with '_', NONE matches nothing.
     */
    bool is_private_name(std::string_view name, core::PrivateConvention convention);

}

#endif //PSA_ANALYSIS_NAME_FILTERS_H
