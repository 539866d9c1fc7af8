#ifndef PSA_ANALYSIS_SYMBOL_COLLECTOR_H
#define PSA_ANALYSIS_SYMBOL_COLLECTOR_H

#include "psa/analysis/symbol_table.h"
#include "psa/core/config.h"
#include "psa/core/result.h"
#include "psa/core/types.h"
#include "psa/syntax/syntax_node.h"

#include <string>
#include <vector>

namespace psa::analysis {

    /**
     * Everything one traversal learns about a file.
     */
    struct CollectedFile {
        SymbolTable table;
        std::vector<core::ImportDeclaration> imports;
        std::vector<core::Diagnostic> diagnostics;
    };

    /**
     * @class SymbolCollector
     * Walks a syntax tree and records scopes, definitions, uses and imports.
     *
     * Function and class names bind in the enclosing scope; decorators,
     * defaults, annotations and base classes are evaluated there too.
     * Parameters are bound in the new function or lambda scope before its
     * body is visited. Comprehensions open their own scope holding their
     * loop targets. Store-context names bind as variables, imports bind
     * their alias (or the first segment of a dotted module).
     */
    class SymbolCollector {
    public:
        explicit SymbolCollector(core::WildcardPolicy wildcard_policy = core::WildcardPolicy::FLAG);

        /**
         * Collects symbols from one parsed file. The returned table is finalized.
         *
         * @param file Canonical path of the file, used for the table and diagnostics.
         * @param module Root of the syntax tree; must be a MODULE node.
         * @return INVALID_ARGUMENT if the root is not a module.
         */
        [[nodiscard]] core::Result<CollectedFile> collect(
            const std::string& file,
            const syntax::SyntaxNode& module
        ) const;

    private:
        core::WildcardPolicy wildcard_policy_;
    };

}

#endif //PSA_ANALYSIS_SYMBOL_COLLECTOR_H
