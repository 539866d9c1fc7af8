#ifndef PSA_ANALYSIS_SYMBOL_TABLE_H
#define PSA_ANALYSIS_SYMBOL_TABLE_H

#include "psa/core/types.h"
#include "psa/core/result.h"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace psa::analysis {

    /**
     * One lexical binding region. Parents are arena indices, never owners.
     */
    struct Scope {
        core::ScopeKind kind = core::ScopeKind::MODULE;
        std::optional<std::size_t> parent;
        int line{};
        std::unordered_set<std::string> bindings;
    };

    /**
     * @class SymbolTable
     * Scopes, definitions and uses of a single file.
     *
     * The table owns every scope of its file in an arena. Uses are recorded
     * during traversal and resolved only by finalize(), so a name bound
     * anywhere in a visible scope resolves regardless of source order.
     * Uses that no visible scope binds become pending and are left to the
     * project-wide passes.
     *
     * Visibility follows Python: a use consults its own scope, then every
     * enclosing scope outward except class scopes.
     *
     * Not thread-safe; each file gets its own table.
     */
    class SymbolTable {
    public:
        explicit SymbolTable(std::string file);

        /**
         * Opens a nested scope inside the innermost open scope.
         *
         * @return Arena index of the new scope.
         */
        std::size_t enter_scope(core::ScopeKind kind, int line);

        /**
         * Closes the innermost open scope.
         *
         * @return INVALID_STATE if only the module scope is open.
         */
        core::Result<void> exit_scope();

        /**
         * Records a definition of `name` in the innermost open scope.
         */
        void bind(const std::string& name, int line, core::DefinitionKind kind);

        /**
         * Records a load of `name` in the innermost open scope.
         */
        void reference(const std::string& name, int line);

        /**
         * Records an attribute read `obj.name`. Counts as a reference of
         * `name` for the unused pass, never as a use that can be undefined.
         */
        void reference_attribute(const std::string& name, int line);

        /**
         * Resolves all recorded uses against their scope chains.
         *
         * Calling it again re-resolves from scratch, so it is safe after further recording.
         */
        void finalize();

        [[nodiscard]] bool is_finalized() const { return finalized_; }

        /**
         * Finds the scope that makes `name` visible from `scope`.
         *
         * @return Arena index of the binding scope, or std::nullopt.
         */
        [[nodiscard]] std::optional<std::size_t> lookup(const std::string& name, std::size_t scope) const;

        [[nodiscard]] const std::string& file() const { return file_; }
        [[nodiscard]] std::size_t current_scope() const { return open_scopes_.back(); }
        [[nodiscard]] std::size_t depth() const { return open_scopes_.size(); }

        [[nodiscard]] const std::vector<Scope>& scopes() const { return scopes_; }
        [[nodiscard]] const std::vector<core::Definition>& definitions() const { return definitions_; }
        [[nodiscard]] const std::vector<core::Use>& uses() const { return uses_; }
        [[nodiscard]] const std::vector<core::Use>& attribute_uses() const { return attribute_uses_; }

        /**
         * Uses that no visible scope of this file binds. Empty before finalize().
         */
        [[nodiscard]] const std::vector<core::Use>& pending_uses() const { return pending_uses_; }

        /**
         * Every name read in this file, plain or as an attribute.
         */
        [[nodiscard]] const std::unordered_set<std::string>& referenced_names() const { return referenced_names_; }

    private:
        std::string file_;
        std::vector<Scope> scopes_;
        std::vector<std::size_t> open_scopes_;

        std::vector<core::Definition> definitions_;
        std::vector<core::Use> uses_;
        std::vector<core::Use> attribute_uses_;
        std::vector<core::Use> pending_uses_;
        std::unordered_set<std::string> referenced_names_;

        bool finalized_ = false;
    };

}

#endif //PSA_ANALYSIS_SYMBOL_TABLE_H
