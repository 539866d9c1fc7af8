#include "psa/analysis/symbol_table.h"

namespace psa::analysis {

    SymbolTable::SymbolTable(std::string file)
        : file_(std::move(file)) {
        scopes_.push_back(Scope{core::ScopeKind::MODULE, std::nullopt, 1, {}});
        open_scopes_.push_back(0);
    }

    std::size_t SymbolTable::enter_scope(const core::ScopeKind kind, const int line) {
        const std::size_t index = scopes_.size();
        scopes_.push_back(Scope{kind, current_scope(), line, {}});
        open_scopes_.push_back(index);
        return index;
    }

    core::Result<void> SymbolTable::exit_scope() {
        if (open_scopes_.size() <= 1) {
            return core::Result<void>::failure(core::make_error_with_context(
                core::ErrorCode::INVALID_STATE,
                "Cannot exit the module scope",
                file_));
        }

        open_scopes_.pop_back();
        return core::Result<void>::success();
    }

    void SymbolTable::bind(const std::string& name, const int line, const core::DefinitionKind kind) {
        const std::size_t scope = current_scope();
        scopes_[scope].bindings.insert(name);
        definitions_.push_back(core::Definition{name, scope, scopes_[scope].kind, line, kind});
        finalized_ = false;
    }

    void SymbolTable::reference(const std::string& name, const int line) {
        uses_.push_back(core::Use{name, line, current_scope()});
        referenced_names_.insert(name);
        finalized_ = false;
    }

    void SymbolTable::reference_attribute(const std::string& name, const int line) {
        attribute_uses_.push_back(core::Use{name, line, current_scope()});
        referenced_names_.insert(name);
    }

    void SymbolTable::finalize() {
        pending_uses_.clear();

        for (const auto& use : uses_) {
            if (!lookup(use.name, use.scope)) {
                pending_uses_.push_back(use);
            }
        }

        finalized_ = true;
    }

    std::optional<std::size_t> SymbolTable::lookup(const std::string& name, const std::size_t scope) const {
        if (scope >= scopes_.size()) {
            return std::nullopt;
        }

        if (scopes_[scope].bindings.contains(name)) {
            return scope;
        }

        // Enclosing class bodies are not visible from nested scopes.
        for (auto current = scopes_[scope].parent; current; current = scopes_[*current].parent) {
            const auto& enclosing = scopes_[*current];
            if (enclosing.kind == core::ScopeKind::CLASS) {
                continue;
            }
            if (enclosing.bindings.contains(name)) {
                return *current;
            }
        }

        return std::nullopt;
    }

}
