#include "psa/analysis/symbol_collector.h"
#include "psa/utils/logging.h"
#include "psa/utils/string_utils.h"

namespace psa::analysis {

    namespace {

        using syntax::NodeKind;
        using syntax::NameContext;
        using syntax::SyntaxNode;

        /**
         * Single-use traversal state for one file.
         */
        class Walker {
        public:
            Walker(CollectedFile& out, const core::WildcardPolicy wildcard_policy)
                : out_(out), wildcard_policy_(wildcard_policy) {}

            core::Result<void> visit(const SyntaxNode& node) {
                switch (node.kind) {
                    case NodeKind::MODULE:
                    case NodeKind::BLOCK:
                        return visit_all(node.body);

                    case NodeKind::NAME:
                        visit_name(node);
                        return core::Result<void>::success();

                    case NodeKind::ATTRIBUTE:
                        if (auto result = visit_all(node.body); result.is_failure()) return result;
                        if (node.context == NameContext::LOAD) {
                            table().reference_attribute(node.identifier, node.line);
                        }
                        return core::Result<void>::success();

                    case NodeKind::FUNCTION_DEF:
                        return visit_function(node);

                    case NodeKind::CLASS_DEF:
                        return visit_class(node);

                    case NodeKind::LAMBDA:
                        return visit_lambda(node);

                    case NodeKind::COMPREHENSION:
                        return visit_comprehension(node);

                    case NodeKind::ASSIGNMENT:
                        if (auto result = visit_all(node.body); result.is_failure()) return result;
                        return visit_all(node.targets);

                    case NodeKind::IMPORT:
                        visit_import(node);
                        return core::Result<void>::success();

                    case NodeKind::IMPORT_FROM:
                        visit_import_from(node);
                        return core::Result<void>::success();

                    default:
                        return core::Result<void>::failure(core::ErrorCode::INTERNAL_ERROR,
                            "Unhandled syntax node kind: " + syntax::to_string(node.kind));
                }
            }

        private:
            SymbolTable& table() { return out_.table; }

            core::Result<void> visit_all(const std::vector<syntax::NodePtr>& children) {
                for (const auto& child : children) {
                    if (!child) continue;
                    if (auto result = visit(*child); result.is_failure()) {
                        return result;
                    }
                }
                return core::Result<void>::success();
            }

            void visit_name(const SyntaxNode& node) {
                if (node.context == NameContext::STORE) {
                    table().bind(node.identifier, node.line, core::DefinitionKind::VARIABLE);
                } else {
                    table().reference(node.identifier, node.line);
                }
            }

            void bind_parameters(const std::vector<syntax::Parameter>& parameters) {
                for (const auto& parameter : parameters) {
                    table().bind(parameter.name, parameter.line, core::DefinitionKind::PARAMETER);
                }
            }

            core::Result<void> visit_function(const SyntaxNode& node) {
                if (auto result = visit_all(node.header); result.is_failure()) return result;
                table().bind(node.identifier, node.line, core::DefinitionKind::FUNCTION);

                table().enter_scope(core::ScopeKind::FUNCTION, node.line);
                bind_parameters(node.parameters);
                if (auto result = visit_all(node.body); result.is_failure()) return result;
                return table().exit_scope();
            }

            core::Result<void> visit_class(const SyntaxNode& node) {
                if (auto result = visit_all(node.header); result.is_failure()) return result;
                table().bind(node.identifier, node.line, core::DefinitionKind::CLASS);

                table().enter_scope(core::ScopeKind::CLASS, node.line);
                if (auto result = visit_all(node.body); result.is_failure()) return result;
                return table().exit_scope();
            }

            core::Result<void> visit_lambda(const SyntaxNode& node) {
                if (auto result = visit_all(node.header); result.is_failure()) return result;

                table().enter_scope(core::ScopeKind::LAMBDA, node.line);
                bind_parameters(node.parameters);
                if (auto result = visit_all(node.body); result.is_failure()) return result;
                return table().exit_scope();
            }

            core::Result<void> visit_comprehension(const SyntaxNode& node) {
                table().enter_scope(core::ScopeKind::COMPREHENSION, node.line);

                for (const auto& clause : node.clauses) {
                    if (auto result = visit_all(clause.targets); result.is_failure()) return result;
                    if (auto result = visit_all(clause.iterable); result.is_failure()) return result;
                    if (auto result = visit_all(clause.conditions); result.is_failure()) return result;
                }

                if (auto result = visit_all(node.body); result.is_failure()) return result;
                return table().exit_scope();
            }

            void visit_import(const SyntaxNode& node) {
                core::ImportDeclaration declaration;
                declaration.line = node.line;
                declaration.is_from_import = false;

                for (const auto& alias : node.names) {
                    const std::string bound = alias.alias.empty()
                        ? utils::split(alias.name, '.').front()
                        : alias.alias;
                    table().bind(bound, node.line, core::DefinitionKind::IMPORT_ALIAS);
                    declaration.names.push_back(alias);
                }

                out_.imports.push_back(std::move(declaration));
            }

            void visit_import_from(const SyntaxNode& node) {
                core::ImportDeclaration declaration;
                declaration.module = node.module;
                declaration.level = node.level;
                declaration.line = node.line;
                declaration.is_from_import = true;
                declaration.is_wildcard = node.wildcard;

                if (node.wildcard) {
                    const std::string source = std::string(static_cast<std::size_t>(node.level), '.') + node.module;
                    if (wildcard_policy_ == core::WildcardPolicy::FLAG) {
                        out_.diagnostics.push_back(core::Diagnostic{
                            core::DiagnosticKind::WILDCARD_IMPORT,
                            table().file(),
                            node.line,
                            "wildcard import from '" + source + "' binds names that cannot be tracked"
                        });
                    }
                    utils::logger()->debug("{}:{} wildcard import from '{}'", table().file(), node.line, source);
                } else {
                    for (const auto& alias : node.names) {
                        const std::string& bound = alias.alias.empty() ? alias.name : alias.alias;
                        table().bind(bound, node.line, core::DefinitionKind::IMPORT_ALIAS);
                        declaration.names.push_back(alias);
                    }
                }

                out_.imports.push_back(std::move(declaration));
            }

            CollectedFile& out_;
            core::WildcardPolicy wildcard_policy_;
        };

    }

    SymbolCollector::SymbolCollector(const core::WildcardPolicy wildcard_policy)
        : wildcard_policy_(wildcard_policy) {}

    core::Result<CollectedFile> SymbolCollector::collect(
        const std::string& file,
        const syntax::SyntaxNode& module
    ) const {
        if (module.kind != syntax::NodeKind::MODULE) {
            return core::Result<CollectedFile>::failure(core::make_error_with_context(
                core::ErrorCode::INVALID_ARGUMENT,
                "Syntax tree root must be a module, got " + syntax::to_string(module.kind),
                file));
        }

        CollectedFile collected{SymbolTable(file), {}, {}};
        Walker walker(collected, wildcard_policy_);

        if (auto result = walker.visit(module); result.is_failure()) {
            return core::Result<CollectedFile>::failure(std::move(result).error());
        }

        collected.table.finalize();
        return core::Result<CollectedFile>::success(std::move(collected));
    }

}
