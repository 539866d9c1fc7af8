#ifndef PSA_SYNTAX_SYNTAX_NODE_H
#define PSA_SYNTAX_SYNTAX_NODE_H

#include "psa/core/types.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace psa::syntax {

    /**
     * Node kinds the analyzer distinguishes. Everything else a parser
     * produces collapses into BLOCK, a plain container whose children are
     * visited in the current scope.
     */
    enum class NodeKind {
        MODULE,
        BLOCK,
        FUNCTION_DEF,
        CLASS_DEF,
        LAMBDA,
        COMPREHENSION,
        ASSIGNMENT,
        NAME,
        ATTRIBUTE,
        IMPORT,
        IMPORT_FROM
    };

    enum class NameContext {
        LOAD,
        STORE,
        DEL
    };

    enum class ParameterKind {
        POSITIONAL,
        VAR_POSITIONAL,   ///< *args
        KEYWORD_ONLY,
        VAR_KEYWORD       ///< **kwargs
    };

    struct Parameter {
        std::string name;
        ParameterKind kind = ParameterKind::POSITIONAL;
        int line{};
    };

    struct SyntaxNode;
    using NodePtr = std::unique_ptr<SyntaxNode>;

    /**
     * One `for ... in ... if ...` clause of a comprehension.
     */
    struct ComprehensionClause {
        std::vector<NodePtr> targets;
        std::vector<NodePtr> iterable;
        std::vector<NodePtr> conditions;
    };

    /**
     * Language-neutral syntax tree node.
     *
     * Field use by kind:
     *  - NAME: `identifier`, `context`.
     *  - ATTRIBUTE: `identifier` is the attribute, `body` holds the object expression.
     *  - FUNCTION_DEF / CLASS_DEF: `identifier` is the bound name, `header` holds
     *    decorators, defaults, annotations and base classes (all evaluated in the
     *    enclosing scope), `body` the suite.
     *  - LAMBDA: `parameters`, `header` (defaults), `body`.
     *  - COMPREHENSION: `clauses`, `body` holds the yielded element(s).
     *  - ASSIGNMENT: `targets` (names with STORE context), `body` the value.
     *  - IMPORT / IMPORT_FROM: `module`, `level`, `names`, `wildcard`.
     *  - MODULE / BLOCK: `body`.
     */
    struct SyntaxNode {
        NodeKind kind = NodeKind::BLOCK;
        int line{};

        std::string identifier;
        NameContext context = NameContext::LOAD;
        std::vector<Parameter> parameters;

        std::string module;
        int level{};
        std::vector<core::ImportDeclaration::Alias> names;
        bool wildcard = false;

        std::vector<NodePtr> header;
        std::vector<NodePtr> targets;
        std::vector<NodePtr> body;
        std::vector<ComprehensionClause> clauses;
    };

    /**
     * Collect move-only nodes into a vector; brace-init lists cannot hold unique_ptr.
     */
    template<typename... Nodes>
    std::vector<NodePtr> nodes(Nodes&&... items) {
        std::vector<NodePtr> result;
        result.reserve(sizeof...(items));
        (result.push_back(std::forward<Nodes>(items)), ...);
        return result;
    }

    NodePtr make_module(std::vector<NodePtr> body);
    NodePtr make_block(std::vector<NodePtr> children, int line = 0);

    NodePtr make_name(std::string identifier, int line, NameContext context = NameContext::LOAD);
    NodePtr make_attribute(NodePtr object, std::string attribute, int line,
                           NameContext context = NameContext::LOAD);

    NodePtr make_function(std::string name, int line,
                          std::vector<Parameter> parameters,
                          std::vector<NodePtr> body,
                          std::vector<NodePtr> header = {});

    NodePtr make_class(std::string name, int line,
                       std::vector<NodePtr> body,
                       std::vector<NodePtr> header = {});

    NodePtr make_lambda(int line,
                        std::vector<Parameter> parameters,
                        std::vector<NodePtr> body,
                        std::vector<NodePtr> header = {});

    NodePtr make_comprehension(int line,
                               std::vector<ComprehensionClause> clauses,
                               std::vector<NodePtr> element);

    /**
     * Build one comprehension clause. Target names should carry STORE context.
     */
    ComprehensionClause make_clause(std::vector<NodePtr> targets,
                                    std::vector<NodePtr> iterable,
                                    std::vector<NodePtr> conditions = {});

    NodePtr make_assignment(std::vector<NodePtr> targets, std::vector<NodePtr> value, int line);

    /**
     * `import a.b as c, d` -> names {{"a.b", "c"}, {"d", ""}}.
     */
    NodePtr make_import(std::vector<core::ImportDeclaration::Alias> names, int line);

    /**
     * `from ..pkg import x` -> module "pkg", level 2. A single name "*" marks a wildcard import.
     */
    NodePtr make_import_from(std::string module, int level,
                             std::vector<core::ImportDeclaration::Alias> names, int line);

    std::string to_string(NodeKind kind);

    /**
     * Number of nodes in the tree rooted at `node`, clause members included.
     */
    std::size_t count_nodes(const SyntaxNode& node);

}

#endif //PSA_SYNTAX_SYNTAX_NODE_H
