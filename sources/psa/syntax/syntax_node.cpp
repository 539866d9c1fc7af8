#include "psa/syntax/syntax_node.h"

namespace psa::syntax {

    namespace {

        NodePtr make_node(const NodeKind kind, const int line) {
            auto node = std::make_unique<SyntaxNode>();
            node->kind = kind;
            node->line = line;
            return node;
        }

        std::size_t count_all(const std::vector<NodePtr>& children) {
            std::size_t total = 0;
            for (const auto& child : children) {
                if (child) total += count_nodes(*child);
            }
            return total;
        }

    }

    NodePtr make_module(std::vector<NodePtr> body) {
        auto node = make_node(NodeKind::MODULE, 1);
        node->body = std::move(body);
        return node;
    }

    NodePtr make_block(std::vector<NodePtr> children, const int line) {
        auto node = make_node(NodeKind::BLOCK, line);
        node->body = std::move(children);
        return node;
    }

    NodePtr make_name(std::string identifier, const int line, const NameContext context) {
        auto node = make_node(NodeKind::NAME, line);
        node->identifier = std::move(identifier);
        node->context = context;
        return node;
    }

    NodePtr make_attribute(NodePtr object, std::string attribute, const int line, const NameContext context) {
        auto node = make_node(NodeKind::ATTRIBUTE, line);
        node->identifier = std::move(attribute);
        node->context = context;
        if (object) node->body.push_back(std::move(object));
        return node;
    }

    NodePtr make_function(std::string name, const int line,
                          std::vector<Parameter> parameters,
                          std::vector<NodePtr> body,
                          std::vector<NodePtr> header) {
        auto node = make_node(NodeKind::FUNCTION_DEF, line);
        node->identifier = std::move(name);
        node->parameters = std::move(parameters);
        node->body = std::move(body);
        node->header = std::move(header);
        return node;
    }

    NodePtr make_class(std::string name, const int line,
                       std::vector<NodePtr> body,
                       std::vector<NodePtr> header) {
        auto node = make_node(NodeKind::CLASS_DEF, line);
        node->identifier = std::move(name);
        node->body = std::move(body);
        node->header = std::move(header);
        return node;
    }

    NodePtr make_lambda(const int line,
                        std::vector<Parameter> parameters,
                        std::vector<NodePtr> body,
                        std::vector<NodePtr> header) {
        auto node = make_node(NodeKind::LAMBDA, line);
        node->parameters = std::move(parameters);
        node->body = std::move(body);
        node->header = std::move(header);
        return node;
    }

    NodePtr make_comprehension(const int line,
                               std::vector<ComprehensionClause> clauses,
                               std::vector<NodePtr> element) {
        auto node = make_node(NodeKind::COMPREHENSION, line);
        node->clauses = std::move(clauses);
        node->body = std::move(element);
        return node;
    }

    ComprehensionClause make_clause(std::vector<NodePtr> targets,
                                    std::vector<NodePtr> iterable,
                                    std::vector<NodePtr> conditions) {
        ComprehensionClause clause;
        clause.targets = std::move(targets);
        clause.iterable = std::move(iterable);
        clause.conditions = std::move(conditions);
        return clause;
    }

    NodePtr make_assignment(std::vector<NodePtr> targets, std::vector<NodePtr> value, const int line) {
        auto node = make_node(NodeKind::ASSIGNMENT, line);
        node->targets = std::move(targets);
        node->body = std::move(value);
        return node;
    }

    NodePtr make_import(std::vector<core::ImportDeclaration::Alias> names, const int line) {
        auto node = make_node(NodeKind::IMPORT, line);
        node->names = std::move(names);
        return node;
    }

    NodePtr make_import_from(std::string module, const int level,
                             std::vector<core::ImportDeclaration::Alias> names, const int line) {
        auto node = make_node(NodeKind::IMPORT_FROM, line);
        node->module = std::move(module);
        node->level = level;
        node->wildcard = names.size() == 1 && names.front().name == "*";
        node->names = std::move(names);
        return node;
    }

    std::string to_string(const NodeKind kind) {
        switch (kind) {
            case NodeKind::MODULE: return "module";
            case NodeKind::BLOCK: return "block";
            case NodeKind::FUNCTION_DEF: return "function";
            case NodeKind::CLASS_DEF: return "class";
            case NodeKind::LAMBDA: return "lambda";
            case NodeKind::COMPREHENSION: return "comprehension";
            case NodeKind::ASSIGNMENT: return "assignment";
            case NodeKind::NAME: return "name";
            case NodeKind::ATTRIBUTE: return "attribute";
            case NodeKind::IMPORT: return "import";
            case NodeKind::IMPORT_FROM: return "import-from";
            default: return "unknown";
        }
    }

    std::size_t count_nodes(const SyntaxNode& node) {
        std::size_t total = 1;
        total += count_all(node.header);
        total += count_all(node.targets);
        total += count_all(node.body);
        for (const auto& clause : node.clauses) {
            total += count_all(clause.targets);
            total += count_all(clause.iterable);
            total += count_all(clause.conditions);
        }
        return total;
    }

}
