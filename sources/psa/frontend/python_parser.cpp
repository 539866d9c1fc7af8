#include "psa/frontend/python_parser.h"
#include "psa/utils/file_utils.h"
#include "psa/utils/string_utils.h"

#include <cctype>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <optional>
#include <tree_sitter/api.h>

extern "C" {
    const TSLanguage* tree_sitter_python();
}

namespace psa::frontend {

    namespace {

        using syntax::NameContext;
        using syntax::NodePtr;
        using syntax::ParameterKind;

        std::string_view node_type(const TSNode node) {
            return ts_node_type(node);
        }

        int node_line(const TSNode node) {
            return static_cast<int>(ts_node_start_point(node).row) + 1;
        }

        TSNode field(const TSNode node, const char* name) {
            return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(std::strlen(name)));
        }

        bool present(const TSNode node) {
            return !ts_node_is_null(node);
        }

        bool same(const TSNode a, const TSNode b) {
            return present(a) && present(b) && ts_node_eq(a, b);
        }

        bool is_comprehension(const std::string_view type) {
            return type == "list_comprehension" || type == "set_comprehension" ||
                   type == "dictionary_comprehension" || type == "generator_expression";
        }

        bool is_target_container(const std::string_view type) {
            return type == "pattern_list" || type == "tuple_pattern" || type == "list_pattern" ||
                   type == "tuple" || type == "list" || type == "parenthesized_expression" ||
                   type == "expression_list" || type == "as_pattern_target" ||
                   type == "list_splat_pattern" || type == "list_splat";
        }

        /**
         * First ERROR or MISSING node in document order.
         */
        std::optional<TSNode> find_error(const TSNode node) {
            if (node_type(node) == "ERROR" || ts_node_is_missing(node)) {
                return node;
            }

            const uint32_t count = ts_node_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                const TSNode child = ts_node_child(node, i);
                if (ts_node_has_error(child) || ts_node_is_missing(child)) {
                    if (auto found = find_error(child)) {
                        return found;
                    }
                }
            }

            return std::nullopt;
        }

        /**
         * Converts a tree-sitter-python tree into syntax nodes.
         *
         * Node kinds without special meaning for scoping are flattened: their
         * named children are appended to the enclosing list.
         */
        class TreeConverter {
        public:
            explicit TreeConverter(const std::string_view source) : source_(source) {}

            NodePtr convert_module(const TSNode root) {
                std::vector<NodePtr> body;
                visit_children(root, body);
                return syntax::make_module(std::move(body));
            }

        private:
            std::string text(const TSNode node) const {
                const auto start = ts_node_start_byte(node);
                const auto end = ts_node_end_byte(node);
                return std::string(source_.substr(start, end - start));
            }

            // Dotted names may span line continuations.
            std::string dotted_text(const TSNode node) const {
                std::string cleaned;
                for (const char ch : text(node)) {
                    if (!std::isspace(static_cast<unsigned char>(ch)) && ch != '\\') {
                        cleaned.push_back(ch);
                    }
                }
                return cleaned;
            }

            void visit_children(const TSNode node, std::vector<NodePtr>& out) {
                const uint32_t count = ts_node_named_child_count(node);
                for (uint32_t i = 0; i < count; ++i) {
                    visit(ts_node_named_child(node, i), out);
                }
            }

            void visit(const TSNode node, std::vector<NodePtr>& out) {
                const auto type = node_type(node);

                if (type == "comment" || type == "future_import_statement" ||
                    type == "global_statement" || type == "nonlocal_statement" ||
                    type == "type_parameter") {
                    return;
                }

                if (type == "identifier") {
                    out.push_back(syntax::make_name(text(node), node_line(node)));
                } else if (type == "attribute") {
                    out.push_back(convert_attribute(node, NameContext::LOAD));
                } else if (type == "dotted_name") {
                    out.push_back(convert_dotted_reference(node));
                } else if (type == "function_definition") {
                    out.push_back(convert_function(node, {}));
                } else if (type == "class_definition") {
                    out.push_back(convert_class(node, {}));
                } else if (type == "decorated_definition") {
                    convert_decorated(node, out);
                } else if (type == "lambda") {
                    out.push_back(convert_lambda(node));
                } else if (is_comprehension(type)) {
                    out.push_back(convert_comprehension(node));
                } else if (type == "assignment" || type == "augmented_assignment") {
                    out.push_back(convert_assignment(node, type == "augmented_assignment"));
                } else if (type == "named_expression") {
                    out.push_back(convert_binding(node, field(node, "name"), field(node, "value")));
                } else if (type == "for_statement") {
                    convert_for(node, out);
                } else if (type == "as_pattern") {
                    out.push_back(convert_as_pattern(node));
                } else if (type == "except_clause" || type == "except_group_clause") {
                    convert_except(node, out);
                } else if (type == "import_statement") {
                    out.push_back(convert_import(node));
                } else if (type == "import_from_statement") {
                    out.push_back(convert_import_from(node));
                } else if (type == "keyword_argument") {
                    if (const auto value = field(node, "value"); present(value)) {
                        visit(value, out);
                    }
                } else if (type == "case_clause") {
                    convert_case_clause(node, out);
                } else {
                    visit_children(node, out);
                }
            }

            void visit_target(const TSNode node, std::vector<NodePtr>& out) {
                const auto type = node_type(node);

                if (type == "comment") {
                    return;
                }

                if (type == "identifier") {
                    out.push_back(syntax::make_name(text(node), node_line(node), NameContext::STORE));
                } else if (type == "attribute") {
                    out.push_back(convert_attribute(node, NameContext::STORE));
                } else if (is_target_container(type)) {
                    const uint32_t count = ts_node_named_child_count(node);
                    for (uint32_t i = 0; i < count; ++i) {
                        visit_target(ts_node_named_child(node, i), out);
                    }
                } else {
                    visit(node, out);
                }
            }

            NodePtr single(std::vector<NodePtr> nodes, const int line) {
                if (nodes.size() == 1) {
                    return std::move(nodes.front());
                }
                return syntax::make_block(std::move(nodes), line);
            }

            NodePtr convert_attribute(const TSNode node, const NameContext context) {
                std::vector<NodePtr> object;
                if (const auto target = field(node, "object"); present(target)) {
                    visit(target, object);
                }

                const auto attribute = field(node, "attribute");
                if (!present(attribute)) {
                    return single(std::move(object), node_line(node));
                }

                return syntax::make_attribute(single(std::move(object), node_line(node)),
                                              text(attribute), node_line(attribute), context);
            }

            NodePtr convert_dotted_reference(const TSNode node) {
                NodePtr chain;
                const uint32_t count = ts_node_named_child_count(node);
                for (uint32_t i = 0; i < count; ++i) {
                    const TSNode part = ts_node_named_child(node, i);
                    if (node_type(part) != "identifier") continue;

                    if (!chain) {
                        chain = syntax::make_name(text(part), node_line(part));
                    } else {
                        chain = syntax::make_attribute(std::move(chain), text(part), node_line(part));
                    }
                }
                return chain ? std::move(chain) : syntax::make_block({}, node_line(node));
            }

            void convert_parameters(const TSNode node,
                                    std::vector<syntax::Parameter>& parameters,
                                    std::vector<NodePtr>& header) {
                bool keyword_only = false;

                auto add = [&](const TSNode pattern) {
                    const auto type = node_type(pattern);
                    if (type == "identifier") {
                        parameters.push_back({text(pattern),
                                              keyword_only ? ParameterKind::KEYWORD_ONLY : ParameterKind::POSITIONAL,
                                              node_line(pattern)});
                    } else if (type == "list_splat_pattern" || type == "dictionary_splat_pattern") {
                        const bool positional = type == "list_splat_pattern";
                        const uint32_t count = ts_node_named_child_count(pattern);
                        for (uint32_t i = 0; i < count; ++i) {
                            const TSNode inner = ts_node_named_child(pattern, i);
                            if (node_type(inner) == "identifier") {
                                parameters.push_back({text(inner),
                                                      positional ? ParameterKind::VAR_POSITIONAL : ParameterKind::VAR_KEYWORD,
                                                      node_line(inner)});
                            }
                        }
                        if (positional) keyword_only = true;
                    }
                };

                const uint32_t count = ts_node_named_child_count(node);
                for (uint32_t i = 0; i < count; ++i) {
                    const TSNode child = ts_node_named_child(node, i);
                    const auto type = node_type(child);

                    if (type == "typed_parameter") {
                        const TSNode annotation = field(child, "type");
                        const uint32_t inner_count = ts_node_named_child_count(child);
                        for (uint32_t j = 0; j < inner_count; ++j) {
                            const TSNode inner = ts_node_named_child(child, j);
                            if (!same(inner, annotation)) add(inner);
                        }
                        if (present(annotation)) visit(annotation, header);
                    } else if (type == "default_parameter" || type == "typed_default_parameter") {
                        if (const auto name = field(child, "name"); present(name)) add(name);
                        if (const auto annotation = field(child, "type"); present(annotation)) visit(annotation, header);
                        if (const auto value = field(child, "value"); present(value)) visit(value, header);
                    } else if (type == "keyword_separator") {
                        keyword_only = true;
                    } else if (type != "positional_separator" && type != "comment") {
                        add(child);
                    }
                }
            }

            NodePtr convert_function(const TSNode node, std::vector<NodePtr> header) {
                std::vector<syntax::Parameter> parameters;
                if (const auto params = field(node, "parameters"); present(params)) {
                    convert_parameters(params, parameters, header);
                }
                if (const auto returns = field(node, "return_type"); present(returns)) {
                    visit(returns, header);
                }

                std::vector<NodePtr> body;
                if (const auto block = field(node, "body"); present(block)) {
                    visit(block, body);
                }

                const auto name = field(node, "name");
                return syntax::make_function(present(name) ? text(name) : std::string{}, node_line(node),
                                             std::move(parameters), std::move(body), std::move(header));
            }

            NodePtr convert_class(const TSNode node, std::vector<NodePtr> header) {
                if (const auto bases = field(node, "superclasses"); present(bases)) {
                    visit(bases, header);
                }

                std::vector<NodePtr> body;
                if (const auto block = field(node, "body"); present(block)) {
                    visit(block, body);
                }

                const auto name = field(node, "name");
                return syntax::make_class(present(name) ? text(name) : std::string{}, node_line(node),
                                          std::move(body), std::move(header));
            }

            void convert_decorated(const TSNode node, std::vector<NodePtr>& out) {
                std::vector<NodePtr> header;
                const TSNode definition = field(node, "definition");

                const uint32_t count = ts_node_named_child_count(node);
                for (uint32_t i = 0; i < count; ++i) {
                    const TSNode child = ts_node_named_child(node, i);
                    if (node_type(child) == "decorator") {
                        visit_children(child, header);
                    }
                }

                if (!present(definition)) {
                    for (auto& decorator : header) out.push_back(std::move(decorator));
                } else if (node_type(definition) == "class_definition") {
                    out.push_back(convert_class(definition, std::move(header)));
                } else {
                    out.push_back(convert_function(definition, std::move(header)));
                }
            }

            NodePtr convert_lambda(const TSNode node) {
                std::vector<syntax::Parameter> parameters;
                std::vector<NodePtr> header;
                if (const auto params = field(node, "parameters"); present(params)) {
                    convert_parameters(params, parameters, header);
                }

                std::vector<NodePtr> body;
                if (const auto expression = field(node, "body"); present(expression)) {
                    visit(expression, body);
                }

                return syntax::make_lambda(node_line(node), std::move(parameters), std::move(body), std::move(header));
            }

            NodePtr convert_comprehension(const TSNode node) {
                const TSNode body = field(node, "body");
                std::vector<NodePtr> element;
                std::vector<syntax::ComprehensionClause> clauses;

                const uint32_t count = ts_node_named_child_count(node);
                for (uint32_t i = 0; i < count; ++i) {
                    const TSNode child = ts_node_named_child(node, i);
                    const auto type = node_type(child);

                    if (same(child, body)) {
                        visit(child, element);
                    } else if (type == "for_in_clause") {
                        clauses.emplace_back();
                        const TSNode left = field(child, "left");
                        const uint32_t parts = ts_node_named_child_count(child);
                        for (uint32_t j = 0; j < parts; ++j) {
                            const TSNode part = ts_node_named_child(child, j);
                            if (same(part, left)) {
                                visit_target(part, clauses.back().targets);
                            } else {
                                visit(part, clauses.back().iterable);
                            }
                        }
                    } else if (type == "if_clause") {
                        if (clauses.empty()) clauses.emplace_back();
                        visit_children(child, clauses.back().conditions);
                    } else {
                        visit(child, element);
                    }
                }

                return syntax::make_comprehension(node_line(node), std::move(clauses), std::move(element));
            }

            NodePtr convert_assignment(const TSNode node, const bool augmented) {
                std::vector<NodePtr> targets;
                std::vector<NodePtr> value;

                const TSNode left = field(node, "left");
                if (const auto annotation = field(node, "type"); present(annotation)) visit(annotation, value);
                if (const auto right = field(node, "right"); present(right)) visit(right, value);
                if (augmented && present(left)) visit(left, value);
                if (present(left)) visit_target(left, targets);

                return syntax::make_assignment(std::move(targets), std::move(value), node_line(node));
            }

            NodePtr convert_binding(const TSNode node, const TSNode target, const TSNode source) {
                std::vector<NodePtr> targets;
                std::vector<NodePtr> value;
                if (present(source)) visit(source, value);
                if (present(target)) visit_target(target, targets);
                return syntax::make_assignment(std::move(targets), std::move(value), node_line(node));
            }

            void convert_for(const TSNode node, std::vector<NodePtr>& out) {
                out.push_back(convert_binding(node, field(node, "left"), field(node, "right")));
                if (const auto body = field(node, "body"); present(body)) visit(body, out);
                if (const auto alternative = field(node, "alternative"); present(alternative)) visit(alternative, out);
            }

            NodePtr convert_as_pattern(const TSNode node) {
                const TSNode alias = field(node, "alias");
                std::vector<NodePtr> targets;
                std::vector<NodePtr> value;

                const uint32_t count = ts_node_named_child_count(node);
                for (uint32_t i = 0; i < count; ++i) {
                    const TSNode child = ts_node_named_child(node, i);
                    if (same(child, alias)) {
                        visit_target(child, targets);
                    } else {
                        visit(child, value);
                    }
                }

                return syntax::make_assignment(std::move(targets), std::move(value), node_line(node));
            }

            void convert_except(const TSNode node, std::vector<NodePtr>& out) {
                std::vector<NodePtr> targets;
                bool after_as = false;

                const uint32_t count = ts_node_child_count(node);
                for (uint32_t i = 0; i < count; ++i) {
                    const TSNode child = ts_node_child(node, i);
                    if (!ts_node_is_named(child)) {
                        after_as = node_type(child) == "as";
                        continue;
                    }

                    if (after_as) {
                        visit_target(child, targets);
                        after_as = false;
                    } else {
                        visit(child, out);
                    }
                }

                if (!targets.empty()) {
                    out.push_back(syntax::make_assignment(std::move(targets), {}, node_line(node)));
                }
            }

            core::ImportDeclaration::Alias convert_alias(const TSNode node) {
                if (node_type(node) == "aliased_import") {
                    const auto name = field(node, "name");
                    const auto alias = field(node, "alias");
                    return {present(name) ? dotted_text(name) : std::string{},
                            present(alias) ? text(alias) : std::string{}};
                }
                return {dotted_text(node), {}};
            }

            NodePtr convert_import(const TSNode node) {
                std::vector<core::ImportDeclaration::Alias> names;

                const uint32_t count = ts_node_named_child_count(node);
                for (uint32_t i = 0; i < count; ++i) {
                    const TSNode child = ts_node_named_child(node, i);
                    const auto type = node_type(child);
                    if (type == "dotted_name" || type == "aliased_import") {
                        names.push_back(convert_alias(child));
                    }
                }

                return syntax::make_import(std::move(names), node_line(node));
            }

            NodePtr convert_import_from(const TSNode node) {
                const TSNode module_node = field(node, "module_name");
                std::string module;
                int level = 0;

                if (present(module_node) && node_type(module_node) == "relative_import") {
                    const uint32_t count = ts_node_named_child_count(module_node);
                    for (uint32_t i = 0; i < count; ++i) {
                        const TSNode part = ts_node_named_child(module_node, i);
                        if (node_type(part) == "import_prefix") {
                            for (const char ch : text(part)) {
                                if (ch == '.') ++level;
                            }
                        } else if (node_type(part) == "dotted_name") {
                            module = dotted_text(part);
                        }
                    }
                } else if (present(module_node)) {
                    module = dotted_text(module_node);
                }

                std::vector<core::ImportDeclaration::Alias> names;
                const uint32_t count = ts_node_named_child_count(node);
                for (uint32_t i = 0; i < count; ++i) {
                    const TSNode child = ts_node_named_child(node, i);
                    if (same(child, module_node)) continue;

                    const auto type = node_type(child);
                    if (type == "wildcard_import") {
                        names.push_back({"*", {}});
                    } else if (type == "dotted_name" || type == "aliased_import") {
                        names.push_back(convert_alias(child));
                    }
                }

                return syntax::make_import_from(std::move(module), level, std::move(names), node_line(node));
            }

            void convert_case_clause(const TSNode node, std::vector<NodePtr>& out) {
                std::vector<NodePtr> captures;

                const uint32_t count = ts_node_named_child_count(node);
                for (uint32_t i = 0; i < count; ++i) {
                    const TSNode child = ts_node_named_child(node, i);
                    if (node_type(child) == "case_pattern") {
                        visit_pattern(child, out, captures);
                    } else {
                        visit(child, out);
                    }
                }

                if (!captures.empty()) {
                    out.push_back(syntax::make_assignment(std::move(captures), {}, node_line(node)));
                }
            }

            // Bare names in patterns capture; dotted names and class patterns read.
            void visit_pattern(const TSNode node, std::vector<NodePtr>& loads, std::vector<NodePtr>& captures) {
                const auto type = node_type(node);

                if (type == "comment") {
                    return;
                }

                if (type == "identifier") {
                    if (text(node) != "_") {
                        captures.push_back(syntax::make_name(text(node), node_line(node), NameContext::STORE));
                    }
                    return;
                }

                if (type == "dotted_name") {
                    if (ts_node_named_child_count(node) == 1) {
                        visit_pattern(ts_node_named_child(node, 0), loads, captures);
                    } else {
                        loads.push_back(convert_dotted_reference(node));
                    }
                    return;
                }

                if (type == "as_pattern") {
                    const TSNode alias = field(node, "alias");
                    const uint32_t count = ts_node_named_child_count(node);
                    for (uint32_t i = 0; i < count; ++i) {
                        const TSNode child = ts_node_named_child(node, i);
                        if (same(child, alias)) {
                            visit_target(child, captures);
                        } else {
                            visit_pattern(child, loads, captures);
                        }
                    }
                    return;
                }

                const uint32_t count = ts_node_named_child_count(node);
                for (uint32_t i = 0; i < count; ++i) {
                    const TSNode child = ts_node_named_child(node, i);
                    if (i == 0 && type == "class_pattern" && node_type(child) == "dotted_name") {
                        loads.push_back(convert_dotted_reference(child));
                    } else if (i == 0 && type == "keyword_pattern" && node_type(child) == "identifier") {
                        continue;
                    } else {
                        visit_pattern(child, loads, captures);
                    }
                }
            }

            std::string_view source_;
        };

    }

    core::Result<syntax::NodePtr> PythonParser::parse(std::string_view source, const std::string& path) const {
        using ParseResult = core::Result<syntax::NodePtr>;

        if (!utils::is_valid_utf8(source)) {
            return ParseResult::failure(core::make_error_with_context(
                core::ErrorCode::FILE_DECODE_ERROR, "File is not valid UTF-8: " + path, path));
        }

        if (utils::starts_with(source, "\xEF\xBB\xBF")) {
            source.remove_prefix(3);
        }

        if (source.size() > std::numeric_limits<uint32_t>::max()) {
            return ParseResult::failure(core::make_error_with_context(
                core::ErrorCode::RESOURCE_EXHAUSTED, "File too large to parse: " + path, path));
        }

        const std::unique_ptr<TSParser, decltype(&ts_parser_delete)> parser(ts_parser_new(), &ts_parser_delete);
        if (!parser || !ts_parser_set_language(parser.get(), tree_sitter_python())) {
            return ParseResult::failure(core::ErrorCode::INTERNAL_ERROR,
                                        "Failed to initialize the tree-sitter Python parser");
        }

        const std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree(
            ts_parser_parse_string(parser.get(), nullptr, source.data(), static_cast<uint32_t>(source.size())),
            &ts_tree_delete);
        if (!tree) {
            return ParseResult::failure(core::make_error_with_context(
                core::ErrorCode::FILE_PARSE_ERROR, "Parser produced no tree for " + path, path));
        }

        const TSNode root = ts_tree_root_node(tree.get());
        if (ts_node_has_error(root)) {
            const auto error = find_error(root);
            const int line = error ? node_line(*error) : 1;
            const char* what = error && ts_node_is_missing(*error) ? "missing token" : "syntax error";
            return ParseResult::failure(core::make_error_with_context(
                core::ErrorCode::FILE_PARSE_ERROR,
                std::string(what) + " at line " + std::to_string(line),
                path));
        }

        try {
            TreeConverter converter(source);
            return ParseResult::success(converter.convert_module(root));
        } catch (const std::exception& e) {
            return ParseResult::failure(core::make_error_with_context(
                core::ErrorCode::INTERNAL_ERROR, std::string("Syntax tree conversion failed: ") + e.what(), path));
        }
    }

    core::Result<syntax::NodePtr> PythonParser::parse_file(const std::string& path) const {
        const auto content = utils::read_file(path);
        if (!content) {
            return core::Result<syntax::NodePtr>::failure(core::make_error_with_context(
                core::ErrorCode::FILE_READ_ERROR, "Cannot read file: " + path, path));
        }

        return parse(*content, path);
    }

}
