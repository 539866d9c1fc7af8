#include <gtest/gtest.h>
#include "psa/syntax/syntax_node.h"

using namespace psa::syntax;

TEST(SyntaxNodeTest, BuildersSetKindAndFields) {
    const auto name = make_name("x", 3, NameContext::STORE);
    EXPECT_EQ(name->kind, NodeKind::NAME);
    EXPECT_EQ(name->identifier, "x");
    EXPECT_EQ(name->line, 3);
    EXPECT_EQ(name->context, NameContext::STORE);

    const auto attribute = make_attribute(make_name("os", 1), "path", 1);
    EXPECT_EQ(attribute->kind, NodeKind::ATTRIBUTE);
    EXPECT_EQ(attribute->identifier, "path");
    ASSERT_EQ(attribute->body.size(), 1u);
    EXPECT_EQ(attribute->body[0]->identifier, "os");
}

TEST(SyntaxNodeTest, ImportFromWildcard) {
    const auto wildcard = make_import_from("pkg", 1, {{"*", ""}}, 2);
    EXPECT_TRUE(wildcard->wildcard);
    EXPECT_EQ(wildcard->level, 1);

    const auto named = make_import_from("pkg", 0, {{"x", "y"}}, 2);
    EXPECT_FALSE(named->wildcard);
    ASSERT_EQ(named->names.size(), 1u);
    EXPECT_EQ(named->names[0].alias, "y");
}

TEST(SyntaxNodeTest, CountNodesIncludesClauses) {
    std::vector<ComprehensionClause> clauses;
    clauses.push_back(make_clause(nodes(make_name("x", 1, NameContext::STORE)),
                                  nodes(make_name("items", 1)),
                                  nodes(make_name("x", 1))));

    const auto module = make_module(nodes(
        make_function("f", 1, {}, nodes(make_comprehension(1, std::move(clauses), nodes(make_name("x", 1)))))
    ));

    // module, function, comprehension, three clause names, element
    EXPECT_EQ(count_nodes(*module), 7u);
    EXPECT_EQ(to_string(NodeKind::COMPREHENSION), "comprehension");
}
