#include <gtest/gtest.h>
#include "psa/analysis/symbol_collector.h"
#include <algorithm>

using namespace psa::analysis;
using namespace psa::core;
using namespace psa::syntax;

class SymbolCollectorTest : public ::testing::Test {
protected:
    static CollectedFile collect(const NodePtr& module,
                                 const WildcardPolicy policy = WildcardPolicy::FLAG) {
        const SymbolCollector collector(policy);
        auto result = collector.collect("mod.py", *module);
        EXPECT_TRUE(result.is_success());
        return std::move(result).value();
    }

    static std::vector<std::string> pending_names(const CollectedFile& file) {
        std::vector<std::string> names;
        for (const auto& use : file.table.pending_uses()) {
            names.push_back(use.name);
        }
        std::ranges::sort(names);
        return names;
    }

    static const Definition* find_definition(const CollectedFile& file, const std::string& name) {
        const auto& definitions = file.table.definitions();
        const auto it = std::ranges::find(definitions, name, &Definition::name);
        return it == definitions.end() ? nullptr : &*it;
    }
};

TEST_F(SymbolCollectorTest, RejectsNonModuleRoot) {
    const SymbolCollector collector;
    const auto name = make_name("x", 1);

    const auto result = collector.collect("mod.py", *name);
    ASSERT_TRUE(result.is_failure());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_ARGUMENT);
}

TEST_F(SymbolCollectorTest, FunctionParametersAreLocal) {
    // def f(a, *args):
    //     return a + args + b
    const auto module = make_module(nodes(
        make_function("f", 1,
                      {{"a", ParameterKind::POSITIONAL, 1}, {"args", ParameterKind::VAR_POSITIONAL, 1}},
                      nodes(make_name("a", 2), make_name("args", 2), make_name("b", 2)))
    ));

    const auto file = collect(module);

    EXPECT_EQ(pending_names(file), std::vector<std::string>{"b"});
    const auto* f = find_definition(file, "f");
    ASSERT_NE(f, nullptr);
    EXPECT_EQ(f->kind, DefinitionKind::FUNCTION);
    EXPECT_TRUE(f->is_module_level());

    const auto* a = find_definition(file, "a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->kind, DefinitionKind::PARAMETER);
    EXPECT_EQ(a->scope_kind, ScopeKind::FUNCTION);
}

TEST_F(SymbolCollectorTest, DecoratorsEvaluatedInEnclosingScope) {
    // @decorator
    // def f(x=x): ...
    const auto module = make_module(nodes(
        make_function("f", 2, {{"x", ParameterKind::POSITIONAL, 2}}, {},
                      nodes(make_name("decorator", 1), make_name("x", 2)))
    ));

    const auto file = collect(module);

    // Both header names are resolved at module level, where neither is bound.
    EXPECT_EQ(pending_names(file), (std::vector<std::string>{"decorator", "x"}));
}

TEST_F(SymbolCollectorTest, ClassAttributesInvisibleToMethods) {
    // class C(Base):
    //     limit = 10
    //     def m(self):
    //         return limit
    const auto module = make_module(nodes(
        make_class("C", 1,
                   nodes(make_assignment(nodes(make_name("limit", 2, NameContext::STORE)),
                                         nodes(), 2),
                         make_function("m", 3, {{"self", ParameterKind::POSITIONAL, 3}},
                                       nodes(make_name("limit", 4)))),
                   nodes(make_name("Base", 1)))
    ));

    const auto file = collect(module);

    EXPECT_EQ(pending_names(file), (std::vector<std::string>{"Base", "limit"}));
    const auto* limit = find_definition(file, "limit");
    ASSERT_NE(limit, nullptr);
    EXPECT_EQ(limit->scope_kind, ScopeKind::CLASS);
}

TEST_F(SymbolCollectorTest, ComprehensionTargetsAreScoped) {
    // squares = [x * x for x in items if x]
    // print(x)
    std::vector<ComprehensionClause> clauses;
    clauses.push_back(make_clause(nodes(make_name("x", 1, NameContext::STORE)),
                                  nodes(make_name("items", 1)),
                                  nodes(make_name("x", 1))));

    const auto module = make_module(nodes(
        make_assignment(nodes(make_name("squares", 1, NameContext::STORE)),
                        nodes(make_comprehension(1, std::move(clauses),
                                                 nodes(make_name("x", 1), make_name("x", 1)))),
                        1),
        make_name("print", 2),
        make_name("x", 2)
    ));

    const auto file = collect(module);

    EXPECT_EQ(pending_names(file), (std::vector<std::string>{"items", "print", "x"}));
    ASSERT_EQ(file.table.pending_uses().size(), 3u);
}

TEST_F(SymbolCollectorTest, LambdaParametersAreScoped) {
    // key = lambda item, n=default: item + n
    const auto module = make_module(nodes(
        make_assignment(nodes(make_name("key", 1, NameContext::STORE)),
                        nodes(make_lambda(1,
                                          {{"item", ParameterKind::POSITIONAL, 1},
                                           {"n", ParameterKind::POSITIONAL, 1}},
                                          nodes(make_name("item", 1), make_name("n", 1)),
                                          nodes(make_name("default", 1)))),
                        1)
    ));

    const auto file = collect(module);
    EXPECT_EQ(pending_names(file), std::vector<std::string>{"default"});
}

TEST_F(SymbolCollectorTest, AttributeReadsCountAsReferences) {
    // obj.method()
    const auto module = make_module(nodes(
        make_attribute(make_name("obj", 1), "method", 1)
    ));

    const auto file = collect(module);

    EXPECT_EQ(pending_names(file), std::vector<std::string>{"obj"});
    EXPECT_TRUE(file.table.referenced_names().contains("method"));
    EXPECT_TRUE(file.table.referenced_names().contains("obj"));
}

TEST_F(SymbolCollectorTest, AttributeStoreIsNotAReference) {
    // self.value = 1
    const auto module = make_module(nodes(
        make_assignment(nodes(make_attribute(make_name("self", 1), "value", 1, NameContext::STORE)),
                        nodes(), 1)
    ));

    const auto file = collect(module);
    EXPECT_FALSE(file.table.referenced_names().contains("value"));
    EXPECT_TRUE(file.table.referenced_names().contains("self"));
}

TEST_F(SymbolCollectorTest, ImportsBindAliasOrFirstSegment) {
    // import os.path
    // import numpy as np
    // from .utils import helper as h, other
    const auto module = make_module(nodes(
        make_import({{"os.path", ""}, {"numpy", "np"}}, 1),
        make_import_from("utils", 1, {{"helper", "h"}, {"other", ""}}, 2)
    ));

    const auto file = collect(module);

    for (const auto* name : {"os", "np", "h", "other"}) {
        const auto* definition = find_definition(file, name);
        ASSERT_NE(definition, nullptr) << name;
        EXPECT_EQ(definition->kind, DefinitionKind::IMPORT_ALIAS);
    }
    EXPECT_EQ(find_definition(file, "numpy"), nullptr);
    EXPECT_EQ(find_definition(file, "helper"), nullptr);

    ASSERT_EQ(file.imports.size(), 2u);
    EXPECT_FALSE(file.imports[0].is_from_import);
    EXPECT_EQ(file.imports[0].names.size(), 2u);
    EXPECT_TRUE(file.imports[1].is_from_import);
    EXPECT_EQ(file.imports[1].module, "utils");
    EXPECT_EQ(file.imports[1].level, 1);
    EXPECT_EQ(file.imports[1].line, 2);
}

TEST_F(SymbolCollectorTest, WildcardImportFlagged) {
    const auto module = make_module(nodes(make_import_from("pkg", 0, {{"*", ""}}, 4)));

    const auto flagged = collect(module, WildcardPolicy::FLAG);
    ASSERT_EQ(flagged.diagnostics.size(), 1u);
    EXPECT_EQ(flagged.diagnostics[0].kind, DiagnosticKind::WILDCARD_IMPORT);
    EXPECT_EQ(flagged.diagnostics[0].line, 4);
    EXPECT_NE(flagged.diagnostics[0].message.find("'pkg'"), std::string::npos);
    EXPECT_TRUE(flagged.table.definitions().empty());
    ASSERT_EQ(flagged.imports.size(), 1u);
    EXPECT_TRUE(flagged.imports[0].is_wildcard);

    const auto ignored = collect(module, WildcardPolicy::IGNORE);
    EXPECT_TRUE(ignored.diagnostics.empty());
    ASSERT_EQ(ignored.imports.size(), 1u);
}

TEST_F(SymbolCollectorTest, AssignmentValueVisitedBeforeTargets) {
    // x = x + 1  (x undefined before this statement, but bound in the same scope)
    const auto module = make_module(nodes(
        make_assignment(nodes(make_name("x", 1, NameContext::STORE)), nodes(make_name("x", 1)), 1)
    ));

    const auto file = collect(module);
    EXPECT_TRUE(file.table.pending_uses().empty());
    ASSERT_EQ(file.table.uses().size(), 1u);
}
