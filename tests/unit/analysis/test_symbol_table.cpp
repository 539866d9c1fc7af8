#include <gtest/gtest.h>
#include "psa/analysis/symbol_table.h"

using namespace psa::analysis;
using namespace psa::core;

TEST(SymbolTableTest, StartsWithModuleScope) {
    const SymbolTable table("mod.py");

    ASSERT_EQ(table.scopes().size(), 1u);
    EXPECT_EQ(table.scopes()[0].kind, ScopeKind::MODULE);
    EXPECT_FALSE(table.scopes()[0].parent.has_value());
    EXPECT_EQ(table.current_scope(), 0u);
    EXPECT_EQ(table.depth(), 1u);
    EXPECT_EQ(table.file(), "mod.py");
}

TEST(SymbolTableTest, CannotExitModuleScope) {
    SymbolTable table("mod.py");

    const auto result = table.exit_scope();
    ASSERT_TRUE(result.is_failure());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_STATE);
}

TEST(SymbolTableTest, NestedScopesRecordParents) {
    SymbolTable table("mod.py");

    const auto function = table.enter_scope(ScopeKind::FUNCTION, 2);
    const auto lambda = table.enter_scope(ScopeKind::LAMBDA, 3);

    EXPECT_EQ(table.scopes()[function].parent, std::optional<std::size_t>{0});
    EXPECT_EQ(table.scopes()[lambda].parent, std::optional<std::size_t>{function});
    EXPECT_EQ(table.depth(), 3u);

    ASSERT_TRUE(table.exit_scope().is_success());
    EXPECT_EQ(table.current_scope(), function);
}

TEST(SymbolTableTest, UseBeforeDefinitionResolves) {
    SymbolTable table("mod.py");
    table.reference("helper", 1);
    table.bind("helper", 5, DefinitionKind::FUNCTION);
    table.finalize();

    EXPECT_TRUE(table.pending_uses().empty());
    EXPECT_TRUE(table.is_finalized());
}

TEST(SymbolTableTest, InnerScopeSeesOuterBindings) {
    SymbolTable table("mod.py");
    table.bind("config", 1, DefinitionKind::VARIABLE);
    table.enter_scope(ScopeKind::FUNCTION, 2);
    table.reference("config", 3);
    table.finalize();

    EXPECT_TRUE(table.pending_uses().empty());
    EXPECT_EQ(table.lookup("config", 1), std::optional<std::size_t>{0});
}

TEST(SymbolTableTest, OuterScopeDoesNotSeeInnerBindings) {
    SymbolTable table("mod.py");
    table.enter_scope(ScopeKind::FUNCTION, 1);
    table.bind("local", 2, DefinitionKind::VARIABLE);
    ASSERT_TRUE(table.exit_scope().is_success());
    table.reference("local", 5);
    table.finalize();

    ASSERT_EQ(table.pending_uses().size(), 1u);
    EXPECT_EQ(table.pending_uses()[0].name, "local");
    EXPECT_EQ(table.pending_uses()[0].line, 5);
}

TEST(SymbolTableTest, ClassScopeHiddenFromMethods) {
    SymbolTable table("mod.py");
    table.enter_scope(ScopeKind::CLASS, 1);
    table.bind("attr", 2, DefinitionKind::VARIABLE);
    table.reference("attr", 3);
    table.enter_scope(ScopeKind::FUNCTION, 4);
    table.reference("attr", 5);
    table.finalize();

    ASSERT_EQ(table.pending_uses().size(), 1u);
    EXPECT_EQ(table.pending_uses()[0].line, 5);
}

TEST(SymbolTableTest, AttributeReferencesNeverPending) {
    SymbolTable table("mod.py");
    table.reference_attribute("method", 1);
    table.finalize();

    EXPECT_TRUE(table.pending_uses().empty());
    EXPECT_TRUE(table.referenced_names().contains("method"));
    EXPECT_EQ(table.attribute_uses().size(), 1u);
    EXPECT_TRUE(table.uses().empty());
}

TEST(SymbolTableTest, DefinitionsCarryScopeKind) {
    SymbolTable table("mod.py");
    table.bind("top", 1, DefinitionKind::VARIABLE);
    table.enter_scope(ScopeKind::FUNCTION, 2);
    table.bind("inner", 3, DefinitionKind::VARIABLE);

    ASSERT_EQ(table.definitions().size(), 2u);
    EXPECT_TRUE(table.definitions()[0].is_module_level());
    EXPECT_FALSE(table.definitions()[1].is_module_level());
    EXPECT_EQ(table.definitions()[1].scope_kind, ScopeKind::FUNCTION);
}

TEST(SymbolTableTest, RecordingAfterFinalizeInvalidates) {
    SymbolTable table("mod.py");
    table.finalize();
    table.reference("late", 9);
    EXPECT_FALSE(table.is_finalized());

    table.finalize();
    ASSERT_EQ(table.pending_uses().size(), 1u);
}
