#include <gtest/gtest.h>
#include "psa/core/types.h"

using namespace psa::core;

TEST(DependencyGraphTest, AddEdgeCreatesNodes) {
    DependencyGraph graph;
    EXPECT_TRUE(graph.add_edge("a.py", "b.py", 3));

    EXPECT_TRUE(graph.has_node("a.py"));
    EXPECT_TRUE(graph.has_node("b.py"));
    EXPECT_TRUE(graph.has_edge("a.py", "b.py"));
    EXPECT_FALSE(graph.has_edge("b.py", "a.py"));
    EXPECT_EQ(graph.node_count(), 2u);
    EXPECT_EQ(graph.edge_count(), 1u);
}

TEST(DependencyGraphTest, DuplicateEdgeRecordedOnce) {
    DependencyGraph graph;
    EXPECT_TRUE(graph.add_edge("a.py", "b.py", 1));
    EXPECT_FALSE(graph.add_edge("a.py", "b.py", 7));

    EXPECT_EQ(graph.edge_count(), 1u);
    ASSERT_EQ(graph.get_edges("a.py").size(), 1u);
    EXPECT_EQ(graph.get_edges("a.py")[0].line_number, 1);
}

TEST(DependencyGraphTest, NeighborsAreSorted) {
    DependencyGraph graph;
    graph.add_edge("main.py", "z.py");
    graph.add_edge("main.py", "a.py");
    graph.add_edge("other.py", "a.py");

    EXPECT_EQ(graph.get_dependencies("main.py"), (std::vector<std::string>{"a.py", "z.py"}));
    EXPECT_EQ(graph.get_reverse_dependencies("a.py"), (std::vector<std::string>{"main.py", "other.py"}));
    EXPECT_EQ(graph.get_all_nodes(), (std::vector<std::string>{"a.py", "main.py", "other.py", "z.py"}));
    EXPECT_TRUE(graph.get_dependencies("unknown.py").empty());
}

TEST(DependencyGraphTest, Clear) {
    DependencyGraph graph;
    graph.add_edge("a.py", "b.py");
    graph.clear();

    EXPECT_EQ(graph.node_count(), 0u);
    EXPECT_EQ(graph.edge_count(), 0u);
}

TEST(AnalysisReportTest, HasFindings) {
    AnalysisReport report;
    EXPECT_FALSE(report.has_findings());

    report.diagnostics.push_back(Diagnostic{DiagnosticKind::FILE_SKIPPED, "bad.py", 0, "syntax error"});
    EXPECT_FALSE(report.has_findings());

    report.unused_symbols.push_back(UnusedSymbol{"a.py", 1, "helper", DefinitionKind::FUNCTION});
    EXPECT_TRUE(report.has_findings());
}

TEST(TypesTest, KindNames) {
    EXPECT_EQ(to_string(ScopeKind::COMPREHENSION), "comprehension");
    EXPECT_EQ(to_string(DefinitionKind::IMPORT_ALIAS), "import");
    EXPECT_EQ(to_string(DiagnosticKind::WILDCARD_IMPORT), "wildcard-import");
}
