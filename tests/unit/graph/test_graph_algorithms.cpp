#include <gtest/gtest.h>
#include "psa/graph/graph_algorithms.h"
#include <algorithm>

using namespace psa::graph;
using namespace psa::core;

class GraphAlgorithmsTest : public ::testing::Test {
protected:
    static DependencyGraph create_dag() {
        DependencyGraph graph;
        graph.add_edge("a", "b");
        graph.add_edge("a", "c");
        graph.add_edge("b", "d");
        graph.add_edge("c", "d");
        return graph;
    }

    static DependencyGraph create_two_cycle() {
        DependencyGraph graph;
        graph.add_edge("a", "b");
        graph.add_edge("b", "a");
        graph.add_edge("c", "a");
        return graph;
    }

    // Two elementary cycles sharing node "a": a->b->a and a->c->a.
    static DependencyGraph create_bowtie() {
        DependencyGraph graph;
        graph.add_edge("a", "b");
        graph.add_edge("b", "a");
        graph.add_edge("a", "c");
        graph.add_edge("c", "a");
        return graph;
    }

    // a->b->c->a plus the chord a->c: elementary cycles a->b->c->a and a->c->a.
    static DependencyGraph create_triangle_with_chord() {
        DependencyGraph graph;
        graph.add_edge("a", "b");
        graph.add_edge("b", "c");
        graph.add_edge("c", "a");
        graph.add_edge("a", "c");
        return graph;
    }

    static bool is_closed(const Cycle& cycle) {
        return cycle.size() >= 2 && cycle.front() == cycle.back();
    }
};

TEST_F(GraphAlgorithmsTest, FindCycles_Acyclic) {
    EXPECT_TRUE(find_cycles(create_dag()).empty());
    EXPECT_TRUE(find_cycles(DependencyGraph{}).empty());
}

TEST_F(GraphAlgorithmsTest, FindCycles_TwoNodeLoop) {
    const auto cycles = find_cycles(create_two_cycle());

    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0], (Cycle{"a", "b", "a"}));
}

TEST_F(GraphAlgorithmsTest, FindCycles_EveryCycleIsClosedAndRealEdges) {
    const auto graph = create_triangle_with_chord();
    const auto cycles = find_cycles(graph);

    ASSERT_FALSE(cycles.empty());
    for (const auto& cycle : cycles) {
        EXPECT_TRUE(is_closed(cycle));
        for (std::size_t i = 0; i + 1 < cycle.size(); ++i) {
            EXPECT_TRUE(graph.has_edge(cycle[i], cycle[i + 1]));
        }
    }
}

TEST_F(GraphAlgorithmsTest, FindCycles_DeduplicatesByMemberSet) {
    const auto cycles = find_cycles(create_bowtie());

    ASSERT_EQ(cycles.size(), 2u);
    EXPECT_EQ(cycles[0], (Cycle{"a", "b", "a"}));
    EXPECT_EQ(cycles[1], (Cycle{"a", "c", "a"}));
}

TEST_F(GraphAlgorithmsTest, FindCycles_SelfLoop) {
    DependencyGraph graph;
    graph.add_edge("a", "a");

    const auto cycles = find_cycles(graph);
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0], (Cycle{"a", "a"}));
}

TEST_F(GraphAlgorithmsTest, FindCycles_DeepChainDoesNotRecurse) {
    DependencyGraph graph;
    constexpr int length = 20000;
    for (int i = 0; i < length; ++i) {
        graph.add_edge("m" + std::to_string(i), "m" + std::to_string(i + 1));
    }
    graph.add_edge("m" + std::to_string(length), "m0");

    const auto cycles = find_cycles(graph);
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0].size(), static_cast<std::size_t>(length + 2));
}

TEST_F(GraphAlgorithmsTest, StronglyConnectedComponents) {
    DependencyGraph graph = create_two_cycle();
    graph.add_edge("d", "e");
    graph.add_edge("x", "x");

    const auto components = strongly_connected_components(graph);

    ASSERT_EQ(components.size(), 2u);
    EXPECT_EQ(components[0], (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(components[1], (std::vector<std::string>{"x"}));
}

TEST_F(GraphAlgorithmsTest, ElementaryCycles_FindsEveryCycle) {
    const auto cycles = find_elementary_cycles(create_triangle_with_chord(), 100);

    ASSERT_EQ(cycles.size(), 2u);
    EXPECT_NE(std::ranges::find(cycles, Cycle{"a", "b", "c", "a"}), cycles.end());
    EXPECT_NE(std::ranges::find(cycles, Cycle{"a", "c", "a"}), cycles.end());
}

TEST_F(GraphAlgorithmsTest, ElementaryCycles_RespectsCap) {
    DependencyGraph graph;
    const std::vector<std::string> nodes{"a", "b", "c", "d"};
    for (const auto& from : nodes) {
        for (const auto& to : nodes) {
            if (from != to) graph.add_edge(from, to);
        }
    }

    EXPECT_EQ(find_elementary_cycles(graph, 5).size(), 5u);
    EXPECT_EQ(find_elementary_cycles(graph, 1000).size(), 20u);
    EXPECT_TRUE(find_elementary_cycles(graph, 0).empty());
}

TEST_F(GraphAlgorithmsTest, ElementaryCycles_DeepRingDoesNotRecurse) {
    DependencyGraph graph;
    constexpr int length = 20000;
    for (int i = 0; i < length; ++i) {
        graph.add_edge("m" + std::to_string(i), "m" + std::to_string(i + 1));
    }
    graph.add_edge("m" + std::to_string(length), "m0");

    const auto cycles = find_elementary_cycles(graph, 1000);
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0].size(), static_cast<std::size_t>(length + 2));
    EXPECT_EQ(cycles[0].front(), cycles[0].back());
}

TEST_F(GraphAlgorithmsTest, ElementaryCycles_LongAcyclicChain) {
    DependencyGraph graph;
    constexpr int length = 200000;
    for (int i = 0; i < length; ++i) {
        graph.add_edge("m" + std::to_string(i), "m" + std::to_string(i + 1));
    }

    EXPECT_TRUE(find_elementary_cycles(graph, 1000).empty());
}

TEST_F(GraphAlgorithmsTest, ElementaryCycles_SelfLoopAndSeparateComponents) {
    DependencyGraph graph = create_two_cycle();
    graph.add_edge("x", "x");
    graph.add_edge("b", "x");

    const auto cycles = find_elementary_cycles(graph, 100);

    ASSERT_EQ(cycles.size(), 2u);
    EXPECT_NE(std::ranges::find(cycles, Cycle{"a", "b", "a"}), cycles.end());
    EXPECT_NE(std::ranges::find(cycles, Cycle{"x", "x"}), cycles.end());
}

TEST_F(GraphAlgorithmsTest, CycleEdges) {
    const auto edges = cycle_edges({Cycle{"a", "b", "a"}});

    EXPECT_EQ(edges.size(), 2u);
    EXPECT_TRUE(edges.contains(Edge{"a", "b"}));
    EXPECT_TRUE(edges.contains(Edge{"b", "a"}));
    EXPECT_FALSE(edges.contains(Edge{"c", "a"}));
}

TEST_F(GraphAlgorithmsTest, FanInFanOut) {
    const auto graph = create_dag();
    const auto fanout = calculate_fanout(graph);
    const auto fanin = calculate_fanin(graph);

    EXPECT_EQ(fanout.at("a"), 2u);
    EXPECT_EQ(fanout.at("d"), 0u);
    EXPECT_EQ(fanin.at("a"), 0u);
    EXPECT_EQ(fanin.at("d"), 2u);
}
