#ifndef PSA_GRAPH_GRAPH_ALGORITHMS_H
#define PSA_GRAPH_GRAPH_ALGORITHMS_H

#include "psa/core/types.h"
#include <cstddef>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace psa::graph {

    /**
     * A directed edge (from, to).
     */
    using Edge = std::pair<std::string, std::string>;

    /**
     * Finds representative cycles with a depth-first search.
     *
     * Roots and neighbors are visited in lexicographic order. Every back edge
     * to a node on the current path records the path suffix starting at that
     * node, closed by repeating it. Cycles with the same member set are
     * reported once, keeping the first one found. At least one cycle is
     * reported for every strongly connected component with more than one node.
     *
     * Uses an explicit stack, so deep import chains cannot overflow the call stack.
     *
     * @param graph The dependency graph to inspect.
     * @return Cycles in discovery order, each closed (first node repeated at the end).
     */
    std::vector<core::Cycle> find_cycles(const core::DependencyGraph& graph);

    /**
     * Computes the strongly connected components of the graph (Tarjan, iterative).
     *
     * Only components that contain a cycle are returned: more than one node,
     * or a single node with an edge to itself. Members of each component are
     * sorted and the components are ordered by their first member.
     *
     * @param graph The graph to analyze.
     * @return A vector of components, each component is a vector of node names.
     */
    std::vector<std::vector<std::string>> strongly_connected_components(
        const core::DependencyGraph& graph
    );

    /**
     * Enumerates every elementary cycle (Johnson's algorithm).
     *
     * Each cycle starts at its lexicographically smallest member and is closed
     * by repeating it, so no two results share a member sequence. Enumeration
     * stops once `max_cycles` cycles have been produced.
     *
     * @param graph The dependency graph.
     * @param max_cycles Upper bound on the number of cycles returned.
     * @return The cycles found, in discovery order.
     */
    std::vector<core::Cycle> find_elementary_cycles(
        const core::DependencyGraph& graph,
        std::size_t max_cycles
    );

    /**
     * Collects the edges that lie on at least one of the given closed cycles.
     */
    std::set<Edge> cycle_edges(const std::vector<core::Cycle>& cycles);

    /**
     * Computes the fan-out (number of distinct outgoing edges) for each node.
     *
     * @param graph The dependency graph.
     * @return A map from node to its fan-out count. Every node appears.
     */
    std::unordered_map<std::string, std::size_t> calculate_fanout(
        const core::DependencyGraph& graph
    );

    /**
     * Computes the fan-in (number of distinct incoming edges) for each node.
     *
     * @param graph The dependency graph.
     * @return A map from node to its fan-in count. Every node appears.
     */
    std::unordered_map<std::string, std::size_t> calculate_fanin(
        const core::DependencyGraph& graph
    );

}

#endif //PSA_GRAPH_GRAPH_ALGORITHMS_H
