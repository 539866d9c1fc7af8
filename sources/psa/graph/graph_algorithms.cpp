#include "psa/graph/graph_algorithms.h"
#include <algorithm>
#include <ranges>
#include <unordered_set>

namespace psa::graph {

    namespace {

        struct Frame {
            std::string node;
            std::vector<std::string> dependencies;
            std::size_t next = 0;
        };

        std::vector<std::string> member_key(const core::Cycle& cycle) {
            std::vector<std::string> key(cycle.begin(), cycle.end() - 1);
            std::ranges::sort(key);
            return key;
        }

        constexpr std::size_t no_component = static_cast<std::size_t>(-1);

        /**
         * Iterative Tarjan over the subgraph induced by nodes `first..n-1`.
         * Nodes in a component that can hold a cycle (two or more members, or
         * a self-loop) get that component's id, the rest get no_component.
         */
        std::vector<std::size_t> cyclic_components_from(
            const std::vector<std::vector<std::size_t>>& adjacency,
            const std::size_t first
        ) {
            struct IndexFrame {
                std::size_t node;
                std::size_t next = 0;
            };

            const std::size_t n = adjacency.size();
            std::vector<std::size_t> component(n, no_component);
            std::vector<std::size_t> index(n, no_component);
            std::vector<std::size_t> lowlink(n, 0);
            std::vector<bool> on_stack(n, false);
            std::vector<std::size_t> stack;
            std::vector<IndexFrame> calls;
            std::size_t counter = 0;
            std::size_t next_component = 0;

            auto visit = [&](const std::size_t v) {
                index[v] = lowlink[v] = counter++;
                stack.push_back(v);
                on_stack[v] = true;
                calls.push_back(IndexFrame{v});
            };

            for (std::size_t root = first; root < n; ++root) {
                if (index[root] != no_component) {
                    continue;
                }

                visit(root);

                while (!calls.empty()) {
                    auto& frame = calls.back();
                    const auto v = frame.node;

                    if (frame.next < adjacency[v].size()) {
                        const auto w = adjacency[v][frame.next++];
                        if (w < first) continue;
                        if (index[w] == no_component) {
                            visit(w);
                        } else if (on_stack[w]) {
                            lowlink[v] = std::min(lowlink[v], index[w]);
                        }
                        continue;
                    }

                    calls.pop_back();

                    if (lowlink[v] == index[v]) {
                        std::vector<std::size_t> members;
                        std::size_t w;
                        do {
                            w = stack.back();
                            stack.pop_back();
                            on_stack[w] = false;
                            members.push_back(w);
                        } while (w != v);

                        if (members.size() > 1 || std::ranges::find(adjacency[v], v) != adjacency[v].end()) {
                            for (const auto member : members) {
                                component[member] = next_component;
                            }
                            ++next_component;
                        }
                    }

                    if (!calls.empty()) {
                        const auto parent = calls.back().node;
                        lowlink[parent] = std::min(lowlink[parent], lowlink[v]);
                    }
                }
            }

            return component;
        }

    }

    std::vector<core::Cycle> find_cycles(const core::DependencyGraph& graph) {
        std::vector<core::Cycle> cycles;
        std::set<std::vector<std::string>> seen;
        std::unordered_set<std::string> visited;
        std::unordered_map<std::string, std::size_t> path_index;
        std::vector<std::string> path;
        std::vector<Frame> stack;

        auto push = [&](const std::string& node) {
            visited.insert(node);
            path_index[node] = path.size();
            path.push_back(node);
            stack.push_back(Frame{node, graph.get_dependencies(node), 0});
        };

        for (const auto& root : graph.get_all_nodes()) {
            if (visited.contains(root)) {
                continue;
            }

            push(root);

            while (!stack.empty()) {
                auto& frame = stack.back();

                if (frame.next == frame.dependencies.size()) {
                    path_index.erase(frame.node);
                    path.pop_back();
                    stack.pop_back();
                    continue;
                }

                const std::string dep = frame.dependencies[frame.next++];

                if (const auto it = path_index.find(dep); it != path_index.end()) {
                    core::Cycle cycle(path.begin() + static_cast<std::ptrdiff_t>(it->second), path.end());
                    cycle.push_back(dep);
                    if (seen.insert(member_key(cycle)).second) {
                        cycles.push_back(std::move(cycle));
                    }
                } else if (!visited.contains(dep)) {
                    push(dep);
                }
            }
        }

        return cycles;
    }

    std::vector<std::vector<std::string>> strongly_connected_components(
        const core::DependencyGraph& graph
    ) {
        std::vector<std::vector<std::string>> components;
        std::unordered_map<std::string, int> indices;
        std::unordered_map<std::string, int> lowlinks;
        std::unordered_set<std::string> on_stack;
        std::vector<std::string> stack;
        std::vector<Frame> call_stack;
        int index = 0;

        auto visit = [&](const std::string& node) {
            indices[node] = index;
            lowlinks[node] = index;
            ++index;
            stack.push_back(node);
            on_stack.insert(node);
            call_stack.push_back(Frame{node, graph.get_dependencies(node), 0});
        };

        for (const auto& root : graph.get_all_nodes()) {
            if (indices.contains(root)) {
                continue;
            }

            visit(root);

            while (!call_stack.empty()) {
                auto& frame = call_stack.back();

                if (frame.next < frame.dependencies.size()) {
                    const std::string dep = frame.dependencies[frame.next++];
                    if (!indices.contains(dep)) {
                        visit(dep);
                    } else if (on_stack.contains(dep)) {
                        lowlinks[frame.node] = std::min(lowlinks[frame.node], indices[dep]);
                    }
                    continue;
                }

                const std::string node = frame.node;
                call_stack.pop_back();

                if (lowlinks[node] == indices[node]) {
                    std::vector<std::string> component;
                    std::string w;
                    do {
                        w = stack.back();
                        stack.pop_back();
                        on_stack.erase(w);
                        component.push_back(w);
                    } while (w != node);

                    if (component.size() > 1 || graph.has_edge(node, node)) {
                        std::ranges::sort(component);
                        components.push_back(std::move(component));
                    }
                }

                if (!call_stack.empty()) {
                    const auto& parent = call_stack.back().node;
                    lowlinks[parent] = std::min(lowlinks[parent], lowlinks[node]);
                }
            }
        }

        std::ranges::sort(components);
        return components;
    }

    std::vector<core::Cycle> find_elementary_cycles(
        const core::DependencyGraph& graph,
        const std::size_t max_cycles
    ) {
        std::vector<core::Cycle> cycles;
        if (max_cycles == 0) {
            return cycles;
        }

        const auto nodes = graph.get_all_nodes();
        const std::size_t n = nodes.size();

        std::unordered_map<std::string, std::size_t> position;
        for (std::size_t i = 0; i < n; ++i) {
            position[nodes[i]] = i;
        }

        std::vector<std::vector<std::size_t>> adjacency(n);
        for (std::size_t i = 0; i < n; ++i) {
            for (const auto& dep : graph.get_dependencies(nodes[i])) {
                adjacency[i].push_back(position.at(dep));
            }
        }

        struct CircuitFrame {
            std::size_t node;
            std::size_t next = 0;
            bool found = false;
        };

        std::vector<bool> blocked(n, false);
        std::vector<std::set<std::size_t>> blocked_by(n);
        std::vector<std::size_t> path;
        std::vector<CircuitFrame> frames;
        std::vector<std::size_t> pending;
        bool done = false;

        auto unblock = [&](const std::size_t u) {
            pending.assign(1, u);
            while (!pending.empty()) {
                const auto x = pending.back();
                pending.pop_back();
                blocked[x] = false;
                for (const auto w : blocked_by[x]) {
                    if (blocked[w]) pending.push_back(w);
                }
                blocked_by[x].clear();
            }
        };

        // Each round searches from the least node that still lies on a cycle
        // of the subgraph induced by nodes >= start, inside its component only.
        for (std::size_t start = 0; start < n && !done; ++start) {
            const auto component = cyclic_components_from(adjacency, start);
            while (start < n && component[start] == no_component) {
                ++start;
            }
            if (start == n) {
                break;
            }

            const auto in_scope = [&](const std::size_t w) {
                return w >= start && component[w] == component[start];
            };

            for (std::size_t i = start; i < n; ++i) {
                blocked[i] = false;
                blocked_by[i].clear();
            }

            path.push_back(start);
            blocked[start] = true;
            frames.push_back(CircuitFrame{start});

            while (!frames.empty()) {
                auto& frame = frames.back();
                const auto v = frame.node;

                if (done || frame.next == adjacency[v].size()) {
                    const bool found = frame.found;
                    if (found) {
                        unblock(v);
                    } else {
                        for (const auto w : adjacency[v]) {
                            if (in_scope(w)) blocked_by[w].insert(v);
                        }
                    }

                    path.pop_back();
                    frames.pop_back();
                    if (found && !frames.empty()) {
                        frames.back().found = true;
                    }
                    continue;
                }

                const auto w = adjacency[v][frame.next++];
                if (!in_scope(w)) {
                    continue;
                }

                if (w == start) {
                    core::Cycle cycle;
                    cycle.reserve(path.size() + 1);
                    for (const auto member : path) {
                        cycle.push_back(nodes[member]);
                    }
                    cycle.push_back(nodes[start]);
                    cycles.push_back(std::move(cycle));
                    frame.found = true;
                    if (cycles.size() >= max_cycles) {
                        done = true;
                    }
                } else if (!blocked[w]) {
                    path.push_back(w);
                    blocked[w] = true;
                    frames.push_back(CircuitFrame{w});
                }
            }
        }

        return cycles;
    }

    std::set<Edge> cycle_edges(const std::vector<core::Cycle>& cycles) {
        std::set<Edge> edges;
        for (const auto& cycle : cycles) {
            for (std::size_t i = 0; i + 1 < cycle.size(); ++i) {
                edges.emplace(cycle[i], cycle[i + 1]);
            }
        }
        return edges;
    }

    std::unordered_map<std::string, std::size_t> calculate_fanout(
        const core::DependencyGraph& graph
    ) {
        std::unordered_map<std::string, std::size_t> fanout;

        for (const auto& [node, edges] : graph.get_adjacency_list()) {
            fanout[node] = edges.size();
        }

        return fanout;
    }

    std::unordered_map<std::string, std::size_t> calculate_fanin(
        const core::DependencyGraph& graph
    ) {
        std::unordered_map<std::string, std::size_t> fanin;

        for (const auto& node : graph.get_adjacency_list() | std::views::keys) {
            fanin.try_emplace(node, 0);
        }

        for (const auto& edges : graph.get_adjacency_list() | std::views::values) {
            for (const auto& edge : edges) {
                ++fanin[edge.target];
            }
        }

        return fanin;
    }

}
