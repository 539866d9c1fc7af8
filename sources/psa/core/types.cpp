#include "psa/core/types.h"
#include <algorithm>
#include <ranges>

namespace psa::core {

    void DependencyGraph::add_node(const std::string& file) {
        if (!has_node(file)) {
            adjacency_list_[file] = {};
            reverse_adjacency_list_[file] = {};
        }
    }

    bool DependencyGraph::add_edge(const std::string& source, const std::string& target, const int line_number) {
        add_node(source);
        add_node(target);

        if (has_edge(source, target)) {
            return false;
        }

        adjacency_list_[source].emplace_back(target, line_number);
        reverse_adjacency_list_[target].push_back(source);
        ++edge_count_;
        return true;
    }

    bool DependencyGraph::has_node(const std::string& file) const {
        return adjacency_list_.contains(file);
    }

    bool DependencyGraph::has_edge(const std::string& source, const std::string& target) const {
        const auto it = adjacency_list_.find(source);
        if (it == adjacency_list_.end()) {
            return false;
        }

        return std::ranges::any_of(it->second,
                                   [&target](const DependencyEdge& edge) {
                                       return edge.target == target;});
    }

    std::vector<std::string> DependencyGraph::get_dependencies(const std::string& file) const {
        const auto it = adjacency_list_.find(file);
        if (it == adjacency_list_.end()) {
            return {};
        }

        std::vector<std::string> dependencies;
        dependencies.reserve(it->second.size());

        for (const auto& edge : it->second) {
            dependencies.push_back(edge.target);
        }

        std::ranges::sort(dependencies);
        return dependencies;
    }

    std::vector<std::string> DependencyGraph::get_reverse_dependencies(const std::string& file) const {
        const auto it = reverse_adjacency_list_.find(file);
        if (it == reverse_adjacency_list_.end()) {
            return {};
        }

        auto dependents = it->second;
        std::ranges::sort(dependents);
        return dependents;
    }

    std::vector<DependencyEdge> DependencyGraph::get_edges(const std::string& file) const {
        const auto it = adjacency_list_.find(file);
        if (it == adjacency_list_.end()) {
            return {};
        }

        auto edges = it->second;
        std::ranges::sort(edges, {}, &DependencyEdge::target);
        return edges;
    }

    std::size_t DependencyGraph::node_count() const {
        return adjacency_list_.size();
    }

    std::size_t DependencyGraph::edge_count() const {
        return edge_count_;
    }

    std::vector<std::string> DependencyGraph::get_all_nodes() const {
        std::vector<std::string> nodes;
        nodes.reserve(adjacency_list_.size());

        for (const auto& node : adjacency_list_ | std::views::keys) {
            nodes.push_back(node);
        }

        std::ranges::sort(nodes);
        return nodes;
    }

    void DependencyGraph::clear() {
        adjacency_list_.clear();
        reverse_adjacency_list_.clear();
        edge_count_ = 0;
    }

    std::string to_string(const ScopeKind kind) {
        switch (kind) {
            case ScopeKind::MODULE: return "module";
            case ScopeKind::FUNCTION: return "function";
            case ScopeKind::CLASS: return "class";
            case ScopeKind::LAMBDA: return "lambda";
            case ScopeKind::COMPREHENSION: return "comprehension";
            default: return "unknown";
        }
    }

    std::string to_string(const DefinitionKind kind) {
        switch (kind) {
            case DefinitionKind::FUNCTION: return "function";
            case DefinitionKind::CLASS: return "class";
            case DefinitionKind::VARIABLE: return "variable";
            case DefinitionKind::IMPORT_ALIAS: return "import";
            case DefinitionKind::PARAMETER: return "parameter";
            default: return "unknown";
        }
    }

    std::string to_string(const DiagnosticKind kind) {
        switch (kind) {
            case DiagnosticKind::FILE_SKIPPED: return "file-skipped";
            case DiagnosticKind::WILDCARD_IMPORT: return "wildcard-import";
            default: return "unknown";
        }
    }

}
