#include "psa/export/mermaid_exporter.h"
#include "psa/graph/graph_algorithms.h"
#include "psa/utils/string_utils.h"

#include <sstream>

namespace psa::export_module {

    namespace {
        constexpr auto CYCLE_LINK_STYLE = "stroke:red,stroke-width:2px,stroke-dasharray: 5 5;";

        std::string quote(const std::string& label) {
            return "\"" + utils::replace_all(label, "\"", "#quot;") + "\"";
        }
    }

    std::string MermaidExporter::module_label(const std::string& relative_path) {
        std::string label = relative_path;

        if (utils::ends_with(label, "/__init__.py")) {
            label = label.substr(0, label.size() - std::string("/__init__.py").size());
        } else if (utils::ends_with(label, ".py")) {
            label = label.substr(0, label.size() - 3);
        }

        return utils::replace_all(label, "/", ".");
    }

    std::string MermaidExporter::render(const core::AnalysisReport& report) const {
        const auto& graph = report.dependency_graph;
        const auto on_cycle = graph::cycle_edges(report.circular_imports);

        std::vector<graph::Edge> normal_edges;
        std::vector<graph::Edge> circular_edges;

        for (const auto& source : graph.get_all_nodes()) {
            for (const auto& target : graph.get_dependencies(source)) {
                graph::Edge edge{source, target};
                if (on_cycle.contains(edge)) {
                    circular_edges.push_back(std::move(edge));
                } else {
                    normal_edges.push_back(std::move(edge));
                }
            }
        }

        std::ostringstream out;
        out << "graph TD;\n";

        for (const auto& node : graph.get_all_nodes()) {
            if (graph.get_dependencies(node).empty() && graph.get_reverse_dependencies(node).empty()) {
                out << "    " << quote(module_label(node)) << ";\n";
            }
        }

        for (const auto& [source, target] : normal_edges) {
            out << "    " << quote(module_label(source)) << " --> " << quote(module_label(target)) << ";\n";
        }

        for (const auto& [source, target] : circular_edges) {
            out << "    " << quote(module_label(source)) << " --> " << quote(module_label(target)) << ";\n";
        }

        const std::size_t offset = normal_edges.size();
        for (std::size_t i = 0; i < circular_edges.size(); ++i) {
            out << "    linkStyle " << (offset + i) << " " << CYCLE_LINK_STYLE << "\n";
        }

        return out.str();
    }

}
