#include "psa/export/json_exporter.h"
#include "psa/analysis/coupling_metrics.h"

#include <algorithm>

namespace psa::export_module {

    JSONExporter::JSONExporter(const Options& options)
        : options_(options) {}

    std::string JSONExporter::render(const core::AnalysisReport& report) const {
        const auto document = to_json(report);
        if (options_.pretty_print) {
            return document.dump(options_.indent_size) + "\n";
        }
        return document.dump() + "\n";
    }

    nlohmann::json JSONExporter::to_json(const core::AnalysisReport& report) const {
        nlohmann::json document;

        document["project_root"] = report.project_root;
        document["undefined_symbols"] = undefined_to_json(report.undefined_symbols);
        document["unused_symbols"] = unused_to_json(report.unused_symbols);
        document["circular_imports"] = report.circular_imports;
        document["coupling_metrics"] = metrics_to_json(report.coupling_metrics);
        document["dependencies"] = dependencies_to_json(report.dependency_graph);
        document["project_symbols"] = report.project_symbols;

        if (options_.include_diagnostics) {
            document["diagnostics"] = diagnostics_to_json(report.diagnostics);
        }

        document["summary"] = summary_to_json(report);
        return document;
    }

    nlohmann::json JSONExporter::undefined_to_json(const std::vector<core::UndefinedSymbol>& symbols) {
        nlohmann::json array = nlohmann::json::array();

        for (const auto& symbol : symbols) {
            nlohmann::json entry;
            entry["symbol"] = symbol.symbol;
            entry["file"] = symbol.file;
            entry["line"] = symbol.line;
            array.push_back(entry);
        }

        return array;
    }

    nlohmann::json JSONExporter::unused_to_json(const std::vector<core::UnusedSymbol>& symbols) {
        nlohmann::json array = nlohmann::json::array();

        for (const auto& symbol : symbols) {
            nlohmann::json entry;
            entry["symbol"] = symbol.symbol;
            entry["file"] = symbol.file;
            entry["line"] = symbol.line;
            entry["kind"] = core::to_string(symbol.kind);
            array.push_back(entry);
        }

        return array;
    }

    nlohmann::json JSONExporter::metrics_to_json(
        const std::unordered_map<std::string, core::CouplingMetric>& metrics
    ) {
        nlohmann::json array = nlohmann::json::array();

        for (const auto& metric : analysis::CouplingCalculator::sorted_by_instability(metrics)) {
            nlohmann::json entry;
            entry["module"] = metric.file;
            entry["ca"] = metric.afferent;
            entry["ce"] = metric.efferent;
            entry["instability"] = metric.instability;
            array.push_back(entry);
        }

        return array;
    }

    nlohmann::json JSONExporter::diagnostics_to_json(const std::vector<core::Diagnostic>& diagnostics) {
        nlohmann::json array = nlohmann::json::array();

        for (const auto& diagnostic : diagnostics) {
            nlohmann::json entry;
            entry["kind"] = core::to_string(diagnostic.kind);
            entry["file"] = diagnostic.file;
            entry["line"] = diagnostic.line;
            entry["message"] = diagnostic.message;
            array.push_back(entry);
        }

        return array;
    }

    nlohmann::json JSONExporter::dependencies_to_json(const core::DependencyGraph& graph) {
        nlohmann::json object = nlohmann::json::object();

        auto nodes = graph.get_all_nodes();
        std::ranges::sort(nodes);
        for (const auto& node : nodes) {
            std::vector<std::string> targets;
            for (const auto& edge : graph.get_edges(node)) {
                targets.push_back(edge.target);
            }
            std::ranges::sort(targets);
            targets.erase(std::ranges::unique(targets).begin(), targets.end());
            object[node] = targets;
        }

        return object;
    }

    nlohmann::json JSONExporter::summary_to_json(const core::AnalysisReport& report) {
        nlohmann::json j;
        j["files_analyzed"] = report.summary.files_analyzed;
        j["files_skipped"] = report.summary.files_skipped;
        j["definitions"] = report.summary.definitions;
        j["uses"] = report.summary.uses;
        j["import_edges"] = report.summary.import_edges;
        j["undefined_symbols"] = report.undefined_symbols.size();
        j["unused_symbols"] = report.unused_symbols.size();
        j["circular_imports"] = report.circular_imports.size();
        j["import_clusters"] = report.summary.import_clusters;
        j["total_lines"] = report.summary.total_lines;
        j["test_files"] = report.summary.test_files;
        j["entry_points"] = report.summary.entry_points;

        nlohmann::json largest = nlohmann::json::array();
        for (const auto& size : report.summary.largest_files) {
            nlohmann::json entry;
            entry["file"] = size.file;
            entry["bytes"] = size.bytes;
            entry["lines"] = size.lines;
            largest.push_back(entry);
        }
        j["largest_files"] = largest;
        return j;
    }

}
