#include "psa/analysis/project_analyzer.h"
#include "psa/analysis/coupling_metrics.h"
#include "psa/graph/graph_algorithms.h"
#include "psa/utils/logging.h"
#include "psa/utils/parallel.hpp"
#include "psa/utils/path_utils.h"
#include "psa/utils/string_utils.h"

#include <algorithm>
#include <ranges>

namespace psa::analysis {

    namespace {

        bool is_reportable(const core::Definition& definition) {
            switch (definition.kind) {
                case core::DefinitionKind::FUNCTION:
                case core::DefinitionKind::CLASS:
                    return true;
                case core::DefinitionKind::VARIABLE:
                    return definition.is_module_level();
                default:
                    return false;
            }
        }

        constexpr std::size_t largest_file_count = 5;

        bool is_test_file(const std::string& relative_path) {
            return utils::contains(utils::to_lower(relative_path), "test");
        }

        bool is_entry_point(const std::string& relative_path) {
            const auto slash = relative_path.find_last_of('/');
            const auto name = slash == std::string::npos ? relative_path : relative_path.substr(slash + 1);
            return name == "main.py" || name == "app.py" || name == "__main__.py" || name == "run.py";
        }

        template<typename T>
        void sort_unique(std::vector<T>& items) {
            std::ranges::sort(items);
            items.erase(std::ranges::unique(items).begin(), items.end());
        }

    }

    AnalyzerOptions AnalyzerOptions::from_config(const core::Config& config) {
        AnalyzerOptions options;
        options.private_convention = config.analysis.private_convention;
        options.wildcard_imports = config.analysis.wildcard_imports;
        options.cycle_mode = config.analysis.cycle_mode;
        options.max_cycles = config.analysis.max_cycles;
        options.extra_builtins = config.analysis.extra_builtins;
        options.num_threads = config.performance.num_threads;
        return options;
    }

    DefinitionIndex::DefinitionIndex(const std::vector<FileAnalysis>& files) {
        for (const auto& file : files) {
            for (const auto& definition : file.definitions) {
                index_[definition.name].push_back(file.file);
            }
        }

        for (auto& defining : index_ | std::views::values) {
            sort_unique(defining);
        }
    }

    bool DefinitionIndex::contains(const std::string& name) const {
        return index_.contains(name);
    }

    std::vector<std::string> DefinitionIndex::defining_files(const std::string& name) const {
        const auto it = index_.find(name);
        return it == index_.end() ? std::vector<std::string>{} : it->second;
    }

    std::vector<std::string> DefinitionIndex::names() const {
        std::vector<std::string> names;
        names.reserve(index_.size());
        for (const auto& name : index_ | std::views::keys) {
            names.push_back(name);
        }
        std::ranges::sort(names);
        return names;
    }

    ProjectAnalyzer::ProjectAnalyzer(const std::string& project_root, AnalyzerOptions options)
        : options_(std::move(options)),
          resolver_(project_root),
          collector_(options_.wildcard_imports),
          builtins_(options_.extra_builtins) {}

    FileAnalysis ProjectAnalyzer::analyze_file(const SourceUnit& unit) const {
        FileAnalysis analysis;
        analysis.file = unit.path;

        auto skip = [&](const core::Error& error) {
            analysis.skipped = true;
            analysis.diagnostics.push_back(core::Diagnostic{
                core::DiagnosticKind::FILE_SKIPPED,
                unit.path,
                0,
                error.message
            });
            utils::logger()->warn("Skipping {}: {}", unit.path, error.message);
        };

        if (unit.error) {
            skip(*unit.error);
            return analysis;
        }

        if (!unit.tree) {
            skip(core::make_error(core::ErrorCode::FILE_PARSE_ERROR, "no syntax tree available"));
            return analysis;
        }

        auto collected = collector_.collect(unit.path, *unit.tree);
        if (collected.is_failure()) {
            skip(collected.error());
            return analysis;
        }

        auto& file = collected.value();
        analysis.definitions = file.table.definitions();
        analysis.pending_uses = file.table.pending_uses();
        analysis.referenced_names = file.table.referenced_names();
        analysis.use_count = file.table.uses().size();
        analysis.diagnostics = std::move(file.diagnostics);

        for (const auto& declaration : file.imports) {
            for (auto& target : resolver_.resolve_import(declaration, unit.path)) {
                analysis.edges.push_back(core::ImportEdge{unit.path, std::move(target), declaration.line});
            }
        }

        return analysis;
    }

    core::Result<core::AnalysisReport> ProjectAnalyzer::analyze(const std::vector<SourceUnit>& units) const {
        if (!utils::is_directory(project_root())) {
            return core::Result<core::AnalysisReport>::failure(core::make_error_with_context(
                core::ErrorCode::INVALID_PATH,
                "Project root is not a directory: " + project_root(),
                project_root()));
        }

        auto log = utils::logger();
        parallel::ThreadPool pool(static_cast<unsigned int>(std::max(options_.num_threads, 0)));
        log->info("Analyzing {} files on {} threads", units.size(), pool.size());

        std::vector<FileAnalysis> files;
        try {
            files = parallel::map(units, [this](const SourceUnit& unit) {
                return analyze_file(unit);
            }, pool);
        } catch (const std::exception& e) {
            return core::Result<core::AnalysisReport>::failure(
                core::ErrorCode::ANALYSIS_ERROR, std::string("Per-file analysis failed: ") + e.what());
        }

        const DefinitionIndex index(files);

        core::DependencyGraph graph;
        core::AnalysisReport report;
        report.project_root = project_root();

        for (const auto& file : files) {
            if (file.skipped) {
                ++report.summary.files_skipped;
            } else {
                ++report.summary.files_analyzed;
                graph.add_node(file.file);
            }

            report.summary.definitions += file.definitions.size();
            report.summary.uses += file.use_count;

            for (const auto& edge : file.edges) {
                graph.add_edge(edge.source, edge.target, edge.line);
            }

            for (const auto& diagnostic : file.diagnostics) {
                auto entry = diagnostic;
                entry.file = relative(diagnostic.file);
                report.diagnostics.push_back(std::move(entry));
            }
        }

        report.summary.import_edges = graph.edge_count();
        log->info("Merged {} distinct names and {} import edges", index.size(), graph.edge_count());

        for (const auto& name : index.names()) {
            auto& defining = report.project_symbols[name];
            for (const auto& file : index.defining_files(name)) {
                defining.push_back(relative(file));
            }
        }

        summarize_sources(units, report.summary);

        report.undefined_symbols = find_undefined(files, index);
        report.unused_symbols = find_unused(files);

        const auto clusters = graph::strongly_connected_components(graph);
        report.summary.import_clusters = clusters.size();
        if (!clusters.empty()) {
            log->info("{} import clusters contain cycles", clusters.size());
        }

        for (const auto& cycle : find_cycles(graph)) {
            core::Cycle relative_cycle;
            relative_cycle.reserve(cycle.size());
            for (const auto& member : cycle) {
                relative_cycle.push_back(relative(member));
            }
            report.circular_imports.push_back(std::move(relative_cycle));
        }

        for (const auto& [file, metric] : CouplingCalculator::calculate(graph)) {
            auto entry = metric;
            entry.file = relative(file);
            report.coupling_metrics.emplace(entry.file, std::move(entry));
        }

        for (const auto& node : graph.get_all_nodes()) {
            report.dependency_graph.add_node(relative(node));
            for (const auto& edge : graph.get_edges(node)) {
                report.dependency_graph.add_edge(relative(node), relative(edge.target), edge.line_number);
            }
        }

        sort_unique(report.diagnostics);

        log->info("Found {} undefined symbols, {} unused symbols, {} circular imports",
                  report.undefined_symbols.size(),
                  report.unused_symbols.size(),
                  report.circular_imports.size());

        return core::Result<core::AnalysisReport>::success(std::move(report));
    }

    std::vector<core::UndefinedSymbol> ProjectAnalyzer::find_undefined(
        const std::vector<FileAnalysis>& files,
        const DefinitionIndex& index
    ) const {
        std::vector<core::UndefinedSymbol> undefined;

        for (const auto& file : files) {
            for (const auto& use : file.pending_uses) {
                if (index.contains(use.name) || builtins_.contains(use.name)) {
                    continue;
                }
                undefined.push_back(core::UndefinedSymbol{relative(file.file), use.line, use.name});
            }
        }

        sort_unique(undefined);
        return undefined;
    }

    std::vector<core::UnusedSymbol> ProjectAnalyzer::find_unused(
        const std::vector<FileAnalysis>& files
    ) const {
        std::unordered_set<std::string> referenced;
        for (const auto& file : files) {
            referenced.insert(file.referenced_names.begin(), file.referenced_names.end());
        }

        std::vector<core::UnusedSymbol> unused;

        for (const auto& file : files) {
            for (const auto& definition : file.definitions) {
                if (!is_reportable(definition)) continue;
                if (is_private_name(definition.name, options_.private_convention)) continue;
                if (referenced.contains(definition.name)) continue;

                unused.push_back(core::UnusedSymbol{
                    relative(file.file), definition.line, definition.name, definition.kind
                });
            }
        }

        sort_unique(unused);
        return unused;
    }

    std::vector<core::Cycle> ProjectAnalyzer::find_cycles(const core::DependencyGraph& graph) const {
        if (options_.cycle_mode == core::CycleMode::ELEMENTARY) {
            auto cycles = graph::find_elementary_cycles(graph, options_.max_cycles);
            if (cycles.size() >= options_.max_cycles) {
                utils::logger()->warn("Cycle enumeration stopped at the limit of {}", options_.max_cycles);
            }
            return cycles;
        }

        return graph::find_cycles(graph);
    }

    void ProjectAnalyzer::summarize_sources(const std::vector<SourceUnit>& units,
                                            core::AnalysisSummary& summary) const {
        std::vector<core::SourceFileSize> sizes;
        sizes.reserve(units.size());

        for (const auto& unit : units) {
            const auto path = relative(unit.path);
            summary.total_lines += unit.lines;
            sizes.push_back(core::SourceFileSize{path, unit.bytes, unit.lines});

            if (is_test_file(path)) {
                summary.test_files.push_back(path);
            } else if (is_entry_point(path)) {
                summary.entry_points.push_back(path);
            }
        }

        std::ranges::sort(summary.test_files);
        std::ranges::sort(summary.entry_points);

        std::ranges::sort(sizes, [](const core::SourceFileSize& a, const core::SourceFileSize& b) {
            return a.bytes != b.bytes ? a.bytes > b.bytes : a.file < b.file;
        });
        if (sizes.size() > largest_file_count) {
            sizes.resize(largest_file_count);
        }
        summary.largest_files = std::move(sizes);
    }

    std::string ProjectAnalyzer::relative(const std::string& path) const {
        return utils::to_posix_separators(utils::get_relative_path(path, project_root()));
    }

}
