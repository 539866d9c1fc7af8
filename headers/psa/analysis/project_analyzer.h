#ifndef PSA_ANALYSIS_PROJECT_ANALYZER_H
#define PSA_ANALYSIS_PROJECT_ANALYZER_H

#include "psa/analysis/import_resolver.h"
#include "psa/analysis/name_filters.h"
#include "psa/analysis/symbol_collector.h"
#include "psa/core/config.h"
#include "psa/core/result.h"
#include "psa/core/types.h"
#include "psa/syntax/syntax_node.h"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace psa::analysis {

    /**
     * One project file handed to the analyzer.
     *
     * Either `tree` is set, or `error` explains why the file could not be
     * read or parsed; such files become `file-skipped` diagnostics.
     */
    struct SourceUnit {
        std::string path;
        syntax::NodePtr tree;
        std::optional<core::Error> error;

        std::size_t bytes{};
        std::size_t lines{};
    };

    struct AnalyzerOptions {
        core::PrivateConvention private_convention = core::PrivateConvention::DUNDER;
        core::WildcardPolicy wildcard_imports = core::WildcardPolicy::FLAG;
        core::CycleMode cycle_mode = core::CycleMode::DFS;
        std::size_t max_cycles = 1000;
        std::vector<std::string> extra_builtins;
        int num_threads = 0;

        static AnalyzerOptions from_config(const core::Config& config);
    };

    /**
     * Per-file output of the parallel phase.
     */
    struct FileAnalysis {
        std::string file;
        bool skipped = false;

        std::vector<core::Definition> definitions;
        std::vector<core::Use> pending_uses;
        std::unordered_set<std::string> referenced_names;
        std::vector<core::ImportEdge> edges;
        std::vector<core::Diagnostic> diagnostics;
        std::size_t use_count{};
    };

    /**
     * Name -> files defining it, merged from every analyzed file. Immutable once built.
     */
    class DefinitionIndex {
    public:
        explicit DefinitionIndex(const std::vector<FileAnalysis>& files);

        [[nodiscard]] bool contains(const std::string& name) const;
        [[nodiscard]] std::vector<std::string> defining_files(const std::string& name) const;
        [[nodiscard]] std::size_t size() const { return index_.size(); }

        /// Every defined name, sorted.
        [[nodiscard]] std::vector<std::string> names() const;

    private:
        std::unordered_map<std::string, std::vector<std::string>> index_;
    };

    /**
     * @class ProjectAnalyzer
     * Fan-out/fan-in analysis of a set of parsed files.
     *
     * Each file is collected and its imports resolved on a worker thread.
     * After all workers finish, the merged definition index drives the
     * undefined and unused passes, and the dependency graph drives cycle
     * detection and coupling metrics. The resulting report uses paths
     * relative to the project root.
     */
    class ProjectAnalyzer {
    public:
        explicit ProjectAnalyzer(const std::string& project_root, AnalyzerOptions options = {});

        /**
         * Analyzes every unit and builds the report.
         *
         * @param units Files to analyze; paths should be canonical and inside the root.
         * @return The report, or INVALID_PATH if the root is not a directory.
         */
        [[nodiscard]] core::Result<core::AnalysisReport> analyze(const std::vector<SourceUnit>& units) const;

        /**
         * Per-file phase: symbol collection and import resolution for one unit.
         */
        [[nodiscard]] FileAnalysis analyze_file(const SourceUnit& unit) const;

        [[nodiscard]] const std::string& project_root() const { return resolver_.project_root(); }
        [[nodiscard]] const AnalyzerOptions& options() const { return options_; }

    private:
        [[nodiscard]] std::string relative(const std::string& path) const;

        [[nodiscard]] std::vector<core::UndefinedSymbol> find_undefined(
            const std::vector<FileAnalysis>& files,
            const DefinitionIndex& index
        ) const;

        [[nodiscard]] std::vector<core::UnusedSymbol> find_unused(
            const std::vector<FileAnalysis>& files
        ) const;

        [[nodiscard]] std::vector<core::Cycle> find_cycles(const core::DependencyGraph& graph) const;

        void summarize_sources(const std::vector<SourceUnit>& units, core::AnalysisSummary& summary) const;

        AnalyzerOptions options_;
        ImportResolver resolver_;
        SymbolCollector collector_;
        BuiltinSet builtins_;
    };

}

#endif //PSA_ANALYSIS_PROJECT_ANALYZER_H
