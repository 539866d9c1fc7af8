#ifndef PSA_CORE_TYPES_H
#define PSA_CORE_TYPES_H

#include <compare>
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <unordered_map>

namespace psa::core {

    /**
     * Kinds of lexical binding regions.
     */
    enum class ScopeKind {
        MODULE,
        FUNCTION,
        CLASS,
        LAMBDA,
        COMPREHENSION
    };

    /**
     * What introduced a name binding.
     */
    enum class DefinitionKind {
        FUNCTION,
        CLASS,
        VARIABLE,
        IMPORT_ALIAS,
        PARAMETER
    };

    enum class DiagnosticKind {
        FILE_SKIPPED,
        WILDCARD_IMPORT
    };

    /**
     * A name bound in some scope of one file.
     */
    struct Definition {
        std::string name;
        std::size_t scope{};                  ///< Index of the scope in the file's scope arena.
        ScopeKind scope_kind = ScopeKind::MODULE;
        int line{};
        DefinitionKind kind = DefinitionKind::VARIABLE;

        [[nodiscard]] bool is_module_level() const { return scope_kind == ScopeKind::MODULE; }
    };

    /**
     * A name read in load context.
     */
    struct Use {
        std::string name;
        int line{};
        std::size_t scope{};                  ///< Innermost scope open at the point of use.
    };

    /**
     * One import declaration as written in the source.
     *
     * `module` is the dotted module reference (empty for `from . import x`),
     * `level` the number of leading dots, `names` the imported names for
     * `from` imports or the imported modules for plain imports.
     */
    struct ImportDeclaration {
        struct Alias {
            std::string name;
            std::string alias;
        };

        std::string module;
        int level{};
        std::vector<Alias> names;
        int line{};
        bool is_from_import = false;
        bool is_wildcard = false;
    };

    /**
     * A resolved dependency between two project files.
     */
    struct ImportEdge {
        std::string source;
        std::string target;
        int line{};
    };

    struct Diagnostic {
        DiagnosticKind kind = DiagnosticKind::FILE_SKIPPED;
        std::string file;
        int line{};
        std::string message;

        auto operator<=>(const Diagnostic&) const = default;
    };

    struct UndefinedSymbol {
        std::string file;
        int line{};
        std::string symbol;

        auto operator<=>(const UndefinedSymbol&) const = default;
    };

    struct UnusedSymbol {
        std::string file;
        int line{};
        std::string symbol;
        DefinitionKind kind = DefinitionKind::FUNCTION;

        auto operator<=>(const UnusedSymbol&) const = default;
    };

    struct CouplingMetric {
        std::string file;
        std::size_t afferent{};               ///< Ca: distinct files importing this one.
        std::size_t efferent{};               ///< Ce: distinct files this one imports.
        double instability{};                 ///< Ce / (Ce + Ca), 0.0 for isolated files.
    };

    /**
     * A closed import loop: member files in traversal order with the first repeated at the end.
     */
    using Cycle = std::vector<std::string>;

    struct DependencyEdge {
        std::string target;
        int line_number{};

        DependencyEdge() = default;
        explicit DependencyEdge(std::string target, const int line_number = 0)
            : target(std::move(target)), line_number(line_number) {}
    };

    /**
     * Directed graph over file identities.
     *
     * Adding the same edge twice records it once. Accessors return nodes
     * and neighbors in lexicographic order so traversals are deterministic.
     * Safe for concurrent reads once construction is complete.
     */
    class DependencyGraph {
    public:
        DependencyGraph() = default;

        void add_node(const std::string& file);
        bool add_edge(const std::string& source, const std::string& target, int line_number = 0);

        [[nodiscard]] bool has_node(const std::string& file) const;
        [[nodiscard]] bool has_edge(const std::string& source, const std::string& target) const;

        [[nodiscard]] std::vector<std::string> get_dependencies(const std::string& file) const;
        [[nodiscard]] std::vector<std::string> get_reverse_dependencies(const std::string& file) const;
        [[nodiscard]] std::vector<DependencyEdge> get_edges(const std::string& file) const;

        [[nodiscard]] std::size_t node_count() const;
        [[nodiscard]] std::size_t edge_count() const;

        [[nodiscard]] std::vector<std::string> get_all_nodes() const;

        const std::unordered_map<std::string, std::vector<DependencyEdge>>& get_adjacency_list() const {
            return adjacency_list_;
        }

        void clear();

    private:
        std::unordered_map<std::string, std::vector<DependencyEdge>> adjacency_list_{};
        std::unordered_map<std::string, std::vector<std::string>> reverse_adjacency_list_{};
        std::size_t edge_count_{};
    };

    struct SourceFileSize {
        std::string file;
        std::size_t bytes{};
        std::size_t lines{};

        auto operator<=>(const SourceFileSize&) const = default;
    };

    struct AnalysisSummary {
        std::size_t files_analyzed{};
        std::size_t files_skipped{};
        std::size_t definitions{};
        std::size_t uses{};
        std::size_t import_edges{};
        std::size_t import_clusters{};              ///< Strongly connected groups of files that import in a loop.

        std::size_t total_lines{};                  ///< Over every enumerated file, skipped ones included.
        std::vector<std::string> test_files;        ///< Paths containing "test", case-insensitive.
        std::vector<std::string> entry_points;      ///< main.py, app.py, __main__.py, run.py outside tests.
        std::vector<SourceFileSize> largest_files;  ///< At most five, largest first.
    };

    /**
     * Immutable result of one analysis pass.
     *
     * All paths are relative to `project_root` with '/' separators.
     */
    struct AnalysisReport {
        std::string project_root;

        std::vector<UndefinedSymbol> undefined_symbols;
        std::vector<UnusedSymbol> unused_symbols;
        std::vector<Cycle> circular_imports;
        std::unordered_map<std::string, CouplingMetric> coupling_metrics;
        std::vector<Diagnostic> diagnostics;

        /// Name -> files defining it, across the whole project.
        std::map<std::string, std::vector<std::string>> project_symbols;

        DependencyGraph dependency_graph;
        AnalysisSummary summary;

        [[nodiscard]] bool has_findings() const {
            return !undefined_symbols.empty() || !unused_symbols.empty() || !circular_imports.empty();
        }
    };

    std::string to_string(ScopeKind kind);
    std::string to_string(DefinitionKind kind);
    std::string to_string(DiagnosticKind kind);

}

#endif //PSA_CORE_TYPES_H
