#ifndef PSA_EXPORT_JSON_EXPORTER_H
#define PSA_EXPORT_JSON_EXPORTER_H

#include "psa/export/exporter.h"
#include <nlohmann/json.hpp>

namespace psa::export_module {

    /**
     * JSON sink.
     *
     * Top-level keys: `undefined_symbols`, `unused_symbols`,
     * `circular_imports`, `coupling_metrics` (sorted by descending
     * instability), `dependencies` (module to imported modules),
     * `project_symbols` (name to defining modules), `diagnostics`, `summary`
     * and `project_root`.
     */
    class JSONExporter final : public Exporter {
    public:
        /**
         * Configuration options for JSON export behavior.
         */
        struct Options {
            bool pretty_print = true;          ///< Enable pretty-printed JSON output.
            int indent_size = 4;               ///< Indentation level for pretty printing.
            bool include_diagnostics = true;   ///< Include file-skipped and wildcard-import notes.
        };

        explicit JSONExporter(const Options& options);

        JSONExporter() : JSONExporter(Options{}) {};

        [[nodiscard]] std::string render(const core::AnalysisReport& report) const override;

        /**
         * Builds the JSON document without serializing it.
         */
        [[nodiscard]] nlohmann::json to_json(const core::AnalysisReport& report) const;

        [[nodiscard]] std::string get_default_extension() const override { return ".json"; }

        [[nodiscard]] core::OutputFormat get_format() const override { return core::OutputFormat::JSON; }

    private:
        Options options_;

        static nlohmann::json undefined_to_json(const std::vector<core::UndefinedSymbol>& symbols);
        static nlohmann::json unused_to_json(const std::vector<core::UnusedSymbol>& symbols);
        static nlohmann::json metrics_to_json(const std::unordered_map<std::string, core::CouplingMetric>& metrics);
        static nlohmann::json diagnostics_to_json(const std::vector<core::Diagnostic>& diagnostics);
        static nlohmann::json dependencies_to_json(const core::DependencyGraph& graph);
        static nlohmann::json summary_to_json(const core::AnalysisReport& report);
    };

}

#endif //PSA_EXPORT_JSON_EXPORTER_H
