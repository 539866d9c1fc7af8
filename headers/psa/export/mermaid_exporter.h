#ifndef PSA_EXPORT_MERMAID_EXPORTER_H
#define PSA_EXPORT_MERMAID_EXPORTER_H

#include "psa/export/exporter.h"

namespace psa::export_module {

    /**
     * Renders the module dependency graph as a Mermaid flowchart.
     *
     * Nodes are labelled with dotted module names. Edges that lie on a
     * reported import cycle are emitted after the ordinary edges and styled
     * as red dashed links.
     */
    class MermaidExporter final : public Exporter {
    public:
        MermaidExporter() = default;

        [[nodiscard]] std::string render(const core::AnalysisReport& report) const override;

        [[nodiscard]] std::string get_default_extension() const override { return ".mmd"; }

        [[nodiscard]] core::OutputFormat get_format() const override { return core::OutputFormat::MERMAID; }

        /**
         * Converts a project-relative file path to a dotted module label.
         *
         * `pkg/mod.py` becomes `pkg.mod`, `pkg/__init__.py` becomes `pkg`.
         */
        static std::string module_label(const std::string& relative_path);
    };

}

#endif //PSA_EXPORT_MERMAID_EXPORTER_H
