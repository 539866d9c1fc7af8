#ifndef PSA_EXPORT_HTML_EXPORTER_H
#define PSA_EXPORT_HTML_EXPORTER_H

#include "psa/export/exporter.h"
#include "psa/export/mermaid_exporter.h"

namespace psa::export_module {

    /**
     * Standalone HTML page that renders the dependency graph with Mermaid.
     */
    class HTMLExporter final : public Exporter {
    public:
        struct Options {
            std::string title = "Python Dependency Graph";
            bool include_summary = true;    ///< Show file and finding counts above the graph.
        };

        explicit HTMLExporter(Options options);

        HTMLExporter() : HTMLExporter(Options{}) {};

        [[nodiscard]] std::string render(const core::AnalysisReport& report) const override;

        [[nodiscard]] std::string get_default_extension() const override { return ".html"; }

        [[nodiscard]] core::OutputFormat get_format() const override { return core::OutputFormat::HTML; }

        /**
         * Escapes special characters for safe inclusion in HTML.
         */
        static std::string escape_html(const std::string& text);

    private:
        Options options_;
        MermaidExporter mermaid_;

        static std::string generate_html_header(const std::string& title);
        static std::string generate_css();
        static std::string generate_summary(const core::AnalysisReport& report);
    };

}

#endif //PSA_EXPORT_HTML_EXPORTER_H
