#include "psa/export/html_exporter.h"

#include <sstream>
#include <utility>

namespace psa::export_module {

    HTMLExporter::HTMLExporter(Options options)
        : options_(std::move(options)) {}

    std::string HTMLExporter::render(const core::AnalysisReport& report) const {
        std::ostringstream html;

        html << generate_html_header(options_.title);
        html << "<style>\n" << generate_css() << "\n</style>\n";
        html << "<script type=\"module\">\n"
             << "    import mermaid from 'https://cdn.jsdelivr.net/npm/mermaid@10/dist/mermaid.esm.min.mjs';\n"
             << "    mermaid.initialize({ startOnLoad: true });\n"
             << "</script>\n";
        html << "</head>\n<body>\n";

        html << "<div class=\"container\">\n";
        html << "<h1>" << escape_html(options_.title) << "</h1>\n";

        if (options_.include_summary) {
            html << generate_summary(report);
        }

        html << "<div class=\"info\">Red dashed lines indicate circular dependencies.</div>\n";
        html << "<div class=\"mermaid\">\n" << escape_html(mermaid_.render(report)) << "</div>\n";
        html << "</div>\n";
        html << "</body>\n</html>\n";

        return html.str();
    }

    std::string HTMLExporter::generate_html_header(const std::string& title) {
        return "<!DOCTYPE html>\n"
               "<html lang=\"en\">\n"
               "<head>\n"
               "<meta charset=\"UTF-8\">\n"
               "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n"
               "<title>" + escape_html(title) + "</title>\n";
    }

    std::string HTMLExporter::generate_css() {
        return R"(
    body {
        font-family: -apple-system, BlinkMacSystemFont, 'Segoe UI', Roboto, sans-serif;
        margin: 0;
        padding: 20px;
        background: #f5f5f5;
    }
    h1 {
        color: #333;
        text-align: center;
    }
    .container {
        max-width: 1400px;
        margin: 0 auto;
        background: white;
        padding: 20px;
        border-radius: 8px;
        box-shadow: 0 2px 4px rgba(0, 0, 0, 0.1);
    }
    .info {
        background: #fff3cd;
        border: 1px solid #ffc107;
        padding: 10px;
        margin-bottom: 20px;
        border-radius: 4px;
    }
    .summary {
        color: #555;
        margin-bottom: 12px;
    }
    .mermaid {
        text-align: center;
    }
)";
    }

    std::string HTMLExporter::generate_summary(const core::AnalysisReport& report) {
        std::ostringstream html;
        html << "<p class=\"summary\">"
             << report.summary.files_analyzed << " files, "
             << report.dependency_graph.edge_count() << " import edges, "
             << report.circular_imports.size() << " circular imports</p>\n";
        return html.str();
    }

    std::string HTMLExporter::escape_html(const std::string& text) {
        std::string result;
        result.reserve(text.size() + text.size() / 10);
        for (const char c : text) {
            switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&#39;"; break;
            default: result += c; break;
            }
        }
        return result;
    }

}
