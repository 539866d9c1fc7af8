#include "psa/export/exporter.h"
#include "psa/export/html_exporter.h"
#include "psa/export/json_exporter.h"
#include "psa/export/mermaid_exporter.h"
#include "psa/export/text_exporter.h"
#include "psa/utils/file_utils.h"
#include "psa/utils/path_utils.h"
#include "psa/utils/string_utils.h"

namespace psa::export_module {

    core::Result<void> Exporter::export_report(
        const core::AnalysisReport& report,
        const std::string& output_path
    ) const {
        if (!utils::write_file_atomic(output_path, render(report))) {
            return core::Result<void>::failure(core::make_error_with_context(
                core::ErrorCode::FILE_WRITE_ERROR,
                "Failed to write " + core::to_string(get_format()) + " report to: " + output_path,
                output_path));
        }

        return core::Result<void>::success();
    }

    std::unique_ptr<Exporter> ExporterFactory::create_exporter(
        const core::OutputFormat format,
        const core::OutputConfig& options
    ) {
        switch (format) {
        case core::OutputFormat::JSON: {
            JSONExporter::Options json_options;
            json_options.pretty_print = options.pretty_print;
            return std::make_unique<JSONExporter>(json_options);
        }
        case core::OutputFormat::MERMAID:
            return std::make_unique<MermaidExporter>();
        case core::OutputFormat::HTML: {
            HTMLExporter::Options html_options;
            if (!options.title.empty()) {
                html_options.title = options.title;
            }
            return std::make_unique<HTMLExporter>(html_options);
        }
        case core::OutputFormat::TEXT:
        default:
            return std::make_unique<TextExporter>();
        }
    }

    core::OutputFormat ExporterFactory::format_for_path(const std::string& path) {
        const auto extension = utils::to_lower(utils::fs::path(path).extension().string());

        if (extension == ".json") return core::OutputFormat::JSON;
        if (extension == ".mmd" || extension == ".mermaid") return core::OutputFormat::MERMAID;
        if (extension == ".html" || extension == ".htm") return core::OutputFormat::HTML;
        return core::OutputFormat::TEXT;
    }

}
