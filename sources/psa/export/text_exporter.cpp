#include "psa/export/text_exporter.h"
#include "psa/analysis/coupling_metrics.h"
#include "psa/utils/string_utils.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace psa::export_module {

    std::string TextExporter::render(const core::AnalysisReport& report) const {
        std::ostringstream out;

        out << "Project: " << report.project_root << "\n";
        out << "Files analyzed: " << report.summary.files_analyzed;
        if (report.summary.files_skipped > 0) {
            out << " (" << report.summary.files_skipped << " skipped)";
        }
        out << "\n";
        out << "Lines of code: " << report.summary.total_lines << "\n";
        out << "Test files: " << report.summary.test_files.size() << "\n";
        if (!report.summary.entry_points.empty()) {
            out << "Entry points: " << utils::join(report.summary.entry_points, ", ") << "\n";
        }
        if (!report.summary.largest_files.empty()) {
            out << "Largest files:\n";
            for (const auto& size : report.summary.largest_files) {
                out << "  " << size.file << " (" << size.bytes << " bytes, " << size.lines << " lines)\n";
            }
        }

        out << section_header("Undefined Symbols");
        if (report.undefined_symbols.empty()) {
            out << "None found.\n";
        }
        for (const auto& symbol : report.undefined_symbols) {
            out << symbol.file << ":" << symbol.line << " -> " << symbol.symbol << "\n";
        }

        out << section_header("Unused Symbols");
        if (report.unused_symbols.empty()) {
            out << "None found.\n";
        }
        for (const auto& symbol : report.unused_symbols) {
            out << symbol.file << " -> " << symbol.symbol
                << " (" << core::to_string(symbol.kind) << ", line " << symbol.line << ")\n";
        }

        out << section_header("Circular Imports");
        if (report.circular_imports.empty()) {
            out << "None found.\n";
        }
        for (std::size_t i = 0; i < report.circular_imports.size(); ++i) {
            out << "Cycle " << (i + 1) << ": " << utils::join(report.circular_imports[i], " -> ") << "\n";
        }

        out << section_header("Coupling Metrics");
        const auto metrics = analysis::CouplingCalculator::sorted_by_instability(report.coupling_metrics);

        std::size_t width = std::string("Module").size();
        for (const auto& metric : metrics) {
            width = std::max(width, metric.file.size());
        }

        out << std::left << std::setw(static_cast<int>(width)) << "Module"
            << "  " << std::right << std::setw(5) << "Ca"
            << "  " << std::setw(5) << "Ce"
            << "  " << std::setw(6) << "I" << "\n";
        out << std::string(width + 22, '-') << "\n";

        for (const auto& metric : metrics) {
            out << std::left << std::setw(static_cast<int>(width)) << metric.file
                << "  " << std::right << std::setw(5) << metric.afferent
                << "  " << std::setw(5) << metric.efferent
                << "  " << std::setw(6) << format_instability(metric.instability) << "\n";
        }

        if (!report.diagnostics.empty()) {
            out << section_header("Diagnostics");
            for (const auto& diagnostic : report.diagnostics) {
                out << "[" << core::to_string(diagnostic.kind) << "] " << diagnostic.file;
                if (diagnostic.line > 0) {
                    out << ":" << diagnostic.line;
                }
                out << ": " << diagnostic.message << "\n";
            }
        }

        return out.str();
    }

    std::string TextExporter::section_header(const std::string& title) {
        return "\n" + title + "\n" + std::string(title.size(), '=') + "\n";
    }

    std::string TextExporter::format_instability(const double instability) {
        std::ostringstream out;
        out << std::fixed << std::setprecision(2) << instability;
        return out.str();
    }

}
