#ifndef PSA_EXPORT_TEXT_EXPORTER_H
#define PSA_EXPORT_TEXT_EXPORTER_H

#include "psa/export/exporter.h"

namespace psa::export_module {

    /**
     * Plain-text report for terminals.
     *
     * Sections appear in a fixed order: undefined symbols, unused symbols,
     * circular imports, coupling metrics, then diagnostics. Empty finding
     * sections print a single "None found." line.
     */
    class TextExporter final : public Exporter {
    public:
        TextExporter() = default;

        [[nodiscard]] std::string render(const core::AnalysisReport& report) const override;

        [[nodiscard]] std::string get_default_extension() const override { return ".txt"; }

        [[nodiscard]] core::OutputFormat get_format() const override { return core::OutputFormat::TEXT; }

    private:
        static std::string section_header(const std::string& title);
        static std::string format_instability(double instability);
    };

}

#endif //PSA_EXPORT_TEXT_EXPORTER_H
