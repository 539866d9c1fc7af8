#ifndef PSA_EXPORT_EXPORTER_H
#define PSA_EXPORT_EXPORTER_H

#include "psa/core/config.h"
#include "psa/core/result.h"
#include "psa/core/types.h"

#include <memory>
#include <string>

namespace psa::export_module {

    /**
     * Abstract base class for report sinks.
     *
     * A sink renders an AnalysisReport to text. Writing goes through a
     * sibling temporary file that is renamed into place, so a failed export
     * never leaves a truncated report behind.
     */
    class Exporter {
    public:
        virtual ~Exporter() = default;

        /**
         * Renders the report in this sink's format.
         */
        [[nodiscard]] virtual std::string render(const core::AnalysisReport& report) const = 0;

        /**
         * Renders the report and writes it to `output_path`.
         *
         * @return FILE_WRITE_ERROR if the file cannot be written.
         */
        virtual core::Result<void> export_report(
            const core::AnalysisReport& report,
            const std::string& output_path
        ) const;

        /**
         * Returns the default file extension for the export format, e.g. ".json".
         */
        [[nodiscard]] virtual std::string get_default_extension() const = 0;

        [[nodiscard]] virtual core::OutputFormat get_format() const = 0;
    };

    /**
     * Factory for creating exporters based on format type.
     */
    class ExporterFactory {
    public:
        /**
         * Creates an exporter for the specified format.
         *
         * @param format The desired output format.
         * @param options Output options (pretty printing, report title).
         * @return A unique pointer to an Exporter instance.
         */
        static std::unique_ptr<Exporter> create_exporter(
            core::OutputFormat format,
            const core::OutputConfig& options = {}
        );

        /**
         * Picks a format from a file extension (".json", ".mmd", ".html", anything else is text).
         */
        static core::OutputFormat format_for_path(const std::string& path);
    };

} // namespace psa::export_module

#endif //PSA_EXPORT_EXPORTER_H
