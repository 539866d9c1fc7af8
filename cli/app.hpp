#ifndef PSA_APP_HPP
#define PSA_APP_HPP

#include "cli_parser.hpp"
#include "psa/core/config.h"
#include "psa/core/result.h"
#include "psa/core/types.h"

namespace psa::cli {

    /// Process exit codes.
    enum ExitCode : int {
        EXIT_OK = 0,
        EXIT_ERROR = 1,
        EXIT_FINDINGS = 2
    };

    class App {
    public:
        explicit App(Options options);
        ~App() = default;

        int run();

    private:
        /// Pipeline shared by `analyze` and `graph`.
        int execute() const;

        /**
         * Loads the configuration file (if any) and applies command-line overrides.
         */
        [[nodiscard]] core::Result<core::Config> build_config() const;

        [[nodiscard]] core::Result<core::AnalysisReport> analyze_project(const core::Config& config) const;

        /**
         * Writes every sink named on the command line.
         *
         * @return The number of sinks written, or the first write failure.
         */
        [[nodiscard]] core::Result<std::size_t> write_requested_outputs(const core::Config& config,
                                                                        const core::AnalysisReport& report) const;

        /**
         * Output used when no sink is named: Mermaid on stdout for `graph`,
         * the configured format and path for `analyze`.
         */
        [[nodiscard]] core::Result<void> write_default_output(const core::Config& config,
                                                              const core::AnalysisReport& report) const;

        [[nodiscard]] int finish(const core::AnalysisReport& report) const;

        Options options_;
    };

} // namespace psa::cli

#endif //PSA_APP_HPP
