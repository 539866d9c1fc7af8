#include "app.hpp"
#include "psa/analysis/project_analyzer.h"
#include "psa/export/exporter.h"
#include "psa/frontend/project_loader.h"
#include "psa/utils/logging.h"
#include "psa/utils/path_utils.h"
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace psa::cli {

    namespace {
        void print_error(const core::Error& error) {
            std::cerr << "Error: " << error.message << "\n";
        }
    }

    App::App(Options options)
        : options_(std::move(options)) {}

    int App::run() {
        if (options_.usage_error) {
            std::cerr << *options_.usage_error << "\n";
            std::cerr << "Run 'psa help' for usage.\n";
            return EXIT_ERROR;
        }

        switch (options_.command) {
            case Command::ANALYZE:
            case Command::GRAPH:
                return execute();
            default:
                std::cerr << "Unknown command\n";
                return EXIT_ERROR;
        }
    }

    core::Result<core::Config> App::build_config() const {
        auto config_result = options_.config_file
            ? core::Config::load_from_file(*options_.config_file)
            : core::Result<core::Config>::success(core::Config::default_config());

        if (config_result.is_failure()) {
            return config_result;
        }

        core::Config config = std::move(config_result).value();

        for (const auto& dir : options_.exclude_dirs) {
            config.filters.ignore_dirs.push_back(dir);
        }

        if (options_.num_threads) {
            config.performance.num_threads = *options_.num_threads;
        }

        if (options_.private_convention) {
            auto convention = core::private_convention_from_string(*options_.private_convention);
            if (convention.is_failure()) return core::Result<core::Config>::failure(convention.error());
            config.analysis.private_convention = convention.value();
        }

        if (options_.wildcard_policy) {
            auto policy = core::wildcard_policy_from_string(*options_.wildcard_policy);
            if (policy.is_failure()) return core::Result<core::Config>::failure(policy.error());
            config.analysis.wildcard_imports = policy.value();
        }

        if (options_.cycle_mode) {
            auto mode = core::cycle_mode_from_string(*options_.cycle_mode);
            if (mode.is_failure()) return core::Result<core::Config>::failure(mode.error());
            config.analysis.cycle_mode = mode.value();
        }

        if (options_.verbose) {
            config.logging.level = "debug";
        } else if (options_.quiet) {
            config.logging.level = "error";
        }

        config.output.title = config.report_title(options_.project_dir);

        if (auto valid = config.validate(); valid.is_failure()) {
            return core::Result<core::Config>::failure(valid.error());
        }

        return core::Result<core::Config>::success(std::move(config));
    }

    core::Result<core::AnalysisReport> App::analyze_project(const core::Config& config) const {
        if (!utils::is_directory(options_.project_dir)) {
            return core::Result<core::AnalysisReport>::failure(core::make_error_with_context(
                core::ErrorCode::INVALID_PATH,
                "Project directory does not exist: " + options_.project_dir,
                options_.project_dir));
        }

        const frontend::ProjectLoader loader(config);
        auto units = loader.load(options_.project_dir);
        if (units.is_failure()) {
            return core::Result<core::AnalysisReport>::failure(units.error());
        }

        const analysis::ProjectAnalyzer analyzer(
            options_.project_dir, analysis::AnalyzerOptions::from_config(config));
        return analyzer.analyze(units.value());
    }

    core::Result<std::size_t> App::write_requested_outputs(const core::Config& config,
                                                           const core::AnalysisReport& report) const {
        struct Sink {
            const std::optional<std::string>* path;
            core::OutputFormat format;
        };

        const Sink sinks[] = {
            {&options_.text_output, core::OutputFormat::TEXT},
            {&options_.json_output, core::OutputFormat::JSON},
            {&options_.mermaid_output, core::OutputFormat::MERMAID},
            {&options_.html_output, core::OutputFormat::HTML},
        };

        std::size_t written = 0;
        for (const auto& sink : sinks) {
            if (!*sink.path) continue;

            const auto exporter = export_module::ExporterFactory::create_exporter(sink.format, config.output);
            if (auto result = exporter->export_report(report, **sink.path); result.is_failure()) {
                return core::Result<std::size_t>::failure(result.error());
            }

            utils::logger()->info("Wrote {} report to {}", core::to_string(sink.format), **sink.path);
            ++written;
        }

        return core::Result<std::size_t>::success(written);
    }

    core::Result<void> App::write_default_output(const core::Config& config,
                                                 const core::AnalysisReport& report) const {
        if (options_.command == Command::GRAPH) {
            const auto exporter = export_module::ExporterFactory::create_exporter(core::OutputFormat::MERMAID, config.output);
            std::cout << exporter->render(report);
            return core::Result<void>::success();
        }

        const auto& output = config.output;
        const auto exporter = export_module::ExporterFactory::create_exporter(output.format, output);
        if (output.output_path.empty()) {
            std::cout << exporter->render(report);
            return core::Result<void>::success();
        }
        return exporter->export_report(report, output.output_path);
    }

    int App::execute() const {
        auto config = build_config();
        if (config.is_failure()) {
            print_error(config.error());
            return EXIT_ERROR;
        }

        if (auto logging = utils::init_logging(config.value().logging); logging.is_failure()) {
            print_error(logging.error());
            return EXIT_ERROR;
        }

        auto report = analyze_project(config.value());
        if (report.is_failure()) {
            print_error(report.error());
            return EXIT_ERROR;
        }

        auto written = write_requested_outputs(config.value(), report.value());
        if (written.is_failure()) {
            print_error(written.error());
            return EXIT_ERROR;
        }

        if (written.value() == 0) {
            if (auto result = write_default_output(config.value(), report.value()); result.is_failure()) {
                print_error(result.error());
                return EXIT_ERROR;
            }
        }

        return finish(report.value());
    }

    int App::finish(const core::AnalysisReport& report) const {
        if (options_.fail_on_findings && report.has_findings()) {
            utils::logger()->info("Findings present: {} undefined, {} unused, {} circular imports",
                                  report.undefined_symbols.size(),
                                  report.unused_symbols.size(),
                                  report.circular_imports.size());
            return EXIT_FINDINGS;
        }
        return EXIT_OK;
    }

} // namespace psa::cli
