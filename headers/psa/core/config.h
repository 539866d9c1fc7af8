#ifndef PSA_CORE_CONFIG_H
#define PSA_CORE_CONFIG_H

#include "psa/core/result.h"
#include <cstddef>
#include <string>
#include <vector>

namespace psa::core {

    enum class OutputFormat {
        TEXT,
        JSON,
        MERMAID,
        HTML
    };

    /**
     * Which definitions are excluded from the unused-symbol report by name.
     */
    enum class PrivateConvention {
        NONE,         ///< Report every unused definition.
        DUNDER,       ///< Skip `__name__`-style names.
        UNDERSCORE    ///< Skip every name starting with '_'.
    };

    /**
     * What to do with `from X import *`.
     */
    enum class WildcardPolicy {
        FLAG,
        IGNORE
    };

    enum class CycleMode {
        DFS,          ///< One representative per DFS back edge, deduplicated by member set.
        ELEMENTARY    ///< Every elementary cycle, capped by max_cycles.
    };

    struct AnalysisConfig {
        PrivateConvention private_convention = PrivateConvention::DUNDER;
        WildcardPolicy wildcard_imports = WildcardPolicy::FLAG;
        CycleMode cycle_mode = CycleMode::DFS;
        std::size_t max_cycles = 1000;
        std::vector<std::string> extra_builtins;
    };

    struct FilterConfig {
        std::vector<std::string> ignore_dirs = {
            ".git", "__pycache__", "venv", ".venv", "node_modules",
            "dist", "build", ".pytest_cache", ".mypy_cache", ".tox", ".eggs"
        };
        std::vector<std::string> ignore_paths;
    };

    struct OutputConfig {
        OutputFormat format = OutputFormat::TEXT;
        std::string output_path;
        bool pretty_print = true;
        std::string title;   ///< HTML report heading; empty keeps the exporter default.
    };

    struct PerformanceConfig {
        int num_threads = 0;
    };

    struct LoggingConfig {
        std::string level = "info";
        std::string file;
        bool console = true;
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    };

    class Config {
    public:
        Config() = default;

        std::string project_name;

        AnalysisConfig analysis;
        FilterConfig filters;
        OutputConfig output;
        PerformanceConfig performance;
        LoggingConfig logging;

        /**
         * Load configuration from a TOML file.
         *
         * @param path Filesystem path to the config file.
         * @return Result containing a Config if successful, or an Error on failure.
         */
        static Result<Config> load_from_file(const std::string& path);

        /**
         * Load configuration from TOML text. Keys that are absent keep their defaults.
         */
        static Result<Config> load_from_string(const std::string& content);

        static Config default_config();

        /**
         * Save this configuration to a file on disk.
         *
         * @param path Filesystem path where the config should be written.
         * @return Result<void> — success or Error if writing fails.
         */
        [[nodiscard]] Result<void> save_to_file(const std::string& path) const;

        /**
         * Serialize the configuration back to TOML.
         */
        [[nodiscard]] std::string to_string() const;

        /**
         * Validate that this configuration is internally consistent.
         *
         * @return Result<void> — success if valid, or an INVALID_CONFIG error listing every problem.
         */
        [[nodiscard]] Result<void> validate() const;

        /**
         * Merge another configuration into this one.
         *
         * Only the fields `other` sets to a non-default value override this instance.
         */
        void merge_with(const Config& other);

        /**
         * Determine whether `path` should be skipped by the file enumerator.
         *
         * A path is ignored when one of its components is listed in
         * `filters.ignore_dirs` or when it contains one of `filters.ignore_paths`.
         */
        [[nodiscard]] bool is_path_ignored(const std::string& path) const;

        /**
         * Heading for graph reports.
         *
         * `output.title` when set, otherwise "Dependency Graph for <name>" where
         * the name is `project_name` or the last component of `project_dir`.
         */
        [[nodiscard]] std::string report_title(const std::string& project_dir) const;
    };

    std::string to_string(OutputFormat format);
    std::string to_string(PrivateConvention convention);
    std::string to_string(WildcardPolicy policy);
    std::string to_string(CycleMode mode);

    Result<OutputFormat> output_format_from_string(const std::string& str);
    Result<PrivateConvention> private_convention_from_string(const std::string& str);
    Result<WildcardPolicy> wildcard_policy_from_string(const std::string& str);
    Result<CycleMode> cycle_mode_from_string(const std::string& str);

}

#endif //PSA_CORE_CONFIG_H
