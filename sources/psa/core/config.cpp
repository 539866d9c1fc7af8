#include "psa/core/config.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>

#include "psa/utils/file_utils.h"
#include "psa/utils/path_utils.h"
#include "psa/utils/string_utils.h"
#include <toml++/toml.h>
#include <sstream>

namespace psa::core
{
    namespace {

        std::vector<std::string> string_array(const toml::array& array) {
            std::vector<std::string> values;
            for (const auto& item : array) {
                if (auto value = item.value<std::string>()) {
                    values.push_back(*value);
                }
            }
            return values;
        }

        // TOML basic string, quotes included.
        std::string quoted(const std::string_view value) {
            std::string out;
            out.reserve(value.size() + 2);
            out += '"';
            for (const char c : value) {
                switch (c) {
                    case '"': out += "\\\""; break;
                    case '\\': out += "\\\\"; break;
                    case '\b': out += "\\b"; break;
                    case '\t': out += "\\t"; break;
                    case '\n': out += "\\n"; break;
                    case '\f': out += "\\f"; break;
                    case '\r': out += "\\r"; break;
                    default:
                        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
                            char escaped[8];
                            std::snprintf(escaped, sizeof(escaped), "\\u%04x", static_cast<unsigned char>(c));
                            out += escaped;
                        } else {
                            out += c;
                        }
                }
            }
            out += '"';
            return out;
        }

        void write_string_array(std::ostringstream& ss, const std::vector<std::string>& values) {
            ss << "[";
            for (std::size_t i = 0; i < values.size(); ++i) {
                if (i > 0) ss << ", ";
                ss << quoted(values[i]);
            }
            ss << "]\n";
        }

        bool is_log_level(const std::string& level) {
            static const std::vector<std::string> levels = {
                "trace", "debug", "info", "warn", "error", "critical", "off"
            };
            return std::ranges::find(levels, utils::to_lower(level)) != levels.end();
        }

    }

    Result<Config> Config::load_from_file(const std::string& path) {
        const auto content = utils::read_file(path);
        if (!content) {
            return Result<Config>::failure(make_error_with_context(
                ErrorCode::FILE_NOT_FOUND, "Configuration file not found: " + path, path));
        }

        return load_from_string(*content);
    }

    Result<Config> Config::load_from_string(const std::string& content) {
        try {
            auto tbl = toml::parse(content);
            Config config;

            if (tbl["general"]) {
                auto& general = *tbl["general"].as_table();
                if (general["project_name"]) config.project_name = general["project_name"].value_or("");
            }

            if (tbl["analysis"]) {
                auto& analysis = *tbl["analysis"].as_table();
                if (analysis["private_convention"]) {
                    auto convention = private_convention_from_string(analysis["private_convention"].value_or("dunder"));
                    if (convention.is_failure()) return Result<Config>::failure(convention.error());
                    config.analysis.private_convention = convention.value();
                }
                if (analysis["wildcard_imports"]) {
                    auto policy = wildcard_policy_from_string(analysis["wildcard_imports"].value_or("flag"));
                    if (policy.is_failure()) return Result<Config>::failure(policy.error());
                    config.analysis.wildcard_imports = policy.value();
                }
                if (analysis["cycle_mode"]) {
                    auto mode = cycle_mode_from_string(analysis["cycle_mode"].value_or("dfs"));
                    if (mode.is_failure()) return Result<Config>::failure(mode.error());
                    config.analysis.cycle_mode = mode.value();
                }
                if (analysis["max_cycles"]) {
                    const auto max_cycles = analysis["max_cycles"].value_or<int64_t>(1000);
                    config.analysis.max_cycles = max_cycles > 0 ? static_cast<std::size_t>(max_cycles) : 0;
                }
                if (analysis["extra_builtins"] && analysis["extra_builtins"].is_array()) {
                    config.analysis.extra_builtins = string_array(*analysis["extra_builtins"].as_array());
                }
            }

            if (tbl["filters"]) {
                auto& filters = *tbl["filters"].as_table();
                if (filters["ignore_dirs"] && filters["ignore_dirs"].is_array()) {
                    config.filters.ignore_dirs = string_array(*filters["ignore_dirs"].as_array());
                }
                if (filters["ignore_paths"] && filters["ignore_paths"].is_array()) {
                    config.filters.ignore_paths = string_array(*filters["ignore_paths"].as_array());
                }
            }

            if (tbl["output"]) {
                auto& output = *tbl["output"].as_table();
                if (output["format"]) {
                    auto format = output_format_from_string(output["format"].value_or("text"));
                    if (format.is_failure()) return Result<Config>::failure(format.error());
                    config.output.format = format.value();
                }
                if (output["output_path"])
                    config.output.output_path = output["output_path"].value_or("");
                if (output["title"])
                    config.output.title = output["title"].value_or("");
                if (output["pretty_print"])
                    config.output.pretty_print = output["pretty_print"].value_or(true);
            }

            if (tbl["performance"]) {
                auto& perf = *tbl["performance"].as_table();
                if (perf["num_threads"])
                    config.performance.num_threads = perf["num_threads"].value_or(0);
            }

            if (tbl["logging"]) {
                auto& log = *tbl["logging"].as_table();
                if (log["level"])
                    config.logging.level = log["level"].value_or("info");
                if (log["file"])
                    config.logging.file = log["file"].value_or("");
                if (log["console"])
                    config.logging.console = log["console"].value_or(true);
                if (log["pattern"])
                    config.logging.pattern = log["pattern"].value_or(LoggingConfig{}.pattern);
            }

            if (auto validation_result = config.validate(); !validation_result.is_success()) {
                return Result<Config>::failure(validation_result.error());
            }

            return Result<Config>::success(std::move(config));

        } catch (const toml::parse_error& err) {
            return Result<Config>::failure(ErrorCode::PARSE_ERROR,
                                           "Failed to parse TOML configuration: " + std::string(err.description()));
        }
    }

    Config Config::default_config() {
        return Config{};
    }

    Result<void> Config::save_to_file(const std::string& path) const {
        if (!utils::write_file_atomic(path, to_string())) {
            return Result<void>::failure(make_error_with_context(
                ErrorCode::FILE_WRITE_ERROR, "Failed to write configuration to file: " + path, path));
        }

        return Result<void>::success();
    }

    std::string Config::to_string() const {
        std::ostringstream ss;

        ss << "[general]\n";
        ss << "project_name = " << quoted(project_name) << "\n\n";

        ss << "[analysis]\n";
        ss << "private_convention = \"" << psa::core::to_string(analysis.private_convention) << "\"\n";
        ss << "wildcard_imports = \"" << psa::core::to_string(analysis.wildcard_imports) << "\"\n";
        ss << "cycle_mode = \"" << psa::core::to_string(analysis.cycle_mode) << "\"\n";
        ss << "max_cycles = " << analysis.max_cycles << "\n";
        ss << "extra_builtins = ";
        write_string_array(ss, analysis.extra_builtins);
        ss << "\n";

        ss << "[filters]\n";
        ss << "ignore_dirs = ";
        write_string_array(ss, filters.ignore_dirs);
        ss << "ignore_paths = ";
        write_string_array(ss, filters.ignore_paths);
        ss << "\n";

        ss << "[output]\n";
        ss << "format = \"" << psa::core::to_string(output.format) << "\"\n";
        ss << "output_path = " << quoted(output.output_path) << "\n";
        ss << "title = " << quoted(output.title) << "\n";
        ss << "pretty_print = " << (output.pretty_print ? "true" : "false") << "\n\n";

        ss << "[performance]\n";
        ss << "num_threads = " << performance.num_threads << "\n\n";

        ss << "[logging]\n";
        ss << "level = " << quoted(logging.level) << "\n";
        ss << "file = " << quoted(logging.file) << "\n";
        ss << "console = " << (logging.console ? "true" : "false") << "\n";
        ss << "pattern = " << quoted(logging.pattern) << "\n";

        return ss.str();
    }

    Result<void> Config::validate() const {
        std::vector<std::string> errors;

        if (analysis.max_cycles == 0) {
            errors.emplace_back("max_cycles must be positive");
        }

        for (const auto& name : analysis.extra_builtins) {
            if (!utils::is_identifier(name)) {
                errors.emplace_back("extra_builtins entry is not an identifier: '" + name + "'");
            }
        }

        if (std::ranges::any_of(filters.ignore_dirs, [](const std::string& dir) { return dir.empty(); })) {
            errors.emplace_back("ignore_dirs must not contain empty entries");
        }

        if (performance.num_threads < 0) {
            errors.emplace_back("num_threads must be non-negative");
        }

        if (!is_log_level(logging.level)) {
            errors.emplace_back("unknown logging level '" + logging.level + "'");
        }

        if (!errors.empty()) {
            return Result<void>::failure(ErrorCode::INVALID_CONFIG,
                                         "Configuration validation failed:\n  " + utils::join(errors, "\n  "));
        }

        return Result<void>::success();
    }

    void Config::merge_with(const Config& other) {
        const Config defaults;

        if (!other.project_name.empty()) project_name = other.project_name;

        if (other.analysis.private_convention != defaults.analysis.private_convention)
            analysis.private_convention = other.analysis.private_convention;
        if (other.analysis.wildcard_imports != defaults.analysis.wildcard_imports)
            analysis.wildcard_imports = other.analysis.wildcard_imports;
        if (other.analysis.cycle_mode != defaults.analysis.cycle_mode)
            analysis.cycle_mode = other.analysis.cycle_mode;
        if (other.analysis.max_cycles != defaults.analysis.max_cycles)
            analysis.max_cycles = other.analysis.max_cycles;
        if (!other.analysis.extra_builtins.empty())
            analysis.extra_builtins = other.analysis.extra_builtins;

        if (other.filters.ignore_dirs != defaults.filters.ignore_dirs)
            filters.ignore_dirs = other.filters.ignore_dirs;
        if (!other.filters.ignore_paths.empty())
            filters.ignore_paths = other.filters.ignore_paths;

        if (other.output.format != defaults.output.format) output.format = other.output.format;
        if (!other.output.output_path.empty()) output.output_path = other.output.output_path;
        if (!other.output.title.empty()) output.title = other.output.title;
        if (other.output.pretty_print != defaults.output.pretty_print) output.pretty_print = other.output.pretty_print;

        if (other.performance.num_threads != defaults.performance.num_threads)
            performance.num_threads = other.performance.num_threads;

        if (other.logging.level != defaults.logging.level) logging.level = other.logging.level;
        if (!other.logging.file.empty()) logging.file = other.logging.file;
        if (other.logging.console != defaults.logging.console) logging.console = other.logging.console;
        if (other.logging.pattern != defaults.logging.pattern) logging.pattern = other.logging.pattern;
    }

    bool Config::is_path_ignored(const std::string& path) const {
        for (const auto& component : std::filesystem::path(path)) {
            if (std::ranges::find(filters.ignore_dirs, component.string()) != filters.ignore_dirs.end()) {
                return true;
            }
        }

        return std::ranges::any_of(filters.ignore_paths,
        [&](const std::string& pattern) {
            return !pattern.empty() && utils::contains(path, pattern);
        });
    }

    std::string Config::report_title(const std::string& project_dir) const {
        if (!output.title.empty()) {
            return output.title;
        }

        std::string name = project_name;
        if (name.empty()) {
            const std::filesystem::path root(utils::canonical_path(project_dir));
            name = root.has_filename() ? root.filename().string() : root.parent_path().filename().string();
        }
        return "Dependency Graph for " + name;
    }

    std::string to_string(const OutputFormat format) {
        switch (format) {
            case OutputFormat::TEXT: return "text";
            case OutputFormat::JSON: return "json";
            case OutputFormat::MERMAID: return "mermaid";
            case OutputFormat::HTML: return "html";
            default: return "unknown";
        }
    }

    std::string to_string(const PrivateConvention convention) {
        switch (convention) {
            case PrivateConvention::NONE: return "none";
            case PrivateConvention::DUNDER: return "dunder";
            case PrivateConvention::UNDERSCORE: return "underscore";
            default: return "unknown";
        }
    }

    std::string to_string(const WildcardPolicy policy) {
        switch (policy) {
            case WildcardPolicy::FLAG: return "flag";
            case WildcardPolicy::IGNORE: return "ignore";
            default: return "unknown";
        }
    }

    std::string to_string(const CycleMode mode) {
        switch (mode) {
            case CycleMode::DFS: return "dfs";
            case CycleMode::ELEMENTARY: return "elementary";
            default: return "unknown";
        }
    }

    Result<OutputFormat> output_format_from_string(const std::string& str) {
        const auto value = utils::to_lower(str);
        if (value == "text") return Result<OutputFormat>::success(OutputFormat::TEXT);
        if (value == "json") return Result<OutputFormat>::success(OutputFormat::JSON);
        if (value == "mermaid" || value == "mmd") return Result<OutputFormat>::success(OutputFormat::MERMAID);
        if (value == "html") return Result<OutputFormat>::success(OutputFormat::HTML);
        return Result<OutputFormat>::failure(ErrorCode::INVALID_CONFIG,
                                             "Unknown output format '" + str + "' (expected text, json, mermaid or html)");
    }

    Result<PrivateConvention> private_convention_from_string(const std::string& str) {
        const auto value = utils::to_lower(str);
        if (value == "none") return Result<PrivateConvention>::success(PrivateConvention::NONE);
        if (value == "dunder") return Result<PrivateConvention>::success(PrivateConvention::DUNDER);
        if (value == "underscore") return Result<PrivateConvention>::success(PrivateConvention::UNDERSCORE);
        return Result<PrivateConvention>::failure(ErrorCode::INVALID_CONFIG,
                                                  "Unknown private convention '" + str + "' (expected none, dunder or underscore)");
    }

    Result<WildcardPolicy> wildcard_policy_from_string(const std::string& str) {
        const auto value = utils::to_lower(str);
        if (value == "flag") return Result<WildcardPolicy>::success(WildcardPolicy::FLAG);
        if (value == "ignore") return Result<WildcardPolicy>::success(WildcardPolicy::IGNORE);
        return Result<WildcardPolicy>::failure(ErrorCode::INVALID_CONFIG,
                                               "Unknown wildcard import policy '" + str + "' (expected flag or ignore)");
    }

    Result<CycleMode> cycle_mode_from_string(const std::string& str) {
        const auto value = utils::to_lower(str);
        if (value == "dfs") return Result<CycleMode>::success(CycleMode::DFS);
        if (value == "elementary") return Result<CycleMode>::success(CycleMode::ELEMENTARY);
        return Result<CycleMode>::failure(ErrorCode::INVALID_CONFIG,
                                          "Unknown cycle mode '" + str + "' (expected dfs or elementary)");
    }

} // namespace psa::core
