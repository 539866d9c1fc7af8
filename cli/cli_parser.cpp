#include "cli_parser.hpp"
#include "psa/version.h"
#include <iostream>
#include <cstdlib>
#include <charconv>

namespace psa::cli {

    namespace {
        std::optional<int> parse_int(const std::string& text) {
            int value = 0;
            const auto* begin = text.data();
            const auto* end = text.data() + text.size();
            if (auto [ptr, ec] = std::from_chars(begin, end, value); ec != std::errc{} || ptr != end) {
                return std::nullopt;
            }
            return value;
        }
    }

    Command CliParser::parse_command(const std::string& cmd) {
        if (cmd == "analyze") return Command::ANALYZE;
        if (cmd == "graph") return Command::GRAPH;
        if (cmd == "help" || cmd == "--help" || cmd == "-h") return Command::HELP;
        if (cmd == "version" || cmd == "--version" || cmd == "-v") return Command::VERSION;
        return Command::UNKNOWN;
    }

    Options CliParser::parse(const int argc, char** argv) {
        if (argc < 2) {
            return Options{.command = Command::HELP};
        }

        const std::string cmd_str = argv[1];
        const Command cmd = parse_command(cmd_str);

        if (cmd == Command::HELP || cmd == Command::VERSION) {
            return Options{.command = cmd};
        }

        if (cmd == Command::UNKNOWN) {
            Options opts{.command = Command::UNKNOWN};
            opts.usage_error = "Unknown command: " + cmd_str;
            return opts;
        }

        // Check for command-specific help
        if (argc >= 3 && (std::string(argv[2]) == "--help" || std::string(argv[2]) == "-h")) {
            print_command_help(cmd);
            std::exit(0);
        }

        int index = 2;
        return parse_project_options(cmd, argc, argv, index);
    }

    Options CliParser::parse_project_options(const Command cmd, const int argc, char** argv, int& index) {
        Options opts;
        opts.command = cmd;

        auto take_value = [&](const std::string& flag) -> std::optional<std::string> {
            if (index < argc) return std::string(argv[index++]);
            opts.usage_error = "Missing value for " + flag;
            return std::nullopt;
        };

        while (index < argc && !opts.usage_error) {
            if (std::string arg = argv[index++]; arg == "--config" || arg == "-c") {
                opts.config_file = take_value(arg);
            } else if (arg == "--json") {
                opts.json_output = take_value(arg);
            } else if (arg == "--text") {
                opts.text_output = take_value(arg);
            } else if (arg == "--mermaid") {
                opts.mermaid_output = take_value(arg);
            } else if (arg == "--html") {
                opts.html_output = take_value(arg);
            } else if (arg == "--exclude" || arg == "-e") {
                if (auto value = take_value(arg)) opts.exclude_dirs.push_back(*value);
            } else if (arg == "--threads" || arg == "-j") {
                if (auto value = take_value(arg)) {
                    opts.num_threads = parse_int(*value);
                    if (!opts.num_threads) opts.usage_error = "Invalid thread count: " + *value;
                }
            } else if (arg == "--private") {
                opts.private_convention = take_value(arg);
            } else if (arg == "--wildcard") {
                opts.wildcard_policy = take_value(arg);
            } else if (arg == "--cycles") {
                opts.cycle_mode = take_value(arg);
            } else if (arg == "--fail-on-findings") {
                opts.fail_on_findings = true;
            } else if (arg == "--verbose") {
                opts.verbose = true;
            } else if (arg == "--quiet" || arg == "-q") {
                opts.quiet = true;
            } else if (!arg.empty() && arg[0] != '-') {
                if (!opts.project_dir.empty()) {
                    opts.usage_error = "Unexpected argument: " + arg;
                } else {
                    opts.project_dir = arg;
                }
            } else {
                opts.usage_error = "Unknown option: " + arg;
            }
        }

        if (!opts.usage_error && opts.project_dir.empty()) {
            opts.usage_error = "Missing <project_dir>";
        }

        return opts;
    }

    void CliParser::print_help() {
        std::cout << R"(
Python Static Analyzer (PSA) - Scope-aware analysis of Python projects

USAGE:
    psa <COMMAND> [OPTIONS]

COMMANDS:
    analyze        Report undefined/unused symbols, circular imports and coupling
    graph          Render the module dependency graph (Mermaid or HTML)
    help           Show this help message
    version        Show version information

OPTIONS (analyze, graph):
    <project_dir>               Root of the Python project
    -c, --config <file>         TOML configuration file
    --json <file>               Write the JSON report
    --text <file>               Write the text report
    --mermaid <file>            Write the Mermaid graph
    --html <file>               Write the HTML graph page
    -e, --exclude <dir>         Additional directory name to skip (repeatable)
    -j, --threads <n>           Worker threads (0 = hardware concurrency)
    --private <convention>      none | dunder | underscore
    --wildcard <policy>         flag | ignore
    --cycles <mode>             dfs | elementary
    --fail-on-findings          Exit with status 2 when findings are present
    --verbose                   Debug logging
    -q, --quiet                 Only log errors

EXIT STATUS:
    0  success
    1  usage, configuration or I/O error
    2  findings present (with --fail-on-findings)

Run 'psa <COMMAND> --help' for command-specific help.
)";
    }

    void CliParser::print_version() {
        std::cout << psa::PROJECT_SHORT_NAME << " " << psa::VERSION_STRING << "\n";
    }

    void CliParser::print_command_help(const Command cmd) {
        switch (cmd) {
            case Command::ANALYZE:
                std::cout << R"(psa analyze - Analyze a Python project

USAGE:
    psa analyze <project_dir> [OPTIONS]

Without any output option the text report is printed to stdout.

EXAMPLES:
    psa analyze ./src
    psa analyze . --json report.json --fail-on-findings
    psa analyze . --private underscore --cycles elementary
)";
                break;
            case Command::GRAPH:
                std::cout << R"(psa graph - Render the module dependency graph

USAGE:
    psa graph <project_dir> [OPTIONS]

Without --mermaid or --html the Mermaid definition is printed to stdout.
Edges on an import cycle are drawn as red dashed links.

EXAMPLES:
    psa graph . --html deps.html
)";
                break;
            default:
                print_help();
                break;
        }
    }

} // namespace psa::cli
