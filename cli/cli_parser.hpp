#ifndef PSA_CLI_PARSER_HPP
#define PSA_CLI_PARSER_HPP

#include <string>
#include <vector>
#include <optional>

namespace psa::cli {

    enum class Command {
        ANALYZE,
        GRAPH,
        HELP,
        VERSION,
        UNKNOWN
    };

    struct Options {
        Command command = Command::UNKNOWN;

        std::string project_dir;
        std::optional<std::string> config_file;

        std::optional<std::string> json_output;
        std::optional<std::string> text_output;
        std::optional<std::string> mermaid_output;
        std::optional<std::string> html_output;

        std::vector<std::string> exclude_dirs;
        std::optional<int> num_threads;
        std::optional<std::string> private_convention;
        std::optional<std::string> wildcard_policy;
        std::optional<std::string> cycle_mode;

        bool fail_on_findings = false;
        bool verbose = false;
        bool quiet = false;

        /// Set when the command line could not be parsed; the app reports it and exits with 1.
        std::optional<std::string> usage_error;
    };

    class CliParser {
    public:
        static Options parse(int argc, char** argv);
        static void print_help();
        static void print_command_help(Command cmd);
        static void print_version();

    private:
        static Command parse_command(const std::string& cmd);
        static Options parse_project_options(Command cmd, int argc, char** argv, int& index);
    };

} // namespace psa::cli

#endif //PSA_CLI_PARSER_HPP
