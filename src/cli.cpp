#include "cqlens/cli.hpp"
#include "cqlens/format.hpp"

#include "editor.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace cqlens::literals;

namespace cqlens::cli {

    namespace detail {

        using namespace std::string_view_literals;
        namespace fs = std::filesystem;

        static void print_config(const startup_config& cfg, std::ostream& os) {
            os << "db=" << cfg.db_path.string() << '\n';
            os << "output={}\ncolor={}\n"_format(cfg.output, cfg.color);
            os << "history=" << (cfg.history_enabled ? cfg.history_file.string() : "<disabled>") << '\n';
            os << "mode=" << (cfg.mcp ? "mcp" : (cfg.eval_commands.empty() ? "repl" : "eval")) << '\n';
        }

        static void print_help(std::ostream& os) {
            os << "commands:\n";
            os << "  :help\n";
            os << "  :show config\n";
            os << "  :set <key>=<value>       (output=table|json)\n";
            os << "  :line <file> <line>      enclosing function and its code\n";
            os << "  :function <name>         function reachable from known functions\n";
            os << "  :caller <name>           caller of a known function\n";
            os << "  :macro <name>\n";
            os << "  :global <name>\n";
            os << "  :class <name>\n";
            os << "  :known                   functions surfaced so far\n";
            os << "  :reset                   forget known functions\n";
            os << "  :quit\n";
            os << "examples:\n";
            os << "  :line src/net.c 120\n";
            os << "  :function parse_header\n";
            os << "  :set output=json\n";
        }

        static bool apply_set_command(
                startup_config& cfg, lookup_session& session, std::string_view assignment, std::ostream& err) {
            auto eq = assignment.find('=');
            if (eq == std::string_view::npos) {
                err << "invalid :set, expected key=value\n";
                return false;
            }

            auto key = utils::trim_view(assignment.substr(0, eq));
            auto value = utils::trim_view(assignment.substr(eq + 1U));
            if (key.empty() || value.empty()) {
                err << "invalid :set, key and value must be non-empty\n";
                return false;
            }

            if (key == "output"sv) {
                if (!try_parse_output_mode(value, cfg.output)) {
                    err << "invalid output: " << value << " (expected table|json)\n";
                    return false;
                }
                session.set_output(cfg.output);
                return true;
            }

            err << "unknown :set key: " << key << '\n';
            return false;
        }

        static void emit(const tool_output& result, std::ostream& out, std::ostream& err) {
            (result.is_error ? err : out) << result.text << '\n';
        }

        // splits "<file> <line>"; the file may contain spaces, the line is the last token
        static std::optional<std::pair<std::string_view, int64_t>> parse_location(std::string_view args) {
            args = utils::trim_view(args);
            auto sp = args.find_last_of(" \t");
            if (sp == std::string_view::npos) {
                return std::nullopt;
            }
            auto file = utils::trim_view(args.substr(0, sp));
            auto line = utils::parse_integer<int64_t>(args.substr(sp + 1U));
            if (file.empty() || !line) {
                return std::nullopt;
            }
            return std::pair{file, *line};
        }

        static std::optional<std::string_view> command_argument(std::string_view cmd, std::string_view name) {
            if (!cmd.starts_with(name)) {
                return std::nullopt;
            }
            auto rest = cmd.substr(name.size());
            if (!rest.empty() && rest.front() != ' ' && rest.front() != '\t') {
                return std::nullopt;
            }
            return utils::trim_view(rest);
        }

        static std::optional<std::string> normalize_optional(std::string value) {
            auto trimmed = utils::trim_view(value);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return std::string(trimmed);
        }

    }  // namespace detail

    bool process_command(
            std::string_view line,
            startup_config& cfg,
            lookup_session& session,
            bool& should_quit,
            std::ostream& out,
            std::ostream& err) {
        using namespace std::string_view_literals;

        auto cmd = utils::trim_view(line);
        if (cmd == ":quit"sv || cmd == ":q"sv) {
            should_quit = true;
            return true;
        }
        if (cmd == ":help"sv) {
            detail::print_help(out);
            return true;
        }
        if (cmd == ":show config"sv) {
            detail::print_config(cfg, out);
            return true;
        }
        if (cmd == ":known"sv) {
            detail::emit(session.known(), out, err);
            return true;
        }
        if (cmd == ":reset"sv) {
            session.reset();
            out << "known functions cleared\n";
            return true;
        }
        if (auto assignment = detail::command_argument(cmd, ":set"sv)) {
            if (detail::apply_set_command(cfg, session, *assignment, err)) {
                out << "updated " << *assignment << '\n';
            }
            return true;
        }
        if (auto args = detail::command_argument(cmd, ":line"sv)) {
            auto location = detail::parse_location(*args);
            if (!location) {
                err << "usage: :line <file> <line>\n";
                return true;
            }
            detail::emit(session.function_at(location->first, location->second), out, err);
            return true;
        }

        struct name_command {
            std::string_view name;
            tool_output (lookup_session::*handler)(std::string_view);
        };
        static constexpr name_command name_commands[] = {
                {":function"sv, &lookup_session::function_code},
                {":caller"sv, &lookup_session::caller_function},
                {":macro"sv, &lookup_session::macro},
                {":global"sv, &lookup_session::global_var},
                {":class"sv, &lookup_session::class_info},
        };
        for (const auto& command : name_commands) {
            if (auto name = detail::command_argument(cmd, command.name)) {
                if (name->empty()) {
                    err << "usage: " << command.name << " <name>\n";
                    return true;
                }
                detail::emit((session.*command.handler)(*name), out, err);
                return true;
            }
        }

        if (cmd.starts_with(":"sv)) {
            err << "unknown command: " << cmd << '\n';
            return true;
        }
        return false;
    }

    int run_eval(startup_config& cfg) {
        lookup_session session{cfg.db_path, cfg.output};
        bool should_quit = false;
        for (const auto& command : cfg.eval_commands) {
            if (!process_command(command, cfg, session, should_quit, std::cout, std::cerr)) {
                std::cerr << "not a command: " << command << '\n';
                return 2;
            }
            if (should_quit) {
                break;
            }
        }
        return 0;
    }

    static constexpr auto banner = R"(
 .----------------------------------.
 |  cqlens : codeql database lookup |
 '----------------------------------'
)";

    void run_repl(startup_config& cfg) {
        lookup_session session{cfg.db_path, cfg.output};
        line_editor editor{cfg, session};
        bool should_quit = false;

        if (cfg.banner) {
            std::cout << banner << '\n';
        }
        if (!cfg.quiet) {
            std::cout << "db: " << cfg.db_path.string() << '\n';
            std::cout << "type :help for commands\n";
        }

        while (!should_quit) {
            auto next_line = editor.read_line("cqlens> ");
            if (!next_line) {
                std::cout << '\n';
                break;
            }

            auto line = utils::trim_view(*next_line);
            if (line.empty()) {
                continue;
            }

            editor.record_history(line);

            if (!process_command(line, cfg, session, should_quit, std::cout, std::cerr)) {
                std::cerr << "commands start with ':' (try :help)\n";
            }
        }
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"cqlens"};

        bool show_version = false;
        std::string db_arg{cfg.db_path.string()};
        std::string output_arg{std::string{to_string(cfg.output)}};
        std::string color_arg{std::string{to_string(cfg.color)}};
        std::string history_file_arg{cfg.history_file.string()};
        std::string banner_arg{"true"};
        bool no_history = false;

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("-d,--db", db_arg, "CodeQL database directory (CSV exports and src.zip)");
        app.add_option("--output", output_arg, "Output mode: table|json");
        app.add_option("--color", color_arg, "Color mode: auto|always|never");
        app.add_flag("--no-color", "Force color mode to never");
        app.add_option("--history-file", history_file_arg, "Persistent REPL history path");
        app.add_flag("--no-history", no_history, "Disable persistent REPL history");
        app.add_option("--banner", banner_arg, "Print REPL banner: true|false");
        app.add_option("-e,--eval", cfg.eval_commands, "Run a REPL command and exit (repeatable)");
        app.add_flag("--mcp", cfg.mcp, "Serve lookup tools over MCP on stdio");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress non-essential output");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }
        if (cfg.mcp && !cfg.eval_commands.empty()) {
            std::cerr << "--mcp and --eval are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (!try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{2};
        }
        if (!try_parse_color_mode(color_arg, cfg.color)) {
            std::cerr << "invalid --color value: " << color_arg << " (expected auto|always|never)\n";
            return std::optional<int>{2};
        }
        if (utils::str_case_eq(banner_arg, "false") || banner_arg == "0") {
            cfg.banner = false;
        }
        else if (utils::str_case_eq(banner_arg, "true") || banner_arg == "1") {
            cfg.banner = true;
        }
        else {
            std::cerr << "invalid --banner value: " << banner_arg << " (expected true|false)\n";
            return std::optional<int>{2};
        }

        auto db = detail::normalize_optional(db_arg);
        if (!db) {
            std::cerr << "--db must not be empty\n";
            return std::optional<int>{2};
        }
        cfg.db_path = *db;
        cfg.history_file = history_file_arg;
        if (no_history) {
            cfg.history_enabled = false;
        }

        if (app.get_option("--no-color")->count() > 0U) {
            cfg.color = color_mode::never;
        }

        if (show_version) {
            std::cout << "cqlens 0.1.0\n";
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        if (cfg.verbose) {
            std::error_code ec{};
            if (!detail::fs::is_directory(cfg.db_path, ec)) {
                std::cerr << "warning: database directory does not exist: " << cfg.db_path.string() << '\n';
            }
            std::cerr << "using database: " << cfg.db_path.string() << '\n';
        }

        return std::nullopt;
    }

}  // namespace cqlens::cli
