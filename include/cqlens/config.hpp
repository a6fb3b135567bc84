#pragma once

#include "utils.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cqlens {

    using namespace std::string_view_literals;

    /*
     * cqlens Startup Config Options
     *
     * Database
     * - db_path: CodeQL database directory holding FunctionTree.csv, Macros.csv,
     *   GlobalVars.csv, Classes.csv and src.zip.
     *
     * Session and UX
     * - history_file: Path to persisted interactive command history.
     * - history_enabled: Enable/disable persistent history writes.
     * - color_mode: ANSI color behavior for terminal output.
     * - output_mode: Result shape ("table" for text, "json" for records).
     * - banner: Print the REPL banner on startup.
     * - quiet/verbose: Coarse output verbosity knobs for app logs.
     *
     * Modes
     * - eval_commands: Run these REPL commands in order and exit.
     * - mcp: Serve the lookup tools over MCP (JSON-RPC on stdio).
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved startup config and exit.
     */

    enum class output_mode { table, json };
    enum class color_mode { automatic, always, never };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr std::string_view to_string(color_mode mode) {
        switch (mode) {
            case color_mode::automatic:
                return "auto"sv;
            case color_mode::always:
                return "always"sv;
            case color_mode::never:
                return "never"sv;
        }
        return "auto"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv) || utils::str_case_eq(text, "text"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_color_mode(std::string_view text, color_mode& out) {
        if (utils::str_case_eq(text, "auto"sv)) {
            out = color_mode::automatic;
            return true;
        }
        if (utils::str_case_eq(text, "always"sv)) {
            out = color_mode::always;
            return true;
        }
        if (utils::str_case_eq(text, "never"sv)) {
            out = color_mode::never;
            return true;
        }
        return false;
    }

    struct startup_config {
        std::filesystem::path db_path{"."};

        std::filesystem::path history_file{".cqlens/history"};
        bool history_enabled{true};
        color_mode color{color_mode::automatic};
        output_mode output{output_mode::table};
        bool banner{true};
        bool quiet{false};
        bool verbose{false};

        std::vector<std::string> eval_commands{};
        bool mcp{false};

        bool print_config{false};
    };

}  // namespace cqlens
