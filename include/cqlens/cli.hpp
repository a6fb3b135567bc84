#pragma once

#include "config.hpp"
#include "session.hpp"

#include <iosfwd>
#include <optional>
#include <string_view>

namespace cqlens::cli {

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

    // Runs one REPL command against `session`. Returns false for input that is not a command.
    bool process_command(
            std::string_view line,
            startup_config& cfg,
            lookup_session& session,
            bool& should_quit,
            std::ostream& out,
            std::ostream& err);

    // --eval mode; returns the process exit code
    int run_eval(startup_config& cfg);

    void run_repl(startup_config& cfg);

}  // namespace cqlens::cli
