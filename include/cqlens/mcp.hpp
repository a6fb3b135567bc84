#pragma once

#include "config.hpp"
#include "session.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace cqlens::mcp {

    // Handles one JSON-RPC message; nullopt for notifications that need no response.
    std::optional<std::string> handle_message(std::string_view line, lookup_session& session);

    // Line-delimited JSON-RPC over stdin/stdout until EOF; returns the process exit code.
    int run_mcp_server(startup_config& cfg);

}  // namespace cqlens::mcp
