#include "cqlens/mcp.hpp"

#include "cqlens/format.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <csignal>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace cqlens::literals;
using namespace std::string_view_literals;

namespace cqlens::mcp {

    namespace detail {

        // ── MCP protocol types ──────────────────────────────────────────

        struct client_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = client_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct initialize_params {
            std::string protocolVersion{};
            client_info clientInfo{};
            struct glaze {
                using T = initialize_params;
                static constexpr auto value =
                        glz::object("protocolVersion", &T::protocolVersion, "clientInfo", &T::clientInfo);
            };
        };

        struct server_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = server_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct tools_capability {
            struct glaze {
                using T = tools_capability;
                static constexpr auto value = glz::object();
            };
        };

        struct server_capabilities {
            tools_capability tools{};
            struct glaze {
                using T = server_capabilities;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct initialize_result {
            std::string protocolVersion{};
            server_capabilities capabilities{};
            server_info serverInfo{};
            struct glaze {
                using T = initialize_result;
                static constexpr auto value = glz::object(
                        "protocolVersion",
                        &T::protocolVersion,
                        "capabilities",
                        &T::capabilities,
                        "serverInfo",
                        &T::serverInfo);
            };
        };

        struct tool_definition {
            std::string name{};
            std::string description{};
            glz::raw_json inputSchema{};
            struct glaze {
                using T = tool_definition;
                static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
            };
        };

        struct tools_list_result {
            std::vector<tool_definition> tools{};
            struct glaze {
                using T = tools_list_result;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct tool_call_params {
            std::string name{};
            glz::raw_json arguments{};
            struct glaze {
                using T = tool_call_params;
                static constexpr auto value = glz::object(&T::name, &T::arguments);
            };
        };

        struct text_content {
            std::string type{"text"};
            std::string text{};
            struct glaze {
                using T = text_content;
                static constexpr auto value = glz::object(&T::type, &T::text);
            };
        };

        struct tool_call_result {
            std::vector<text_content> content{};
            bool isError{false};
            struct glaze {
                using T = tool_call_result;
                static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
            };
        };

        // ── Tool arguments ──────────────────────────────────────────────

        struct location_args {
            std::string file{};
            int64_t line{};
            struct glaze {
                using T = location_args;
                static constexpr auto value = glz::object(&T::file, &T::line);
            };
        };

        struct function_args {
            std::string function_name{};
            struct glaze {
                using T = function_args;
                static constexpr auto value = glz::object(&T::function_name);
            };
        };

        struct macro_args {
            std::string macro_name{};
            struct glaze {
                using T = macro_args;
                static constexpr auto value = glz::object(&T::macro_name);
            };
        };

        struct global_var_args {
            std::string global_var_name{};
            struct glaze {
                using T = global_var_args;
                static constexpr auto value = glz::object(&T::global_var_name);
            };
        };

        struct class_args {
            std::string class_name{};
            struct glaze {
                using T = class_args;
                static constexpr auto value = glz::object(&T::class_name);
            };
        };

        // ── Tool schemas ────────────────────────────────────────────────

        struct tool_descriptor {
            std::string_view name;
            std::string_view description;
            std::string_view input_schema;
        };

        static constexpr tool_descriptor tool_descriptors[] = {
                {"function_at"sv,
                 R"(Return the code of the function that contains a given line of a source file. The function becomes known to the session, so functions it references can be fetched with function_code.)"sv,
                 R"json({"type": "object","properties": {"file": {"type": "string","description": "Source file path, or a unique substring of it"},"line": {"type": "integer","description": "Line number inside the function"}},"required": ["file", "line"]})json"sv},
                {"function_code"sv,
                 R"(Return the numbered code of a function referenced by one of the functions already shown. Qualified names are accepted; only the part after the last '::' is matched.)"sv,
                 R"json({"type": "object","properties": {"function_name": {"type": "string","description": "Function name, e.g. 'parse_header' or 'Net::parse_header'"}},"required": ["function_name"]})json"sv},
                {"caller_function"sv,
                 R"(Return the numbered code of the function that calls the named function.)"sv,
                 R"json({"type": "object","properties": {"function_name": {"type": "string","description": "Name of a function already shown"}},"required": ["function_name"]})json"sv},
                {"macro"sv,
                 R"(Return the definition of a preprocessor macro.)"sv,
                 R"json({"type": "object","properties": {"macro_name": {"type": "string"}},"required": ["macro_name"]})json"sv},
                {"global_var"sv,
                 R"(Return where a global variable is defined.)"sv,
                 R"json({"type": "object","properties": {"global_var_name": {"type": "string"}},"required": ["global_var_name"]})json"sv},
                {"class"sv,
                 R"(Return where a class, struct or union is defined. Matches the qualified or the simple name.)"sv,
                 R"json({"type": "object","properties": {"class_name": {"type": "string"}},"required": ["class_name"]})json"sv},
                {"known_functions"sv,
                 R"(List the functions shown so far in this session.)"sv,
                 R"json({"type": "object","properties": {}})json"sv},
        };

        // ── Response helpers ────────────────────────────────────────────

        template <typename T>
        static std::string make_response(const glz::rpc::id_t& id, T&& result) {
            glz::rpc::response_t<std::decay_t<T>> resp{};
            resp.id = id;
            resp.result = std::forward<T>(result);
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string make_error_response(
                const glz::rpc::id_t& id, glz::rpc::error_e code, const std::string& message) {
            glz::rpc::response_t<glz::raw_json> resp{};
            resp.id = id;
            resp.error = glz::rpc::error{code, std::nullopt, message};
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string make_tool_response(const glz::rpc::id_t& id, tool_output output) {
            tool_call_result result{};
            result.content.push_back(text_content{.text = std::move(output.text)});
            result.isError = output.is_error;
            return make_response(id, std::move(result));
        }

        static void send(const std::string& json) {
            std::cout << json << '\n';
            std::cout.flush();
        }

        // ── Handlers ────────────────────────────────────────────────────

        static std::string handle_initialize(const glz::rpc::id_t& id, glz::raw_json_view raw_params) {
            initialize_params params{};
            (void)glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str);
            debug_log("initialize from client: ", params.clientInfo.name);

            initialize_result result{};
            result.protocolVersion = "2024-11-05";
            result.capabilities = server_capabilities{};
            result.serverInfo = server_info{.name = "cqlens", .version = "0.1.0"};

            return make_response(id, std::move(result));
        }

        static std::string handle_tools_list(const glz::rpc::id_t& id) {
            tools_list_result result{};
            for (const auto& tool : tool_descriptors) {
                result.tools.push_back(
                        tool_definition{
                                .name = std::string{tool.name},
                                .description = std::string{tool.description},
                                .inputSchema = glz::raw_json{std::string{tool.input_schema}},
                        });
            }
            return make_response(id, std::move(result));
        }

        template <typename Args>
        static std::optional<Args> read_args(const glz::raw_json& raw_arguments) {
            Args args{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(args, raw_arguments.str);
            if (ec) {
                return std::nullopt;
            }
            return args;
        }

        static std::string invalid_arguments(const glz::rpc::id_t& id, std::string_view tool) {
            return make_error_response(
                    id, glz::rpc::error_e::invalid_params, "Failed to parse {} arguments"_format(tool));
        }

        static std::string missing_argument(const glz::rpc::id_t& id, std::string_view tool, std::string_view arg) {
            return make_error_response(id, glz::rpc::error_e::invalid_params, "{} requires {}"_format(tool, arg));
        }

        static std::string handle_tools_call(
                const glz::rpc::id_t& id, glz::raw_json_view raw_params, lookup_session& session) {
            tool_call_params params{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str);
            if (ec) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "Failed to parse tool call params");
            }

            if (params.name == "function_at") {
                auto args = read_args<location_args>(params.arguments);
                if (!args) {
                    return invalid_arguments(id, params.name);
                }
                if (args->file.empty()) {
                    return missing_argument(id, params.name, "file");
                }
                return make_tool_response(id, session.function_at(args->file, args->line));
            }
            if (params.name == "function_code" || params.name == "caller_function") {
                auto args = read_args<function_args>(params.arguments);
                if (!args) {
                    return invalid_arguments(id, params.name);
                }
                if (args->function_name.empty()) {
                    return missing_argument(id, params.name, "function_name");
                }
                return make_tool_response(
                        id,
                        params.name == "function_code" ? session.function_code(args->function_name)
                                                       : session.caller_function(args->function_name));
            }
            if (params.name == "macro") {
                auto args = read_args<macro_args>(params.arguments);
                if (!args) {
                    return invalid_arguments(id, params.name);
                }
                if (args->macro_name.empty()) {
                    return missing_argument(id, params.name, "macro_name");
                }
                return make_tool_response(id, session.macro(args->macro_name));
            }
            if (params.name == "global_var") {
                auto args = read_args<global_var_args>(params.arguments);
                if (!args) {
                    return invalid_arguments(id, params.name);
                }
                if (args->global_var_name.empty()) {
                    return missing_argument(id, params.name, "global_var_name");
                }
                return make_tool_response(id, session.global_var(args->global_var_name));
            }
            if (params.name == "class") {
                auto args = read_args<class_args>(params.arguments);
                if (!args) {
                    return invalid_arguments(id, params.name);
                }
                if (args->class_name.empty()) {
                    return missing_argument(id, params.name, "class_name");
                }
                return make_tool_response(id, session.class_info(args->class_name));
            }
            if (params.name == "known_functions") {
                return make_tool_response(id, session.known());
            }

            return make_error_response(id, glz::rpc::error_e::invalid_params, "Unknown tool: {}"_format(params.name));
        }

    }  // namespace detail

    std::optional<std::string> handle_message(std::string_view line, lookup_session& session) {
        glz::rpc::generic_request_t request{};
        auto ec = glz::read_json(request, line);
        if (ec) {
            return detail::make_error_response({}, glz::rpc::error_e::parse_error, "JSON parse error");
        }

        bool is_notification = std::holds_alternative<glz::generic::null_t>(request.id);

        if (request.method == "initialize"sv) {
            return detail::handle_initialize(request.id, request.params);
        }
        if (request.method == "notifications/initialized"sv) {
            return std::nullopt;
        }
        if (request.method == "tools/list"sv) {
            return detail::handle_tools_list(request.id);
        }
        if (request.method == "tools/call"sv) {
            return detail::handle_tools_call(request.id, request.params, session);
        }
        if (is_notification) {
            return std::nullopt;
        }
        return detail::make_error_response(
                request.id,
                glz::rpc::error_e::method_not_found,
                "Unknown method: {}"_format(std::string{request.method}));
    }

    // ── Server entry point ──────────────────────────────────────────

    int run_mcp_server(startup_config& cfg) {
        ::signal(SIGPIPE, SIG_IGN);

        lookup_session session{cfg.db_path, cfg.output};
        if (cfg.verbose) {
            std::cerr << "serving MCP for database: " << cfg.db_path.string() << '\n';
        }

        std::string line{};
        while (std::getline(std::cin, line)) {
            if (line.empty()) {
                continue;
            }
            if (auto response = handle_message(line, session)) {
                detail::send(*response);
            }
        }

        return 0;
    }

}  // namespace cqlens::mcp
