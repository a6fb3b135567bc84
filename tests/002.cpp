#include "utils.hpp"

#include "cqlens/cli.hpp"

#include <vector>

namespace cqlens::test {

    namespace detail {
        std::vector<char*> to_argv(std::vector<std::string>& args) {
            std::vector<char*> argv{};
            argv.reserve(args.size());
            for (auto& arg : args) {
                argv.push_back(arg.data());
            }
            return argv;
        }
    }  // namespace detail

    TEST_CASE("002: parse_cli accepts startup options", "[002][cli]") {
        startup_config cfg{};
        std::vector<std::string> args{
                "cqlens",
                "--db",
                "/tmp/codeql-db",
                "--output",
                "json",
                "--color",
                "always",
                "--history-file",
                "/tmp/cqlens-history",
                "--no-history",
                "--banner",
                "false",
                "-e",
                ":macro MAX",
                "-e",
                ":known",
                "--verbose"};
        auto argv = detail::to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        CHECK(!result);
        CHECK(cfg.db_path.string() == "/tmp/codeql-db");
        CHECK(cfg.output == output_mode::json);
        CHECK(cfg.color == color_mode::always);
        CHECK(cfg.history_file.string() == "/tmp/cqlens-history");
        CHECK_FALSE(cfg.history_enabled);
        CHECK_FALSE(cfg.banner);
        CHECK(cfg.verbose);
        REQUIRE(cfg.eval_commands.size() == 2U);
        CHECK(cfg.eval_commands[0] == ":macro MAX");
        CHECK(cfg.eval_commands[1] == ":known");
    }

    TEST_CASE("002: parse_cli no-color overrides color", "[002][cli]") {
        startup_config cfg{};
        std::vector<std::string> args{"cqlens", "--color", "always", "--no-color"};
        auto argv = detail::to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        CHECK(!result);
        CHECK(cfg.color == color_mode::never);
    }

    TEST_CASE("002: parse_cli rejects invalid combinations", "[002][cli]") {
        SECTION("invalid output value") {
            startup_config cfg{};
            std::vector<std::string> args{"cqlens", "--output", "yaml"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("invalid banner value") {
            startup_config cfg{};
            std::vector<std::string> args{"cqlens", "--banner", "maybe"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("quiet and verbose cannot be combined") {
            startup_config cfg{};
            std::vector<std::string> args{"cqlens", "--quiet", "--verbose"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("mcp and eval cannot be combined") {
            startup_config cfg{};
            std::vector<std::string> args{"cqlens", "--mcp", "-e", ":known"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("empty database path") {
            startup_config cfg{};
            std::vector<std::string> args{"cqlens", "--db", "  "};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }
    }

    TEST_CASE("002: parse_cli handles one-shot exits", "[002][cli]") {
        SECTION("version") {
            startup_config cfg{};
            std::vector<std::string> args{"cqlens", "--version"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 0);
        }

        SECTION("print config") {
            startup_config cfg{};
            std::vector<std::string> args{"cqlens", "--db", "/tmp/db", "--print-config"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 0);
            CHECK(cfg.print_config);
        }
    }

}  // namespace cqlens::test
