#include "utils.hpp"

namespace cqlens::test {
    using namespace std::string_view_literals;

    TEST_CASE("001: output and color mode parsing", "[001][config]") {
        output_mode out_mode = output_mode::table;
        color_mode clr_mode = color_mode::automatic;

        REQUIRE(try_parse_output_mode("JSON"sv, out_mode));
        CHECK(out_mode == output_mode::json);
        REQUIRE(try_parse_output_mode("text"sv, out_mode));
        CHECK(out_mode == output_mode::table);
        CHECK_FALSE(try_parse_output_mode("yaml"sv, out_mode));
        CHECK(out_mode == output_mode::table);

        REQUIRE(try_parse_color_mode("always"sv, clr_mode));
        CHECK(clr_mode == color_mode::always);
        REQUIRE(try_parse_color_mode("NEVER"sv, clr_mode));
        CHECK(clr_mode == color_mode::never);
        CHECK_FALSE(try_parse_color_mode("sometimes"sv, clr_mode));

        CHECK(to_string(output_mode::json) == "json"sv);
        CHECK(to_string(color_mode::automatic) == "auto"sv);
        CHECK(to_string(match_mode::fallback) == "fallback"sv);
    }

    TEST_CASE("001: named enums format through std::format", "[001][format]") {
        using namespace cqlens::literals;

        CHECK("{}"_format(match_mode::strict) == "strict");
        CHECK("mode={}"_format(output_mode::json) == "mode=json");
        CHECK("{:>8}"_format(access_kind::missing) == " missing");
    }

    TEST_CASE("001: startup config defaults", "[001][config]") {
        startup_config cfg{};
        CHECK(cfg.db_path.string() == ".");
        CHECK(cfg.output == output_mode::table);
        CHECK(cfg.color == color_mode::automatic);
        CHECK(cfg.history_enabled);
        CHECK(cfg.banner);
        CHECK_FALSE(cfg.mcp);
        CHECK(cfg.eval_commands.empty());
    }

    TEST_CASE("001: table names and labels", "[001][config]") {
        CHECK(table_file_name(table_kind::function_tree) == "FunctionTree.csv"sv);
        CHECK(table_file_name(table_kind::macros) == "Macros.csv"sv);
        CHECK(table_file_name(table_kind::global_vars) == "GlobalVars.csv"sv);
        CHECK(table_file_name(table_kind::classes) == "Classes.csv"sv);
        CHECK(table_label(table_kind::global_vars) == "GlobalVars CSV"sv);
        CHECK(table_path("/db", table_kind::classes).string() == "/db/Classes.csv");
    }

    TEST_CASE("001: name normalization", "[001][names]") {
        namespace names = internal::names;

        CHECK(names::strip_namespace("ns::Foo::bar"sv) == "bar"sv);
        CHECK(names::strip_namespace("bar"sv) == "bar"sv);
        CHECK(names::strip_namespace("Foo::"sv).empty());

        CHECK(names::unquote("\"a\"\"b\""sv) == "ab");
        CHECK(names::normalize_id("  \"id_7\" "sv) == "id_7");
        CHECK(names::archive_entry_name("\"/src/net.c\""sv) == "src/net.c");
        CHECK(names::archive_entry_name("\"\""sv).empty());

        CHECK(names::name_matches("\"parse\""sv, "parse"sv, match_mode::strict));
        CHECK_FALSE(names::name_matches("\"parse_header\""sv, "parse"sv, match_mode::strict));
        CHECK(names::name_matches("\"parse_header\""sv, "parse"sv, match_mode::fallback));
        CHECK_FALSE(names::name_matches("\"emit\""sv, "parse"sv, match_mode::fallback));
    }

    TEST_CASE("001: utils helpers", "[001][utils]") {
        CHECK(utils::trim_view("  a b \r\n"sv) == "a b"sv);
        CHECK(utils::str_case_eq("Json"sv, "JSON"sv));
        CHECK(utils::parse_integer<int64_t>("42"sv) == 42);
        CHECK_FALSE(utils::parse_integer<int64_t>("4x"sv));

        CHECK(utils::strip_line_terminator("row\r\n"sv) == "row"sv);

        auto lines = utils::split_lines("a\n\nb\n"sv);
        REQUIRE(lines.size() == 4U);
        CHECK(lines[1].empty());
        CHECK(lines[2] == "b");
        CHECK(lines[3].empty());
        CHECK(utils::split_lines(""sv).size() == 1U);

        std::vector<std::string> parts{"a", "b", "c"};
        CHECK(utils::join_with_separator(parts, ", ") == "a, b, c");
    }

    TEST_CASE("001: record formatting", "[001][records]") {
        using namespace cqlens::literals;

        macro_record macro{.macro_name = "\"MAX\"", .body = "\"64\""};
        CHECK("{}"_format(macro) == "\"MAX\" \"64\"");

        global_var_record global{
                .global_var_name = "\"g_count\"", .file = "\"/src/a.c\"", .start_line = 3, .end_line = 3};
        CHECK(global.to_string() == "\"g_count\" \"/src/a.c\":3-3");

        access_error missing{access_kind::missing, table_label(table_kind::macros), "/db/Macros.csv"};
        CHECK(std::string_view{missing.what()} == "Macros CSV not found: /db/Macros.csv"sv);
        CHECK(missing.kind() == access_kind::missing);

        access_error denied{access_kind::permission_denied, source_archive_label, "/db/src.zip"};
        CHECK(std::string_view{denied.what()} == "Permission denied reading Source archive: /db/src.zip"sv);

        access_error os{access_kind::os_error, table_label(table_kind::classes), "/db/Classes.csv"};
        CHECK(std::string_view{os.what()} == "OS error while reading Classes CSV: /db/Classes.csv"sv);
    }

}  // namespace cqlens::test
