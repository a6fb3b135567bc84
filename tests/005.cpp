#include "utils.hpp"

namespace cqlens::test {
    using namespace std::string_view_literals;

    TEST_CASE("005: get_macro strict and fallback passes", "[005][lookup]") {
        detail::database_fixture db{"cqlens_005_macro"};

        auto exact = get_macro(db.path(), "MAX_HDR_LEN"sv);
        REQUIRE(exact);
        CHECK(exact->macro_name == "\"MAX_HDR_LEN\"");
        CHECK(exact->body == "\"(MAX_HDR * 2)\"");

        // strict pass finds nothing named HDR, fallback takes the first containing row
        auto partial = get_macro(db.path(), "HDR"sv);
        REQUIRE(partial);
        CHECK(partial->macro_name == "\"MAX_HDR\"");

        auto qualified = get_macro(db.path(), "net::HDR_FLAGS"sv);
        REQUIRE(qualified);
        CHECK(qualified->body == "\"0x1, 0x2\"");
    }

    TEST_CASE("005: get_macro not found", "[005][lookup]") {
        detail::database_fixture db{"cqlens_005_macro_miss"};

        auto miss = get_macro(db.path(), "MAX_LEN"sv);
        REQUIRE_FALSE(miss);
        CHECK(miss.error().message ==
              "Macro 'MAX_LEN' not found. Make sure you're using the correct tool with correct args.");
    }

    TEST_CASE("005: get_macro strict match wins over an earlier partial match", "[005][lookup]") {
        detail::temp_dir dir{"cqlens_005_macro_order"};
        detail::write_text_file(
                dir.path / "Macros.csv",
                "\"BUF_SIZE_MAX\",\"4096\"\n"
                "\"BUF_SIZE\",\"512\"\n");

        auto strict = get_macro(dir.path, "BUF_SIZE"sv);
        REQUIRE(strict);
        CHECK(strict->body == "\"512\"");

        auto fallback = get_macro(dir.path, "BUF_SIZE"sv, match_mode::fallback);
        REQUIRE(fallback);
        CHECK(fallback->body == "\"4096\"");
    }

    TEST_CASE("005: get_global_var", "[005][lookup]") {
        detail::database_fixture db{"cqlens_005_global"};

        auto exact = get_global_var(db.path(), "g_packets"sv);
        REQUIRE(exact);
        CHECK(exact->global_var_name == "\"g_packets\"");
        CHECK(exact->file == "\"/src/net.c\"");
        CHECK(exact->start_line == 4);
        CHECK(exact->end_line == 4);

        auto qualified = get_global_var(db.path(), "Foo::g_packets"sv);
        REQUIRE(qualified);
        CHECK(*qualified == *exact);

        auto partial = get_global_var(db.path(), "g_packet"sv);
        REQUIRE(partial);
        CHECK(partial->global_var_name == "\"g_packet_count\"");

        auto miss = get_global_var(db.path(), "g_missing"sv);
        REQUIRE_FALSE(miss);
        CHECK(miss.error().message ==
              "Global var 'g_missing' not found. Could it be a macro or should you use another tool?");
    }

    TEST_CASE("005: get_class matches qualified or simple names", "[005][lookup]") {
        detail::database_fixture db{"cqlens_005_class"};

        auto simple = get_class(db.path(), "header"sv);
        REQUIRE(simple);
        CHECK(simple->type == "\"struct\"");
        CHECK(simple->class_name == "\"net::header\"");
        CHECK(simple->simple_name == "\"header\"");
        CHECK(simple->start_line == 10);
        CHECK(simple->end_line == 20);

        auto qualified = get_class(db.path(), "net::header_parser"sv);
        REQUIRE(qualified);
        CHECK(qualified->class_name == "\"net::header_parser\"");

        auto partial = get_class(db.path(), "parser"sv);
        REQUIRE(partial);
        CHECK(partial->simple_name == "\"header_parser\"");

        auto miss = get_class(db.path(), "Missing"sv);
        REQUIRE_FALSE(miss);
        CHECK(miss.error().message == "Class 'Missing' not found. Could it be a Namespace?");
    }

    TEST_CASE("005: lookups report missing tables", "[005][lookup]") {
        detail::temp_dir dir{"cqlens_005_missing"};

        try {
            (void)get_macro(dir.path, "X"sv);
            FAIL("expected access_error");
        } catch (const access_error& e) {
            CHECK(e.kind() == access_kind::missing);
            CHECK(e.label() == "Macros CSV");
        }

        CHECK_THROWS_AS(get_global_var(dir.path, "X"sv), access_error);
        CHECK_THROWS_AS(get_class(dir.path, "X"sv), access_error);
    }

}  // namespace cqlens::test
