#pragma once

#include "cqlens.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/archive.hpp"
#include "../src/internal/csv.hpp"
#include "../src/internal/names.hpp"
#include "../src/internal/scanner.hpp"

extern "C" {
#include <unistd.h>
#include <zlib.h>
}

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cqlens::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        auto parent = path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream out{path, std::ios::binary};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    // FunctionTree.csv row: function_name, file, start_line, function_id, end_line, caller_id
    inline std::string function_row(
            std::string_view name,
            std::string_view file,
            int start,
            std::string_view id,
            int end,
            std::string_view caller) {
        std::ostringstream row{};
        row << '"' << name << "\",\"" << file << "\"," << start << ",\"" << id << "\"," << end << ",\"" << caller
            << "\"\n";
        return row.str();
    }

    struct zip_entry {
        std::string name{};
        std::string content{};
        bool deflate{false};
    };

    class zip_builder {
      public:
        void add(std::string name, std::string content, bool deflate = false) {
            entries_.push_back(zip_entry{std::move(name), std::move(content), deflate});
        }

        void write(const fs::path& path) const {
            std::string out{};
            std::string central{};

            for (const auto& e : entries_) {
                auto crc = static_cast<uint32_t>(
                        ::crc32(0L, reinterpret_cast<const Bytef*>(e.content.data()), static_cast<uInt>(e.content.size())));
                auto payload = e.deflate ? deflate_raw(e.content) : e.content;
                auto offset = static_cast<uint32_t>(out.size());
                uint16_t method = e.deflate ? 8U : 0U;

                put32(out, 0x04034b50U);
                put16(out, 20U);
                put16(out, 0U);
                put16(out, method);
                put16(out, 0U);
                put16(out, 0U);
                put32(out, crc);
                put32(out, static_cast<uint32_t>(payload.size()));
                put32(out, static_cast<uint32_t>(e.content.size()));
                put16(out, static_cast<uint16_t>(e.name.size()));
                put16(out, 0U);
                out += e.name;
                out += payload;

                put32(central, 0x02014b50U);
                put16(central, 20U);
                put16(central, 20U);
                put16(central, 0U);
                put16(central, method);
                put16(central, 0U);
                put16(central, 0U);
                put32(central, crc);
                put32(central, static_cast<uint32_t>(payload.size()));
                put32(central, static_cast<uint32_t>(e.content.size()));
                put16(central, static_cast<uint16_t>(e.name.size()));
                put16(central, 0U);
                put16(central, 0U);
                put16(central, 0U);
                put16(central, 0U);
                put32(central, 0U);
                put32(central, offset);
                central += e.name;
            }

            auto cd_offset = static_cast<uint32_t>(out.size());
            out += central;

            put32(out, 0x06054b50U);
            put16(out, 0U);
            put16(out, 0U);
            put16(out, static_cast<uint16_t>(entries_.size()));
            put16(out, static_cast<uint16_t>(entries_.size()));
            put32(out, static_cast<uint32_t>(central.size()));
            put32(out, cd_offset);
            put16(out, 0U);

            write_text_file(path, out);
        }

      private:
        static void put16(std::string& out, uint16_t v) {
            out.push_back(static_cast<char>(v & 0xFFU));
            out.push_back(static_cast<char>((v >> 8U) & 0xFFU));
        }

        static void put32(std::string& out, uint32_t v) {
            put16(out, static_cast<uint16_t>(v & 0xFFFFU));
            put16(out, static_cast<uint16_t>((v >> 16U) & 0xFFFFU));
        }

        static std::string deflate_raw(const std::string& input) {
            z_stream stream{};
            REQUIRE(deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) == Z_OK);

            std::string out(deflateBound(&stream, static_cast<uLong>(input.size())), '\0');
            stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
            stream.avail_in = static_cast<uInt>(input.size());
            stream.next_out = reinterpret_cast<Bytef*>(out.data());
            stream.avail_out = static_cast<uInt>(out.size());

            auto rc = deflate(&stream, Z_FINISH);
            out.resize(stream.total_out);
            deflateEnd(&stream);
            REQUIRE(rc == Z_STREAM_END);
            return out;
        }

        std::vector<zip_entry> entries_{};
    };

    /*
     * Small CodeQL database fixture.
     *
     * FunctionTree.csv (file order matters for precedence tests):
     *   main            /src/app.c  1-20   id f_main    caller ""
     *   handle_packet   /src/net.c  1-10   id f_handle  caller f_main
     *   parse_header    /src/net.c  5-15   id f_parse   caller f_handle
     *   parse_header_v2 /src/net.c  16-25  id f_parse2  caller "/src/app.c:12" (encoded location)
     *   checksum        /src/net.c  26-30  id f_sum     caller f_parse
     */
    struct database_fixture {
        temp_dir dir;

        explicit database_fixture(std::string_view prefix) : dir{prefix} {
            write_text_file(
                    dir.path / "FunctionTree.csv",
                    function_row("main", "/src/app.c", 1, "f_main", 20, "") +
                            function_row("handle_packet", "/src/net.c", 1, "f_handle", 10, "f_main") +
                            function_row("parse_header", "/src/net.c", 5, "f_parse", 15, "f_handle") +
                            "\"parse_header_v2\",\"/src/net.c\",16,\"f_parse2\",25,\"/src/app.c:12\"\n" +
                            function_row("checksum", "/src/net.c", 26, "f_sum", 30, "f_parse"));

            write_text_file(
                    dir.path / "Macros.csv",
                    "\"MAX_HDR\",\"64\"\n"
                    "\"MAX_HDR_LEN\",\"(MAX_HDR * 2)\"\n"
                    "\"HDR_FLAGS\",\"0x1, 0x2\"\n");

            write_text_file(
                    dir.path / "GlobalVars.csv",
                    "\"g_packet_count\",\"/src/net.c\",3,3\n"
                    "\"g_packets\",\"/src/net.c\",4,4\n");

            write_text_file(
                    dir.path / "Classes.csv",
                    "\"struct\",\"net::header\",\"/src/net.h\",10,20,\"header\"\n"
                    "\"class\",\"net::header_parser\",\"/src/net.h\",22,40,\"header_parser\"\n");

            std::string app{};
            for (int i = 1; i <= 20; ++i) {
                app += "app line " + std::to_string(i) + "\n";
            }
            std::string net{};
            for (int i = 1; i <= 30; ++i) {
                net += "net line " + std::to_string(i) + "\n";
            }

            zip_builder zip{};
            zip.add("src/app.c", app);
            zip.add("src/net.c", net, true);
            zip.write(dir.path / "src.zip");
        }

        const fs::path& path() const { return dir.path; }
        fs::path function_tree() const { return dir.path / "FunctionTree.csv"; }
    };

}  // namespace cqlens::test::detail
