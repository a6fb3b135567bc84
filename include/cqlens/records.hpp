#pragma once

#include "utils.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cqlens {

    using namespace std::string_view_literals;

    /*
     * Records read out of the CodeQL CSV exports.
     *
     * Text fields hold the raw column text, including any literal '"' characters the
     * exporter left in place. Line columns are parsed integers.
     */

    struct function_record {
        static constexpr bool to_string_formattable = true;

        std::string function_name{};
        std::string file{};
        int64_t start_line{};
        std::string function_id{};
        int64_t end_line{};
        std::string caller_id{};

        std::string to_string() const;
        bool operator==(const function_record&) const = default;
    };

    struct macro_record {
        static constexpr bool to_string_formattable = true;

        std::string macro_name{};
        std::string body{};

        std::string to_string() const;
        bool operator==(const macro_record&) const = default;
    };

    struct global_var_record {
        static constexpr bool to_string_formattable = true;

        std::string global_var_name{};
        std::string file{};
        int64_t start_line{};
        int64_t end_line{};

        std::string to_string() const;
        bool operator==(const global_var_record&) const = default;
    };

    struct class_record {
        static constexpr bool to_string_formattable = true;

        std::string type{};
        std::string class_name{};
        std::string file{};
        int64_t start_line{};
        int64_t end_line{};
        std::string simple_name{};

        std::string to_string() const;
        bool operator==(const class_record&) const = default;
    };

    // by-name lookup result: the matched row and the known function whose id led to it
    struct function_match {
        function_record function{};
        function_record parent{};
    };

    // whole-file extraction; `lines` is not sliced to [start_line, end_line]
    struct function_lines {
        std::string file_path{};
        int64_t start_line{};
        int64_t end_line{};
        std::vector<std::string> lines{};
    };

    struct not_found {
        std::string message{};
    };

    template <typename T>
    using lookup_result = std::expected<T, not_found>;

    enum class match_mode : uint8_t { strict, fallback };

    inline constexpr std::string_view to_string(match_mode mode) {
        switch (mode) {
            case match_mode::strict:
                return "strict"sv;
            case match_mode::fallback:
                return "fallback"sv;
        }
        return "strict"sv;
    }

    enum class table_kind : uint8_t { function_tree, macros, global_vars, classes };

    inline constexpr std::string_view table_file_name(table_kind kind) {
        switch (kind) {
            case table_kind::function_tree:
                return "FunctionTree.csv"sv;
            case table_kind::macros:
                return "Macros.csv"sv;
            case table_kind::global_vars:
                return "GlobalVars.csv"sv;
            case table_kind::classes:
                return "Classes.csv"sv;
        }
        return "FunctionTree.csv"sv;
    }

    // label used in access_error messages
    inline constexpr std::string_view table_label(table_kind kind) {
        switch (kind) {
            case table_kind::function_tree:
                return "Function tree file"sv;
            case table_kind::macros:
                return "Macros CSV"sv;
            case table_kind::global_vars:
                return "GlobalVars CSV"sv;
            case table_kind::classes:
                return "Classes CSV"sv;
        }
        return "CSV file"sv;
    }

    inline std::filesystem::path table_path(const std::filesystem::path& db_path, table_kind kind) {
        return db_path / table_file_name(kind);
    }

    inline constexpr auto source_archive_name = "src.zip"sv;
    inline constexpr auto source_archive_label = "Source archive"sv;

    // ── Errors ──────────────────────────────────────────────────────

    class lookup_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    enum class access_kind : uint8_t { missing, permission_denied, os_error };

    inline constexpr std::string_view to_string(access_kind kind) {
        switch (kind) {
            case access_kind::missing:
                return "missing"sv;
            case access_kind::permission_denied:
                return "permission_denied"sv;
            case access_kind::os_error:
                return "os_error"sv;
        }
        return "os_error"sv;
    }

    class access_error : public lookup_error {
      public:
        access_error(access_kind kind, std::string_view label, const std::filesystem::path& path);

        access_kind kind() const noexcept { return kind_; }
        const std::string& label() const noexcept { return label_; }
        const std::filesystem::path& path() const noexcept { return path_; }

      private:
        access_kind kind_;
        std::string label_;
        std::filesystem::path path_;
    };

    class archive_error : public lookup_error {
      public:
        using lookup_error::lookup_error;
    };

}  // namespace cqlens
