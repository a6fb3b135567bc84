#pragma once

#include "cqlens/utils.hpp"

#include "names.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cqlens::internal::csv {

    using namespace std::string_view_literals;

    inline constexpr std::string_view function_tree_keys[] = {
            "function_name"sv, "file"sv, "start_line"sv, "function_id"sv, "end_line"sv, "caller_id"sv};
    inline constexpr std::string_view macro_keys[] = {"macro_name"sv, "body"sv};
    inline constexpr std::string_view global_var_keys[] = {
            "global_var_name"sv, "file"sv, "start_line"sv, "end_line"sv};
    inline constexpr std::string_view class_keys[] = {
            "type"sv, "class_name"sv, "file"sv, "start_line"sv, "end_line"sv, "simple_name"sv};

    // Parsed row; fields follow the key order and keep their raw text.
    struct row {
        std::span<const std::string_view> keys{};
        std::vector<std::string> fields{};

        const std::string& operator[](std::string_view key) const;
    };

    // Splits one raw line on commas outside quoted regions. Returns nullopt when the line is
    // malformed: unterminated quote, or a field count that differs from keys.size().
    std::optional<row> parse_row(std::string_view line, std::span<const std::string_view> keys);

    // Integer column text; quotes and surrounding whitespace are ignored.
    inline std::optional<int64_t> parse_line_number(std::string_view raw_field) {
        auto text = names::unquote(raw_field);
        return utils::parse_integer<int64_t>(utils::trim_view(text));
    }

}  // namespace cqlens::internal::csv
