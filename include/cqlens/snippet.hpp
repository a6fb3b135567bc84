#pragma once

#include "records.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cqlens {

    // Reads the function's file out of <db_path>/src.zip. The returned lines cover the whole
    // file, split on '\n'; slicing to [start_line, end_line] is left to the caller.
    function_lines extract_function_lines_from_db(const std::filesystem::path& db_path, const function_record& function);

    // 1-based inclusive [start_line, end_line], clamped to the file
    std::vector<std::string> slice_function_lines(const function_lines& extracted);

    std::string format_numbered_snippet(
            std::string_view file_path, int64_t start_line, std::span<const std::string> snippet_lines);

    // extract, slice, then format
    std::string function_snippet(const std::filesystem::path& db_path, const function_record& function);

}  // namespace cqlens
