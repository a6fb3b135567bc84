#include "cqlens/snippet.hpp"

#include "cqlens/format.hpp"

#include "internal/archive.hpp"
#include "internal/names.hpp"

#include <algorithm>

using namespace cqlens::literals;

namespace cqlens {

    function_lines extract_function_lines_from_db(
            const std::filesystem::path& db_path, const function_record& function) {
        auto file_path = internal::names::archive_entry_name(function.file);
        internal::source_archive archive{db_path / source_archive_name};
        auto text = archive.read(file_path);

        return function_lines{
                .file_path = std::move(file_path),
                .start_line = function.start_line,
                .end_line = function.end_line,
                .lines = utils::split_lines(text)};
    }

    std::vector<std::string> slice_function_lines(const function_lines& extracted) {
        auto total = static_cast<int64_t>(extracted.lines.size());
        auto first = std::clamp<int64_t>(extracted.start_line - 1, 0, total);
        auto last = std::clamp<int64_t>(extracted.end_line, first, total);
        return {extracted.lines.begin() + first, extracted.lines.begin() + last};
    }

    std::string format_numbered_snippet(
            std::string_view file_path, int64_t start_line, std::span<const std::string> snippet_lines) {
        auto out = "file: {}\n"_format(file_path);
        for (size_t i = 0U; i < snippet_lines.size(); ++i) {
            if (i > 0U) {
                out.push_back('\n');
            }
            out += "{}: {}"_format(start_line + static_cast<int64_t>(i), snippet_lines[i]);
        }
        return out;
    }

    std::string function_snippet(const std::filesystem::path& db_path, const function_record& function) {
        auto extracted = extract_function_lines_from_db(db_path, function);
        auto body = slice_function_lines(extracted);
        auto first_line = std::max<int64_t>(extracted.start_line, 1);
        return format_numbered_snippet(extracted.file_path, first_line, body);
    }

}  // namespace cqlens
