#pragma once

#include "records.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>

namespace cqlens {

    /*
     * Symbol resolution over a CodeQL database export directory.
     *
     * Every call is a full linear scan of the relevant table, opened and closed
     * within the call. The first row in file order that satisfies the active
     * predicate wins.
     *
     * Name lookups run a strict pass (stripped name equals the search term) and,
     * only when that misses, one fallback pass (stripped name contains the term).
     * Passing match_mode::fallback skips the strict pass. A miss after both passes
     * is returned as not_found, never thrown.
     *
     * Table I/O failures throw access_error. Malformed rows are skipped.
     */

    std::optional<function_record> get_function_by_line(
            const std::filesystem::path& function_tree_file, std::string_view file, int64_t line);

    lookup_result<function_match> get_function_by_name(
            const std::filesystem::path& function_tree_file,
            std::string_view function_name,
            std::span<const function_record> known_functions,
            match_mode mode = match_mode::strict);

    lookup_result<macro_record> get_macro(
            const std::filesystem::path& db_path, std::string_view macro_name, match_mode mode = match_mode::strict);

    lookup_result<global_var_record> get_global_var(
            const std::filesystem::path& db_path,
            std::string_view global_var_name,
            match_mode mode = match_mode::strict);

    lookup_result<class_record> get_class(
            const std::filesystem::path& db_path, std::string_view class_name, match_mode mode = match_mode::strict);

    // Resolves by caller_id, then by the encoded "<quote><file>:<line>" form. An empty caller_id
    // skips the by-id scan, so a row whose function_id is also empty never matches.
    lookup_result<function_record> get_caller_function(
            const std::filesystem::path& function_tree_file, const function_record& function);

    struct caller_location {
        std::string file{};
        int64_t line{};
    };

    // Decodes a caller_id of the form <quote><file>:<line>. Split happens on the first colon; the
    // first character of the file part is the exporter's quote and is dropped.
    std::optional<caller_location> decode_caller_location(std::string_view caller_id);

    namespace messages {
        std::string function_not_found(std::string_view function_name);
        std::string macro_not_found(std::string_view macro_name);
        std::string global_var_not_found(std::string_view global_var_name);
        std::string class_not_found(std::string_view class_name);
        std::string caller_not_found();
    }  // namespace messages

}  // namespace cqlens
