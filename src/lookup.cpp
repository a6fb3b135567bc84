#include "cqlens/lookup.hpp"

#include "cqlens/format.hpp"

#include "internal/csv.hpp"
#include "internal/names.hpp"
#include "internal/scanner.hpp"

#include <array>
#include <optional>
#include <span>
#include <string>
#include <string_view>

using namespace cqlens::literals;

namespace cqlens {

    namespace detail {

        using namespace std::string_view_literals;
        namespace csv = internal::csv;
        namespace names = internal::names;

        static constexpr std::array<match_mode, 2> all_passes{match_mode::strict, match_mode::fallback};

        // strict start runs both passes; fallback start runs the fallback pass alone
        static std::span<const match_mode> passes_from(match_mode first) {
            std::span<const match_mode> passes{all_passes};
            return first == match_mode::strict ? passes : passes.subspan(1U);
        }

        static std::optional<function_record> to_function_record(const csv::row& row) {
            auto start = csv::parse_line_number(row["start_line"sv]);
            auto end = csv::parse_line_number(row["end_line"sv]);
            if (!start || !end) {
                return std::nullopt;
            }
            return function_record{
                    .function_name = row["function_name"sv],
                    .file = row["file"sv],
                    .start_line = *start,
                    .function_id = row["function_id"sv],
                    .end_line = *end,
                    .caller_id = row["caller_id"sv]};
        }

        static std::optional<macro_record> to_macro_record(const csv::row& row) {
            return macro_record{.macro_name = row["macro_name"sv], .body = row["body"sv]};
        }

        static std::optional<global_var_record> to_global_var_record(const csv::row& row) {
            auto start = csv::parse_line_number(row["start_line"sv]);
            auto end = csv::parse_line_number(row["end_line"sv]);
            if (!start || !end) {
                return std::nullopt;
            }
            return global_var_record{
                    .global_var_name = row["global_var_name"sv],
                    .file = row["file"sv],
                    .start_line = *start,
                    .end_line = *end};
        }

        static std::optional<class_record> to_class_record(const csv::row& row) {
            auto start = csv::parse_line_number(row["start_line"sv]);
            auto end = csv::parse_line_number(row["end_line"sv]);
            if (!start || !end) {
                return std::nullopt;
            }
            return class_record{
                    .type = row["type"sv],
                    .class_name = row["class_name"sv],
                    .file = row["file"sv],
                    .start_line = *start,
                    .end_line = *end,
                    .simple_name = row["simple_name"sv]};
        }

        /*
         * Scans `path` once and returns the first row whose raw text contains `needle`,
         * parses against `keys`, and is accepted by `accept`. Rows that fail to parse or
         * convert are skipped.
         */
        template <typename Accept>
        static auto find_first(
                const std::filesystem::path& path,
                std::string_view label,
                std::span<const std::string_view> keys,
                std::string_view needle,
                Accept&& accept) -> decltype(accept(std::declval<const csv::row&>())) {
            decltype(accept(std::declval<const csv::row&>())) found{};
            internal::for_each_line(path, label, [&](std::string_view line) {
                if (line.find(needle) == std::string_view::npos) {
                    return false;
                }
                auto row = csv::parse_row(line, keys);
                if (!row) {
                    return false;
                }
                found = accept(*row);
                return found.has_value();
            });
            return found;
        }

    }  // namespace detail

    namespace messages {
        std::string function_not_found(std::string_view function_name) {
            return "Function '{}' not found. Make sure you're using the correct tool and args."_format(function_name);
        }

        std::string macro_not_found(std::string_view macro_name) {
            return "Macro '{}' not found. Make sure you're using the correct tool with correct args."_format(
                    macro_name);
        }

        std::string global_var_not_found(std::string_view global_var_name) {
            return "Global var '{}' not found. Could it be a macro or should you use another tool?"_format(
                    global_var_name);
        }

        std::string class_not_found(std::string_view class_name) {
            return "Class '{}' not found. Could it be a Namespace?"_format(class_name);
        }

        std::string caller_not_found() {
            return "Caller function was not found. Make sure you are using the correct tool with the correct args.";
        }
    }  // namespace messages

    std::optional<function_record> get_function_by_line(
            const std::filesystem::path& function_tree_file, std::string_view file, int64_t line) {
        return detail::find_first(
                function_tree_file,
                table_label(table_kind::function_tree),
                detail::csv::function_tree_keys,
                file,
                [line](const detail::csv::row& row) -> std::optional<function_record> {
                    auto record = detail::to_function_record(row);
                    if (record && record->start_line <= line && line <= record->end_line) {
                        return record;
                    }
                    return std::nullopt;
                });
    }

    lookup_result<function_match> get_function_by_name(
            const std::filesystem::path& function_tree_file,
            std::string_view function_name,
            std::span<const function_record> known_functions,
            match_mode mode) {
        auto term = detail::names::strip_namespace(function_name);

        for (auto pass : detail::passes_from(mode)) {
            for (const auto& known : known_functions) {
                auto found = detail::find_first(
                        function_tree_file,
                        table_label(table_kind::function_tree),
                        detail::csv::function_tree_keys,
                        known.function_id,
                        [&](const detail::csv::row& row) -> std::optional<function_record> {
                            if (!detail::names::name_matches(row["function_name"sv], term, pass)) {
                                return std::nullopt;
                            }
                            return detail::to_function_record(row);
                        });
                if (found) {
                    return function_match{.function = std::move(*found), .parent = known};
                }
            }
            debug_log("function '", term, "' missed ", to_string(pass), " pass");
        }

        return std::unexpected(not_found{messages::function_not_found(function_name)});
    }

    lookup_result<macro_record> get_macro(
            const std::filesystem::path& db_path, std::string_view macro_name, match_mode mode) {
        auto term = detail::names::strip_namespace(macro_name);
        auto path = table_path(db_path, table_kind::macros);

        for (auto pass : detail::passes_from(mode)) {
            auto found = detail::find_first(
                    path,
                    table_label(table_kind::macros),
                    detail::csv::macro_keys,
                    term,
                    [&](const detail::csv::row& row) -> std::optional<macro_record> {
                        if (!detail::names::name_matches(row["macro_name"sv], term, pass)) {
                            return std::nullopt;
                        }
                        return detail::to_macro_record(row);
                    });
            if (found) {
                return std::move(*found);
            }
            debug_log("macro '", term, "' missed ", to_string(pass), " pass");
        }

        return std::unexpected(not_found{messages::macro_not_found(macro_name)});
    }

    lookup_result<global_var_record> get_global_var(
            const std::filesystem::path& db_path, std::string_view global_var_name, match_mode mode) {
        auto term = detail::names::strip_namespace(global_var_name);
        auto path = table_path(db_path, table_kind::global_vars);

        for (auto pass : detail::passes_from(mode)) {
            auto found = detail::find_first(
                    path,
                    table_label(table_kind::global_vars),
                    detail::csv::global_var_keys,
                    term,
                    [&](const detail::csv::row& row) -> std::optional<global_var_record> {
                        if (!detail::names::name_matches(row["global_var_name"sv], term, pass)) {
                            return std::nullopt;
                        }
                        return detail::to_global_var_record(row);
                    });
            if (found) {
                return std::move(*found);
            }
            debug_log("global var '", term, "' missed ", to_string(pass), " pass");
        }

        return std::unexpected(not_found{messages::global_var_not_found(global_var_name)});
    }

    lookup_result<class_record> get_class(
            const std::filesystem::path& db_path, std::string_view class_name, match_mode mode) {
        auto term = detail::names::strip_namespace(class_name);
        auto path = table_path(db_path, table_kind::classes);

        for (auto pass : detail::passes_from(mode)) {
            auto found = detail::find_first(
                    path,
                    table_label(table_kind::classes),
                    detail::csv::class_keys,
                    term,
                    [&](const detail::csv::row& row) -> std::optional<class_record> {
                        // qualified or simple name, either one
                        if (!detail::names::name_matches(row["class_name"sv], term, pass) &&
                            !detail::names::name_matches(row["simple_name"sv], term, pass)) {
                            return std::nullopt;
                        }
                        return detail::to_class_record(row);
                    });
            if (found) {
                return std::move(*found);
            }
            debug_log("class '", term, "' missed ", to_string(pass), " pass");
        }

        return std::unexpected(not_found{messages::class_not_found(class_name)});
    }

    std::optional<caller_location> decode_caller_location(std::string_view caller_id) {
        auto trimmed = utils::trim_view(caller_id);
        auto colon = trimmed.find(':');
        if (colon == std::string_view::npos || colon == 0U) {
            return std::nullopt;
        }

        auto file = detail::names::unquote(trimmed.substr(1U, colon - 1U));
        auto line = detail::csv::parse_line_number(trimmed.substr(colon + 1U));
        if (file.empty() || !line) {
            return std::nullopt;
        }
        return caller_location{.file = std::move(file), .line = *line};
    }

    lookup_result<function_record> get_caller_function(
            const std::filesystem::path& function_tree_file, const function_record& function) {
        auto caller_id = detail::names::normalize_id(function.caller_id);

        if (!caller_id.empty()) {
            auto by_id = detail::find_first(
                    function_tree_file,
                    table_label(table_kind::function_tree),
                    detail::csv::function_tree_keys,
                    caller_id,
                    [&](const detail::csv::row& row) -> std::optional<function_record> {
                        if (detail::names::normalize_id(row["function_id"sv]) != caller_id) {
                            return std::nullopt;
                        }
                        return detail::to_function_record(row);
                    });
            if (by_id) {
                return std::move(*by_id);
            }
        }

        if (auto location = decode_caller_location(function.caller_id)) {
            debug_log("caller id '", caller_id, "' resolved as ", location->file, ':', location->line);
            if (auto by_line = get_function_by_line(function_tree_file, location->file, location->line)) {
                return std::move(*by_line);
            }
        }

        return std::unexpected(not_found{messages::caller_not_found()});
    }

}  // namespace cqlens
