#include "cqlens/session.hpp"

#include "cqlens/format.hpp"
#include "cqlens/lookup.hpp"
#include "cqlens/snippet.hpp"

#include "internal/json.hpp"

#include <algorithm>

using namespace cqlens::literals;

namespace cqlens {

    namespace detail {

        template <typename Fn>
        static tool_output guarded(output_mode mode, Fn&& fn) {
            try {
                return fn();
            } catch (const lookup_error& e) {
                debug_log("lookup failed: ", e.what());
                if (mode == output_mode::json) {
                    return tool_output{
                            .text = internal::json::write(internal::json::error_payload{e.what()}), .is_error = true};
                }
                return tool_output{.text = e.what(), .is_error = true};
            }
        }

        static tool_output render_not_found(const not_found& miss, output_mode mode) {
            if (mode == output_mode::json) {
                return tool_output{.text = internal::json::write(internal::json::not_found_payload{miss.message})};
            }
            return tool_output{.text = miss.message};
        }

        template <typename Record>
        static tool_output render_record(const lookup_result<Record>& result, output_mode mode) {
            if (!result) {
                return render_not_found(result.error(), mode);
            }
            if (mode == output_mode::json) {
                return tool_output{.text = internal::json::write(*result)};
            }
            return tool_output{.text = "{}"_format(*result)};
        }

    }  // namespace detail

    lookup_session::lookup_session(std::filesystem::path db_path, output_mode output)
            : db_path_{std::move(db_path)}, output_{output} {}

    std::filesystem::path lookup_session::function_tree_file() const {
        return table_path(db_path_, table_kind::function_tree);
    }

    void lookup_session::remember(const function_record& function) {
        auto seen = std::ranges::any_of(
                known_, [&](const function_record& f) { return f.function_id == function.function_id; });
        if (!seen) {
            known_.push_back(function);
        }
    }

    void lookup_session::reset() {
        known_.clear();
    }

    tool_output lookup_session::render_function(const function_record& function, const function_record* parent) const {
        auto snippet = function_snippet(db_path_, function);
        if (output_ == output_mode::json) {
            internal::json::function_payload payload{.function = function, .snippet = std::move(snippet)};
            if (parent != nullptr) {
                payload.parent = *parent;
            }
            return tool_output{.text = internal::json::write(payload)};
        }
        return tool_output{.text = std::move(snippet)};
    }

    tool_output lookup_session::function_at(std::string_view file, int64_t line) {
        return detail::guarded(output_, [&] {
            auto function = get_function_by_line(function_tree_file(), file, line);
            if (!function) {
                return detail::render_not_found(
                        not_found{"No function in '{}' covers line {}."_format(file, line)}, output_);
            }
            remember(*function);
            return render_function(*function, nullptr);
        });
    }

    tool_output lookup_session::function_code(std::string_view function_name) {
        return detail::guarded(output_, [&] {
            auto match = get_function_by_name(function_tree_file(), function_name, known_);
            if (!match) {
                return detail::render_not_found(match.error(), output_);
            }
            auto out = render_function(match->function, &match->parent);
            remember(match->function);
            return out;
        });
    }

    tool_output lookup_session::caller_function(std::string_view function_name) {
        return detail::guarded(output_, [&] {
            auto match = get_function_by_name(function_tree_file(), function_name, known_);
            if (!match) {
                return detail::render_not_found(match.error(), output_);
            }
            auto caller = get_caller_function(function_tree_file(), match->function);
            if (!caller) {
                return detail::render_not_found(caller.error(), output_);
            }
            auto out = render_function(*caller, &match->function);
            remember(match->function);
            remember(*caller);
            return out;
        });
    }

    tool_output lookup_session::macro(std::string_view macro_name) {
        return detail::guarded(
                output_, [&] { return detail::render_record(get_macro(db_path_, macro_name), output_); });
    }

    tool_output lookup_session::global_var(std::string_view global_var_name) {
        return detail::guarded(
                output_, [&] { return detail::render_record(get_global_var(db_path_, global_var_name), output_); });
    }

    tool_output lookup_session::class_info(std::string_view class_name) {
        return detail::guarded(
                output_, [&] { return detail::render_record(get_class(db_path_, class_name), output_); });
    }

    tool_output lookup_session::known() const {
        if (output_ == output_mode::json) {
            return tool_output{.text = internal::json::write(known_)};
        }
        if (known_.empty()) {
            return tool_output{.text = "no known functions"};
        }
        std::vector<std::string> rows{};
        rows.reserve(known_.size());
        for (size_t i = 0U; i < known_.size(); ++i) {
            rows.push_back("#{} {}"_format(i + 1U, known_[i]));
        }
        return tool_output{.text = utils::join_with_separator(rows, "\n")};
    }

}  // namespace cqlens
