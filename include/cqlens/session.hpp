#pragma once

#include "config.hpp"
#include "records.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cqlens {

    struct tool_output {
        std::string text{};
        bool is_error{false};
    };

    /*
     * Tool-facing lookup state for one CodeQL database.
     *
     * Keeps the ordered list of functions already surfaced to the caller; by-name
     * function lookups are scoped to the rows reachable from those functions. Not-found
     * results come back as plain text with is_error unset. Table and archive failures
     * come back with is_error set and the error message as text.
     */
    class lookup_session {
      public:
        explicit lookup_session(std::filesystem::path db_path, output_mode output = output_mode::table);

        tool_output function_at(std::string_view file, int64_t line);
        tool_output function_code(std::string_view function_name);
        tool_output caller_function(std::string_view function_name);
        tool_output macro(std::string_view macro_name);
        tool_output global_var(std::string_view global_var_name);
        tool_output class_info(std::string_view class_name);

        tool_output known() const;
        void reset();

        // no-op when a function with the same function_id is already known
        void remember(const function_record& function);
        std::span<const function_record> known_functions() const noexcept { return known_; }

        const std::filesystem::path& db_path() const noexcept { return db_path_; }
        std::filesystem::path function_tree_file() const;

        output_mode output() const noexcept { return output_; }
        void set_output(output_mode mode) noexcept { output_ = mode; }

      private:
        tool_output render_function(const function_record& function, const function_record* parent) const;

        std::filesystem::path db_path_;
        output_mode output_;
        std::vector<function_record> known_{};
    };

}  // namespace cqlens
