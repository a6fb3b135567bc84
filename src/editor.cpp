#include "editor.hpp"

extern "C" {
#include <isocline.h>
}

#include "internal/names.hpp"

#include <algorithm>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cqlens::cli { namespace detail {

    using namespace std::string_view_literals;

    static const char* command_completions[] = {
            ":help",
            ":show",
            ":set",
            ":line",
            ":function",
            ":caller",
            ":macro",
            ":global",
            ":class",
            ":known",
            ":reset",
            ":quit",
            ":q",
            nullptr};

    static const char* show_completions[] = {"config", nullptr};
    static const char* set_completions[] = {"output=table", "output=json", nullptr};

    static constexpr std::string_view trim_left(std::string_view value) {
        auto start = value.find_first_not_of(" \t\r\n");
        if (start == std::string_view::npos) {
            return {};
        }
        return value.substr(start);
    }

    static constexpr std::string_view first_token(std::string_view value) {
        auto end = value.find_first_of(" \t\r\n");
        if (end == std::string_view::npos) {
            return value;
        }
        return value.substr(0, end);
    }

    static bool is_command_char(const char* s, long len) {
        if (len == 1 && s[0] == ':') {
            return true;
        }
        return ic_char_is_idletter(s, len);
    }

    static void complete_commands(ic_completion_env_t* cenv, const char* prefix) {
        (void)ic_add_completions(cenv, prefix, command_completions);
    }

    static void complete_show_args(ic_completion_env_t* cenv, const char* prefix) {
        (void)ic_add_completions(cenv, prefix, show_completions);
    }

    static void complete_set_args(ic_completion_env_t* cenv, const char* prefix) {
        (void)ic_add_completions(cenv, prefix, set_completions);
    }

    static void complete_known_names(ic_completion_env_t* cenv, const char* prefix) {
        auto* names = static_cast<const char**>(ic_completion_arg(cenv));
        if (names == nullptr) {
            return;
        }
        (void)ic_add_completions(cenv, prefix, names);
    }

    static void complete_repl(ic_completion_env_t* cenv, const char* prefix) {
        if (prefix == nullptr) {
            return;
        }

        auto trimmed = trim_left(std::string_view{prefix});
        if (trimmed.empty() || !trimmed.starts_with(':')) {
            ic_complete_word(cenv, prefix, complete_commands, is_command_char);
            return;
        }

        auto command = first_token(trimmed);
        if (command.size() == trimmed.size()) {
            ic_complete_word(cenv, prefix, complete_commands, is_command_char);
            return;
        }

        if (command == ":show"sv) {
            ic_complete_word(cenv, prefix, complete_show_args, nullptr);
            return;
        }
        if (command == ":set"sv) {
            ic_complete_word(cenv, prefix, complete_set_args, nullptr);
            return;
        }
        if (command == ":function"sv || command == ":caller"sv) {
            ic_complete_word(cenv, prefix, complete_known_names, nullptr);
            return;
        }
    }

    // unquoted names, without duplicates, in first-seen order
    static std::vector<std::string> known_names(std::span<const function_record> known) {
        std::vector<std::string> names{};
        for (const auto& f : known) {
            auto name = internal::names::unquote(f.function_name);
            if (std::ranges::find(names, name) == names.end()) {
                names.push_back(std::move(name));
            }
        }
        return names;
    }

}}  // namespace cqlens::cli::detail

namespace cqlens::cli {

    namespace fs = std::filesystem;

    line_editor::line_editor(const startup_config& cfg, const lookup_session& session)
            : session_{session}, history_enabled_{cfg.history_enabled} {
        ic_enable_multiline(false);
        ic_enable_history_duplicates(false);
        ic_set_prompt_marker("", "");
        ic_set_default_completer(detail::complete_repl, nullptr);

        switch (cfg.color) {
            case color_mode::automatic:
                break;
            case color_mode::always:
                ic_enable_color(true);
                break;
            case color_mode::never:
                ic_enable_color(false);
                break;
        }

        if (!history_enabled_) {
            ic_set_history(nullptr, 1000);
            return;
        }

        std::error_code ec{};
        auto history_parent = cfg.history_file.parent_path();
        if (!history_parent.empty()) {
            fs::create_directories(history_parent, ec);
        }

        auto history_file = cfg.history_file.string();
        ic_set_history(history_file.c_str(), 1000);
    }

    std::optional<std::string> line_editor::read_line(std::string_view prompt) {
        auto names = detail::known_names(session_.known_functions());
        std::vector<const char*> completions{};
        completions.reserve(names.size() + 1U);
        for (const auto& name : names) {
            completions.push_back(name.c_str());
        }
        completions.push_back(nullptr);

        auto prompt_text = std::string(prompt);
        auto* raw =
                ic_readline_ex(prompt_text.c_str(), detail::complete_repl, completions.data(), nullptr, nullptr);
        if (raw == nullptr) {
            return std::nullopt;
        }

        std::string line{raw};
        ic_free(raw);
        return line;
    }

    void line_editor::record_history(std::string_view line) {
        if (!history_enabled_) {
            return;
        }
        auto entry = std::string(line);
        ic_history_add(entry.c_str());
    }

}  // namespace cqlens::cli
