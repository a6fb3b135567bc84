#pragma once

#include "cqlens/config.hpp"
#include "cqlens/session.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace cqlens::cli {

    class line_editor {
      public:
        line_editor(const startup_config& cfg, const lookup_session& session);

        // :function and :caller arguments complete from the session's known functions
        std::optional<std::string> read_line(std::string_view prompt);
        void record_history(std::string_view line);

      private:
        const lookup_session& session_;
        bool history_enabled_{true};
    };

}  // namespace cqlens::cli
