#pragma once

#include "cqlens/records.hpp"
#include "cqlens/utils.hpp"

#include <algorithm>
#include <string>
#include <string_view>

namespace cqlens::internal::names {

    using namespace std::string_view_literals;

    inline constexpr char quote_char = '"';

    // Column text with every literal quote removed. Comparisons run on this; records keep the raw text.
    inline std::string unquote(std::string_view field) {
        std::string out{};
        out.reserve(field.size());
        std::ranges::copy_if(field, std::back_inserter(out), [](char c) { return c != quote_char; });
        return out;
    }

    // Trailing segment after the last "::"; unqualified names pass through unchanged.
    inline constexpr std::string_view strip_namespace(std::string_view name) noexcept {
        if (auto pos = name.rfind("::"sv); pos != std::string_view::npos) {
            return name.substr(pos + 2U);
        }
        return name;
    }

    inline bool name_matches(std::string_view raw_field, std::string_view term, match_mode mode) {
        auto candidate = unquote(raw_field);
        if (candidate == term) {
            return true;
        }
        return mode == match_mode::fallback && candidate.find(term) != std::string::npos;
    }

    inline std::string normalize_id(std::string_view raw_id) {
        return std::string{utils::trim_view(unquote(raw_id))};
    }

    // CodeQL prefixes archive paths with one marker character that is not part of the entry name.
    inline std::string archive_entry_name(std::string_view raw_file) {
        auto path = unquote(raw_file);
        if (path.empty()) {
            return path;
        }
        return path.substr(1U);
    }

}  // namespace cqlens::internal::names
