#include "csv.hpp"

#include <algorithm>

namespace cqlens::internal::csv {

    const std::string& row::operator[](std::string_view key) const {
        auto it = std::ranges::find(keys, key);
        return fields.at(static_cast<size_t>(std::ranges::distance(keys.begin(), it)));
    }

    std::optional<row> parse_row(std::string_view line, std::span<const std::string_view> keys) {
        line = utils::strip_line_terminator(line);

        std::vector<std::string> fields{};
        fields.reserve(keys.size());

        std::string current{};
        bool in_quotes = false;

        for (size_t i = 0U; i < line.size(); ++i) {
            char c = line[i];
            if (c == names::quote_char) {
                // "" inside a quoted region is an escaped quote; the raw text keeps both characters
                if (in_quotes && i + 1U < line.size() && line[i + 1U] == names::quote_char) {
                    current.append(2U, names::quote_char);
                    ++i;
                    continue;
                }
                in_quotes = !in_quotes;
                current.push_back(c);
                continue;
            }
            if (c == ',' && !in_quotes) {
                fields.push_back(std::move(current));
                current.clear();
                continue;
            }
            current.push_back(c);
        }

        if (in_quotes) {
            return std::nullopt;
        }
        fields.push_back(std::move(current));

        if (fields.size() != keys.size()) {
            return std::nullopt;
        }

        return row{.keys = keys, .fields = std::move(fields)};
    }

}  // namespace cqlens::internal::csv
