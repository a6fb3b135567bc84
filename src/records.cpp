#include "cqlens/records.hpp"

#include "cqlens/format.hpp"

using namespace cqlens::literals;

namespace cqlens {

    namespace detail {

        static std::string access_message(access_kind kind, std::string_view label, const std::string& path) {
            switch (kind) {
                case access_kind::missing:
                    return "{} not found: {}"_format(label, path);
                case access_kind::permission_denied:
                    return "Permission denied reading {}: {}"_format(label, path);
                case access_kind::os_error:
                    return "OS error while reading {}: {}"_format(label, path);
            }
            return "Error reading {}: {}"_format(label, path);
        }

    }  // namespace detail

    access_error::access_error(access_kind kind, std::string_view label, const std::filesystem::path& path)
            : lookup_error{detail::access_message(kind, label, path.string())},
              kind_{kind},
              label_{label},
              path_{path} {}

    std::string function_record::to_string() const {
        return "{} {}:{}-{} id={} caller={}"_format(function_name, file, start_line, end_line, function_id, caller_id);
    }

    std::string macro_record::to_string() const {
        return "{} {}"_format(macro_name, body);
    }

    std::string global_var_record::to_string() const {
        return "{} {}:{}-{}"_format(global_var_name, file, start_line, end_line);
    }

    std::string class_record::to_string() const {
        return "{} {} ({}) {}:{}-{}"_format(type, class_name, simple_name, file, start_line, end_line);
    }

}  // namespace cqlens
