#pragma once

#include "cqlens/records.hpp"

#include <glaze/glaze.hpp>

#include <optional>
#include <string>
#include <vector>

namespace cqlens::internal::json {

    struct function_payload {
        function_record function{};
        std::optional<function_record> parent{};
        std::string snippet{};
    };

    struct not_found_payload {
        std::string not_found{};
    };

    struct error_payload {
        std::string error{};
    };

    template <typename T>
    std::string write(const T& value) {
        std::string out{};
        if (glz::write_json(value, out)) {
            throw lookup_error{"failed to serialize json"};
        }
        return out;
    }

}  // namespace cqlens::internal::json

namespace glz {
    template <>
    struct meta<cqlens::function_record> {
        using T = cqlens::function_record;
        static constexpr auto value = object(
                "function_name",
                &T::function_name,
                "file",
                &T::file,
                "start_line",
                &T::start_line,
                "function_id",
                &T::function_id,
                "end_line",
                &T::end_line,
                "caller_id",
                &T::caller_id);
    };

    template <>
    struct meta<cqlens::macro_record> {
        using T = cqlens::macro_record;
        static constexpr auto value = object("macro_name", &T::macro_name, "body", &T::body);
    };

    template <>
    struct meta<cqlens::global_var_record> {
        using T = cqlens::global_var_record;
        static constexpr auto value = object(
                "global_var_name",
                &T::global_var_name,
                "file",
                &T::file,
                "start_line",
                &T::start_line,
                "end_line",
                &T::end_line);
    };

    template <>
    struct meta<cqlens::class_record> {
        using T = cqlens::class_record;
        static constexpr auto value = object(
                "type",
                &T::type,
                "class_name",
                &T::class_name,
                "file",
                &T::file,
                "start_line",
                &T::start_line,
                "end_line",
                &T::end_line,
                "simple_name",
                &T::simple_name);
    };

    template <>
    struct meta<cqlens::internal::json::function_payload> {
        using T = cqlens::internal::json::function_payload;
        static constexpr auto value = object("function", &T::function, "parent", &T::parent, "snippet", &T::snippet);
    };

    template <>
    struct meta<cqlens::internal::json::not_found_payload> {
        using T = cqlens::internal::json::not_found_payload;
        static constexpr auto value = object("not_found", &T::not_found);
    };

    template <>
    struct meta<cqlens::internal::json::error_payload> {
        using T = cqlens::internal::json::error_payload;
        static constexpr auto value = object("error", &T::error);
    };
}  // namespace glz
