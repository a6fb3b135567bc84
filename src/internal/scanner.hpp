#pragma once

#include "cqlens/records.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace cqlens::internal {

    /*
     * Forward-only reader over the raw lines of one table file.
     *
     * Lines are returned with their terminators and may hold embedded NUL bytes. The file handle is owned for the
     * scanner's lifetime and released on every exit path, including a thrown
     * access_error. Open and read failures are reported as access_error carrying the
     * table label and path.
     */
    class row_scanner {
      public:
        row_scanner(std::filesystem::path path, std::string_view label);

        row_scanner(const row_scanner&) = delete;
        row_scanner& operator=(const row_scanner&) = delete;

        // false at end of file
        bool next(std::string& line);

        const std::filesystem::path& path() const noexcept { return path_; }

      private:
        struct file_closer {
            void operator()(std::FILE* f) const noexcept { std::fclose(f); }
        };

        // getline(3) owns the buffer through malloc/realloc
        struct buffer_free {
            void operator()(char* p) const noexcept { std::free(p); }
        };

        std::filesystem::path path_;
        std::string label_;
        std::unique_ptr<std::FILE, file_closer> file_;
        std::unique_ptr<char, buffer_free> buffer_;
        size_t capacity_{0U};
        bool exhausted_{false};
    };

    access_kind classify_errno(int err) noexcept;

    template <typename Fn>
    void for_each_line(const std::filesystem::path& path, std::string_view label, Fn&& fn) {
        row_scanner scanner{path, label};
        std::string line{};
        while (scanner.next(line)) {
            if (fn(std::string_view{line})) {
                return;
            }
        }
    }

}  // namespace cqlens::internal
