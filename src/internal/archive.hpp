#pragma once

#include "cqlens/records.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cqlens::internal {

    /*
     * Read-only view of a ZIP archive (the CodeQL source archive, src.zip).
     *
     * The file stays open for the archive's lifetime. Construction reads only the end
     * record and the central directory, indexing it by entry name; read() then seeks to
     * the one requested entry. Stored (0) and deflated (8) entries are supported; zip64
     * end records and extra fields are honored. Entry contents are CRC-checked on read.
     *
     * Errors:
     *   - archive missing or unreadable: access_error (label "Source archive")
     *   - malformed archive, unknown entry, unsupported method, CRC mismatch: archive_error
     */
    class source_archive {
      public:
        explicit source_archive(std::filesystem::path path);

        std::string read(std::string_view name) const;

        const std::filesystem::path& path() const noexcept { return path_; }

      private:
        struct entry {
            std::string name{};
            uint16_t method{};
            uint32_t crc32{};
            uint64_t compressed_size{};
            uint64_t uncompressed_size{};
            uint64_t local_header_offset{};
        };

        struct file_closer {
            void operator()(std::FILE* f) const noexcept { std::fclose(f); }
        };

        void index_central_directory();
        const entry& find(std::string_view name) const;
        std::string read_at(uint64_t offset, uint64_t length) const;

        std::filesystem::path path_;
        std::unique_ptr<std::FILE, file_closer> file_;
        uint64_t file_size_{};
        std::vector<entry> entries_{};
        std::unordered_map<std::string, size_t> by_name_{};
    };

}  // namespace cqlens::internal
