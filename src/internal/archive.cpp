#include "archive.hpp"

#include "scanner.hpp"

#include "cqlens/format.hpp"

#include <zlib.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <optional>

#include <sys/types.h>

using namespace cqlens::literals;

namespace cqlens::internal {

    namespace detail {

        static constexpr uint32_t eocd_signature = 0x06054b50U;
        static constexpr uint32_t zip64_locator_signature = 0x07064b50U;
        static constexpr uint32_t zip64_eocd_signature = 0x06064b50U;
        static constexpr uint32_t central_header_signature = 0x02014b50U;
        static constexpr uint32_t local_header_signature = 0x04034b50U;

        static constexpr size_t eocd_size = 22U;
        static constexpr size_t zip64_locator_size = 20U;
        static constexpr size_t zip64_eocd_size = 56U;
        static constexpr size_t central_header_size = 46U;
        static constexpr size_t local_header_size = 30U;
        static constexpr size_t max_comment_size = 0xFFFFU;

        static constexpr uint16_t zip64_extra_id = 0x0001U;
        static constexpr uint16_t method_stored = 0U;
        static constexpr uint16_t method_deflated = 8U;

        // bounds-checked little-endian reads over a buffer read from the archive
        struct reader {
            std::string_view data;

            bool has(uint64_t offset, uint64_t length) const {
                return offset <= data.size() && length <= data.size() - offset;
            }

            uint16_t u16(uint64_t offset) const {
                if (!has(offset, 2U)) {
                    throw archive_error{"truncated zip record at offset {}"_format(offset)};
                }
                auto* p = reinterpret_cast<const unsigned char*>(data.data() + offset);
                return static_cast<uint16_t>(p[0] | (p[1] << 8U));
            }

            uint32_t u32(uint64_t offset) const {
                return static_cast<uint32_t>(u16(offset)) | (static_cast<uint32_t>(u16(offset + 2U)) << 16U);
            }

            uint64_t u64(uint64_t offset) const {
                return static_cast<uint64_t>(u32(offset)) | (static_cast<uint64_t>(u32(offset + 4U)) << 32U);
            }
        };

        static std::string inflate_raw(std::string_view compressed, uint64_t expected_size, std::string_view name) {
            if (compressed.size() > UINT_MAX || expected_size > UINT_MAX) {
                throw archive_error{"entry too large to inflate: {}"_format(name)};
            }

            std::string out(static_cast<size_t>(expected_size), '\0');

            z_stream stream{};
            if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
                throw archive_error{"inflateInit2 failed for entry: {}"_format(name)};
            }

            stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
            stream.avail_in = static_cast<uInt>(compressed.size());
            stream.next_out = reinterpret_cast<Bytef*>(out.data());
            stream.avail_out = static_cast<uInt>(out.size());

            auto rc = inflate(&stream, Z_FINISH);
            auto produced = stream.total_out;
            inflateEnd(&stream);

            if (rc != Z_STREAM_END || produced != expected_size) {
                throw archive_error{"corrupt deflate stream in entry: {}"_format(name)};
            }
            return out;
        }

    }  // namespace detail

    source_archive::source_archive(std::filesystem::path path) : path_{std::move(path)} {
        errno = 0;
        file_.reset(std::fopen(path_.c_str(), "rb"));
        if (!file_) {
            throw access_error{classify_errno(errno), source_archive_label, path_};
        }

        errno = 0;
        off_t end = -1;
        if (::fseeko(file_.get(), 0, SEEK_END) == 0) {
            end = ::ftello(file_.get());
        }
        if (end < 0) {
            throw access_error{classify_errno(errno), source_archive_label, path_};
        }
        file_size_ = static_cast<uint64_t>(end);

        index_central_directory();
        debug_log("indexed ", entries_.size(), " entries from ", path_.string());
    }

    std::string source_archive::read_at(uint64_t offset, uint64_t length) const {
        if (offset > file_size_ || length > file_size_ - offset) {
            throw archive_error{"truncated zip record at offset {} in {}"_format(offset, path_.string())};
        }

        std::string out(static_cast<size_t>(length), '\0');
        if (out.empty()) {
            return out;
        }

        errno = 0;
        if (::fseeko(file_.get(), static_cast<off_t>(offset), SEEK_SET) != 0) {
            throw access_error{classify_errno(errno), source_archive_label, path_};
        }
        auto n = std::fread(out.data(), 1U, out.size(), file_.get());
        if (n != out.size()) {
            if (std::ferror(file_.get()) != 0) {
                throw access_error{classify_errno(errno), source_archive_label, path_};
            }
            throw archive_error{"truncated zip record at offset {} in {}"_format(offset, path_.string())};
        }
        return out;
    }

    void source_archive::index_central_directory() {
        if (file_size_ < detail::eocd_size) {
            throw archive_error{"not a zip archive: {}"_format(path_.string())};
        }

        // end of central directory record sits within the last 64KiB + 22 bytes, with
        // room before it for a zip64 locator
        auto tail_size = std::min<uint64_t>(
                file_size_, detail::eocd_size + detail::max_comment_size + detail::zip64_locator_size);
        auto tail = read_at(file_size_ - tail_size, tail_size);
        detail::reader in{tail};

        std::optional<uint64_t> eocd{};
        auto lowest = tail.size() > detail::eocd_size + detail::max_comment_size
                            ? tail.size() - detail::eocd_size - detail::max_comment_size
                            : 0U;
        for (auto pos = tail.size() - detail::eocd_size;; --pos) {
            if (in.u32(pos) == detail::eocd_signature) {
                eocd = pos;
                break;
            }
            if (pos == lowest) {
                break;
            }
        }
        if (!eocd) {
            throw archive_error{"missing end of central directory: {}"_format(path_.string())};
        }

        uint64_t entry_count = in.u16(*eocd + 10U);
        uint64_t cd_size = in.u32(*eocd + 12U);
        uint64_t cd_offset = in.u32(*eocd + 16U);

        if (*eocd >= detail::zip64_locator_size &&
            in.u32(*eocd - detail::zip64_locator_size) == detail::zip64_locator_signature) {
            auto zip64_at = in.u64(*eocd - detail::zip64_locator_size + 8U);
            if (zip64_at > file_size_ || detail::zip64_eocd_size > file_size_ - zip64_at) {
                throw archive_error{"corrupt zip64 end of central directory: {}"_format(path_.string())};
            }
            auto record = read_at(zip64_at, detail::zip64_eocd_size);
            detail::reader z{record};
            if (z.u32(0U) != detail::zip64_eocd_signature) {
                throw archive_error{"corrupt zip64 end of central directory: {}"_format(path_.string())};
            }
            entry_count = z.u64(32U);
            cd_size = z.u64(40U);
            cd_offset = z.u64(48U);
        }

        auto central = read_at(cd_offset, cd_size);
        detail::reader cd{central};

        entries_.clear();
        by_name_.clear();

        uint64_t pos = 0U;
        for (uint64_t i = 0U; i < entry_count; ++i) {
            if (cd.u32(pos) != detail::central_header_signature) {
                throw archive_error{"corrupt central directory entry {} in {}"_format(i, path_.string())};
            }

            entry e{};
            e.method = cd.u16(pos + 10U);
            e.crc32 = cd.u32(pos + 16U);
            e.compressed_size = cd.u32(pos + 20U);
            e.uncompressed_size = cd.u32(pos + 24U);
            auto name_len = cd.u16(pos + 28U);
            auto extra_len = cd.u16(pos + 30U);
            auto comment_len = cd.u16(pos + 32U);
            e.local_header_offset = cd.u32(pos + 42U);

            auto name_at = pos + detail::central_header_size;
            if (!cd.has(name_at, name_len)) {
                throw archive_error{"truncated entry name in {}"_format(path_.string())};
            }
            e.name.assign(central.data() + name_at, name_len);

            // zip64 extra: only the fields saturated in the fixed header are present, in order
            auto extra_at = name_at + name_len;
            auto extra_end = extra_at + extra_len;
            while (extra_at + 4U <= extra_end) {
                auto id = cd.u16(extra_at);
                auto size = cd.u16(extra_at + 2U);
                auto field = extra_at + 4U;
                if (id == detail::zip64_extra_id) {
                    if (e.uncompressed_size == UINT32_MAX) {
                        e.uncompressed_size = cd.u64(field);
                        field += 8U;
                    }
                    if (e.compressed_size == UINT32_MAX) {
                        e.compressed_size = cd.u64(field);
                        field += 8U;
                    }
                    if (e.local_header_offset == UINT32_MAX) {
                        e.local_header_offset = cd.u64(field);
                    }
                }
                extra_at += 4U + size;
            }

            // first entry wins on duplicate names
            by_name_.try_emplace(e.name, entries_.size());
            entries_.push_back(std::move(e));
            pos = extra_end + comment_len;
        }
    }

    const source_archive::entry& source_archive::find(std::string_view name) const {
        auto it = by_name_.find(std::string{name});
        if (it == by_name_.end()) {
            throw archive_error{"file not found in archive {}: {}"_format(path_.string(), name)};
        }
        return entries_[it->second];
    }

    std::string source_archive::read(std::string_view name) const {
        const auto& e = find(name);

        auto header = read_at(e.local_header_offset, detail::local_header_size);
        detail::reader in{header};
        if (in.u32(0U) != detail::local_header_signature) {
            throw archive_error{"corrupt local header for entry: {}"_format(e.name)};
        }
        auto data_at = e.local_header_offset + detail::local_header_size + in.u16(26U) + in.u16(28U);
        if (data_at > file_size_ || e.compressed_size > file_size_ - data_at) {
            throw archive_error{"truncated data for entry: {}"_format(e.name)};
        }
        auto payload = read_at(data_at, e.compressed_size);

        std::string out{};
        switch (e.method) {
            case detail::method_stored:
                out = std::move(payload);
                break;
            case detail::method_deflated:
                out = detail::inflate_raw(payload, e.uncompressed_size, e.name);
                break;
            default:
                throw archive_error{"unsupported compression method {} for entry: {}"_format(e.method, e.name)};
        }

        auto actual = ::crc32(0L, reinterpret_cast<const Bytef*>(out.data()), static_cast<uInt>(out.size()));
        if (actual != e.crc32) {
            throw archive_error{"CRC mismatch for entry: {}"_format(e.name)};
        }
        return out;
    }

}  // namespace cqlens::internal
