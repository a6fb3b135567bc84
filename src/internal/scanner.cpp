#include "scanner.hpp"

#include "cqlens/utils.hpp"

#include <cerrno>

namespace cqlens::internal {

    access_kind classify_errno(int err) noexcept {
        switch (err) {
            case ENOENT:
            case ENOTDIR:
                return access_kind::missing;
            case EACCES:
            case EPERM:
                return access_kind::permission_denied;
            default:
                return access_kind::os_error;
        }
    }

    row_scanner::row_scanner(std::filesystem::path path, std::string_view label)
            : path_{std::move(path)}, label_{label} {
        errno = 0;
        file_.reset(std::fopen(path_.c_str(), "r"));
        if (!file_) {
            throw access_error{classify_errno(errno), label_, path_};
        }
        debug_log("opened ", label_, ": ", path_.string());
    }

    bool row_scanner::next(std::string& line) {
        line.clear();
        if (exhausted_) {
            return false;
        }

        auto* raw = buffer_.release();
        errno = 0;
        auto n = ::getline(&raw, &capacity_, file_.get());
        auto err = errno;
        buffer_.reset(raw);

        if (n < 0) {
            exhausted_ = true;
            if (std::ferror(file_.get()) != 0) {
                throw access_error{classify_errno(err), label_, path_};
            }
            return false;
        }

        line.assign(raw, static_cast<size_t>(n));
        return true;
    }

}  // namespace cqlens::internal
