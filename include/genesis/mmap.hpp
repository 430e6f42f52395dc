#pragma once

#include "genesis/utility.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace genesis {

/**
 * @brief Read-only mapping of a whole file, released on destruction.
 *
 * Used to compare artifacts byte for byte without reading disk images into
 * heap buffers. Empty files yield an empty view and no mapping.
 */
class MappedFile {
public:
    static Result<MappedFile> open(const std::filesystem::path &path) {
        MappedFile file;
        file.fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (file.fd_ == -1) {
            return fail(ErrorKind::Io, "cannot open {}: {}", path.string(), std::strerror(errno));
        }

        struct stat sb;
        if (::fstat(file.fd_, &sb) == -1) {
            return fail(ErrorKind::Io, "cannot stat {}: {}", path.string(), std::strerror(errno));
        }
        file.size_ = static_cast<size_t>(sb.st_size);
        if (file.size_ == 0)
            return file;

        ::posix_fadvise(file.fd_, 0, 0, POSIX_FADV_SEQUENTIAL);
        void *addr = ::mmap(nullptr, file.size_, PROT_READ, MAP_PRIVATE, file.fd_, 0);
        if (addr == MAP_FAILED) {
            return fail(ErrorKind::Io, "cannot map {}: {}", path.string(), std::strerror(errno));
        }
        file.data_ = static_cast<const char *>(addr);
        return file;
    }

    MappedFile(MappedFile &&other) noexcept
        : fd_(std::exchange(other.fd_, -1)), data_(std::exchange(other.data_, nullptr)),
          size_(std::exchange(other.size_, 0)) {
    }

    MappedFile &operator=(MappedFile &&other) noexcept {
        if (this != &other) {
            release();
            fd_ = std::exchange(other.fd_, -1);
            data_ = std::exchange(other.data_, nullptr);
            size_ = std::exchange(other.size_, 0);
        }
        return *this;
    }

    MappedFile(const MappedFile &) = delete;
    MappedFile &operator=(const MappedFile &) = delete;

    ~MappedFile() {
        release();
    }

    std::string_view content() const {
        return data_ ? std::string_view(data_, size_) : std::string_view();
    }

    size_t size() const {
        return size_;
    }

private:
    MappedFile() = default;

    void release() {
        if (data_)
            ::munmap(const_cast<char *>(data_), size_);
        if (fd_ != -1)
            ::close(fd_);
        data_ = nullptr;
        fd_ = -1;
    }

    int fd_ = -1;
    const char *data_ = nullptr;
    size_t size_ = 0;
};

} // namespace genesis
