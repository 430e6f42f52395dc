#include "genesis/fs_util.hpp"

#include "genesis/mmap.hpp"

#include <fstream>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace genesis {

namespace {

fs::path temporary_sibling(const fs::path &dst) {
    return dst.parent_path() / (".tmp." + dst.filename().string() + "." + std::to_string(::getpid()));
}

} // namespace

bool same_contents(const fs::path &a, const fs::path &b) {
    std::error_code ec;
    if (!fs::is_regular_file(a, ec) || !fs::is_regular_file(b, ec))
        return false;
    const auto size_a = fs::file_size(a, ec);
    if (ec)
        return false;
    const auto size_b = fs::file_size(b, ec);
    if (ec || size_a != size_b)
        return false;
    auto left = MappedFile::open(a);
    auto right = MappedFile::open(b);
    return left && right && left->content() == right->content();
}

Result<void> copy_file_atomic(const fs::path &src, const fs::path &dst) {
    std::error_code ec;
    fs::create_directories(dst.parent_path(), ec);
    if (ec) {
        return fail(ErrorKind::Io, "cannot create {}: {}", dst.parent_path().string(), ec.message());
    }

    const fs::path tmp = temporary_sibling(dst);
    fs::copy_file(src, tmp, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return fail(ErrorKind::Io, "cannot copy {} to {}: {}", src.string(), dst.string(), ec.message());
    }
    fs::rename(tmp, dst, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return fail(ErrorKind::Io, "cannot move {} into place: {}", dst.string(), ec.message());
    }
    return {};
}

Result<void> move_file_atomic(const fs::path &src, const fs::path &dst) {
    std::error_code ec;
    fs::create_directories(dst.parent_path(), ec);
    if (ec) {
        return fail(ErrorKind::Io, "cannot create {}: {}", dst.parent_path().string(), ec.message());
    }

    fs::rename(src, dst, ec);
    if (!ec)
        return {};
    if (ec != std::errc::cross_device_link) {
        return fail(ErrorKind::Io, "cannot move {} to {}: {}", src.string(), dst.string(), ec.message());
    }

    if (auto res = copy_file_atomic(src, dst); !res)
        return res;
    fs::remove(src, ec);
    return {};
}

Result<bool> write_if_changed(const fs::path &dst, std::string_view content) {
    std::error_code ec;
    if (fs::is_regular_file(dst, ec)) {
        // An unreadable file is simply rewritten.
        if (auto existing = MappedFile::open(dst); existing && existing->content() == content)
            return false;
    }

    fs::create_directories(dst.parent_path(), ec);
    if (ec) {
        return fail(ErrorKind::Io, "cannot create {}: {}", dst.parent_path().string(), ec.message());
    }

    const fs::path tmp = temporary_sibling(dst);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return fail(ErrorKind::Io, "cannot write {}", tmp.string());
        }
    }
    fs::rename(tmp, dst, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return fail(ErrorKind::Io, "cannot move {} into place: {}", dst.string(), ec.message());
    }
    return true;
}

} // namespace genesis
