#include "genesis/stager.hpp"

#include "genesis/logging.hpp"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace genesis {

DependencyStager::DependencyStager(fs::path config_dir, fs::path stage_root)
    : config_dir_(std::move(config_dir)), stage_root_(std::move(stage_root)) {
}

Result<fs::path> DependencyStager::stage(const std::vector<Dependency> &deps) const {
    std::vector<fs::path> sources;
    sources.reserve(deps.size());
    for (const auto &dep : deps) {
        const fs::path src = (config_dir_ / dep.src).lexically_normal();
        std::error_code ec;
        if (!fs::exists(src, ec)) {
            return fail(ErrorKind::DependencyMissing, "dependency source {} (declared as '{}' for '/{}') not found",
                        src.string(), dep.src.string(), dep.dst.generic_string());
        }
        sources.push_back(src);
    }

    std::error_code ec;
    fs::remove_all(stage_root_, ec);
    if (ec) {
        return fail(ErrorKind::Io, "cannot clear staging directory {}: {}", stage_root_.string(), ec.message());
    }
    fs::create_directories(stage_root_, ec);
    if (ec) {
        return fail(ErrorKind::Io, "cannot create staging directory {}: {}", stage_root_.string(), ec.message());
    }

    for (size_t i = 0; i < deps.size(); ++i) {
        if (auto res = copy_dependency(deps[i], sources[i]); !res)
            return std::unexpected(res.error());
        GENESIS_LOG_INFO("staged dependency",
                         {str_field("src", sources[i].string()), str_field("dst", "/" + deps[i].dst.generic_string())});
    }
    return stage_root_;
}

Result<void> DependencyStager::copy_dependency(const Dependency &dep, const fs::path &src) const {
    const fs::path dst = stage_root_ / dep.dst;
    std::error_code ec;

    fs::create_directories(dst.parent_path(), ec);
    if (ec) {
        return fail(ErrorKind::Io, "cannot create {}: {}", dst.parent_path().string(), ec.message());
    }

    // The declared source itself may be a link; everything below it is copied as is.
    try {
        if (fs::is_directory(src)) {
            fs::create_directories(dst);
            const auto options = fs::copy_options::recursive | fs::copy_options::copy_symlinks |
                                 fs::copy_options::overwrite_existing;
            for (const auto &entry : fs::directory_iterator(src)) {
                fs::copy(entry.path(), dst / entry.path().filename(), options);
            }
        } else {
            fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
        }
    } catch (const fs::filesystem_error &e) {
        ec = e.code();
    }

    if (ec) {
        return fail(ErrorKind::Io, "cannot stage {} to {}: {}", src.string(), dst.string(), ec.message());
    }
    return {};
}

} // namespace genesis
