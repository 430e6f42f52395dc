#pragma once

#include "genesis/domain.hpp"
#include "genesis/utility.hpp"

#include <filesystem>
#include <vector>

namespace genesis {

/**
 * @brief Materializes declared dependencies under a staging directory.
 *
 * Every `src` is resolved against the configuration directory, never the
 * current working directory. The staging directory is wiped before it is
 * repopulated, so a rerun never sees files from an earlier, partial run.
 * Directory trees are copied recursively with symlinks kept as symlinks.
 */
class DependencyStager {
public:
    DependencyStager(std::filesystem::path config_dir, std::filesystem::path stage_root);

    /**
     * @return The staging root, or `DependencyMissing` naming the first
     *         unresolved source (checked before anything is touched).
     */
    Result<std::filesystem::path> stage(const std::vector<Dependency> &deps) const;

private:
    Result<void> copy_dependency(const Dependency &dep, const std::filesystem::path &src) const;

    std::filesystem::path config_dir_;
    std::filesystem::path stage_root_;
};

} // namespace genesis
