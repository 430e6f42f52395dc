#pragma once

#include "genesis/image_builder.hpp"
#include "genesis/ledger.hpp"
#include "genesis/params.hpp"
#include "genesis/utility.hpp"
#include "genesis/version.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace genesis {

struct BuildOptions {
    bool force = false;
    std::optional<std::filesystem::path> developer_key;
    size_t jobs = 0; // 0 means auto-detect
    std::chrono::seconds timeout{0};
    std::string packer = "packer";
    ReleasePolicy release;
    std::optional<std::filesystem::path> output_dir; ///< Default `<root>/output`.
    std::optional<std::filesystem::path> work_dir;   ///< Default `<root>/.genesis`.
    bool dry_run = false;
    std::optional<EnvironmentSnapshot> environment; ///< Default: captured at plan time.
    const std::atomic<bool> *interrupt = nullptr;
};

struct ProjectLayout {
    std::filesystem::path root;
    std::filesystem::path output_root;
    std::filesystem::path work_root;

    std::filesystem::path stage_root() const {
        return work_root / "stage";
    }
    std::filesystem::path units_root() const {
        return work_root / "units";
    }

    static ProjectLayout from(const std::filesystem::path &root, const BuildOptions &options);
};

/**
 * @brief Resolves the version of the project at @p root.
 */
Result<VersionTag> resolve_version(RepositoryStateProvider &repo, const ReleasePolicy &policy, Clock clock = {});

/**
 * @brief Full build: configuration, version, staging, images, output tree.
 *
 * Configuration, version and staging errors are returned before any image
 * starts. Per-image outcomes are in the summary.
 */
Result<RunSummary> build_project(const std::filesystem::path &root, const BuildOptions &options,
                                 ImageBuilder &builder, RepositoryStateProvider &repo, Clock clock = {});

/**
 * @brief Removes the output and work directories.
 */
Result<void> clean_project(const std::filesystem::path &root, const BuildOptions &options);

} // namespace genesis
