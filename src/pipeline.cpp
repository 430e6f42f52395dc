#include "genesis/pipeline.hpp"

#include "genesis/collector.hpp"
#include "genesis/executor.hpp"
#include "genesis/logging.hpp"
#include "genesis/parser.hpp"
#include "genesis/plan.hpp"
#include "genesis/stager.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <print>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace genesis {

namespace {

Result<std::optional<std::string>> read_developer_key(const std::optional<fs::path> &path) {
    if (!path)
        return std::nullopt;

    std::ifstream file(*path);
    if (!file.is_open()) {
        return fail(ErrorKind::Io, "cannot read developer key {}", path->string());
    }
    std::ostringstream content;
    content << file.rdbuf();

    std::string key = content.str();
    while (!key.empty() && (key.back() == '\n' || key.back() == '\r'))
        key.pop_back();
    if (key.empty()) {
        return fail(ErrorKind::Io, "developer key {} is empty", path->string());
    }
    return key;
}

} // namespace

ProjectLayout ProjectLayout::from(const fs::path &root, const BuildOptions &options) {
    return ProjectLayout{
        .root = root,
        .output_root = options.output_dir.value_or(root / "output"),
        .work_root = options.work_dir.value_or(root / ".genesis"),
    };
}

Result<VersionTag> resolve_version(RepositoryStateProvider &repo, const ReleasePolicy &policy, Clock clock) {
    VersionResolver resolver(repo, policy, std::move(clock));
    return resolver.resolve();
}

Result<RunSummary> build_project(const fs::path &root, const BuildOptions &options, ImageBuilder &builder,
                                 RepositoryStateProvider &repo, Clock clock) {
    const ProjectLayout layout = ProjectLayout::from(root, options);

    auto config = load_config(root);
    if (!config)
        return std::unexpected(config.error());

    auto version = resolve_version(repo, options.release, std::move(clock));
    if (!version)
        return std::unexpected(version.error());
    const std::string version_string = version->to_string();
    GENESIS_LOG_INFO("resolved version", {str_field("version", version_string),
                                          str_field("kind", to_string(version->kind))});

    auto developer_key = read_developer_key(options.developer_key);
    if (!developer_key)
        return std::unexpected(developer_key.error());

    ImageParameterMerger merger(options.environment.value_or(EnvironmentSnapshot::capture()), *developer_key);
    const PlanLayout plan_layout{
        .deps_root = layout.stage_root(),
        .work_root = layout.units_root(),
        .output_root = layout.output_root,
    };
    auto plan = BuildPlan::resolve(*config, plan_layout, merger, version_string);
    if (!plan)
        return std::unexpected(plan.error());

    ArtifactCollector collector(layout.output_root, options.force);
    Executor executor(std::move(*plan), builder, collector,
                      ExecutorConfig{.jobs = options.jobs, .force = options.force, .interrupt = options.interrupt});

    if (options.dry_run) {
        std::println("{}", executor.emit_plan().dump(4));
        return RunSummary{.version = version_string, .reports = {}, .errors = {}};
    }

    DependencyStager stager(config->config_dir, layout.stage_root());
    if (auto staged = stager.stage(config->deps); !staged)
        return std::unexpected(staged.error());

    RunSummary summary = executor.execute();
    summary.version = version_string;

    if (auto res = collector.write_version(version_string); !res)
        summary.errors.push_back(res.error());
    if (auto res = collector.write_summary(summary); !res)
        summary.errors.push_back(res.error());

    GENESIS_LOG_INFO("build finished", {str_field("version", version_string),
                                        int_field("built", static_cast<std::int64_t>(summary.count(UnitStatus::Built))),
                                        int_field("skipped", static_cast<std::int64_t>(summary.count(UnitStatus::Skipped))),
                                        int_field("failed", static_cast<std::int64_t>(summary.count(UnitStatus::Failed))),
                                        int_field("cancelled", static_cast<std::int64_t>(summary.count(UnitStatus::Cancelled)))});
    return summary;
}

Result<void> clean_project(const fs::path &root, const BuildOptions &options) {
    const ProjectLayout layout = ProjectLayout::from(root, options);
    for (const auto &dir : {layout.output_root, layout.work_root}) {
        std::error_code ec;
        const auto removed = fs::remove_all(dir, ec);
        if (ec) {
            return fail(ErrorKind::Io, "cannot remove {}: {}", dir.string(), ec.message());
        }
        if (removed > 0)
            std::println("Removed {}", dir.string());
    }
    return {};
}

} // namespace genesis
