#include "genesis/collector.hpp"

#include "genesis/fs_util.hpp"
#include "genesis/logging.hpp"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace genesis {

ArtifactCollector::ArtifactCollector(fs::path output_root, bool force)
    : output_root_(std::move(output_root)), force_(force) {
}

Result<void> ArtifactCollector::place_file(const fs::path &src, const fs::path &dst) const {
    std::error_code ec;
    if (!fs::is_regular_file(src, ec)) {
        return fail(ErrorKind::ArtifactMissing, "{} does not exist", src.string());
    }
    if (!force_ && same_contents(src, dst)) {
        GENESIS_LOG_DEBUG("artifact up to date", {str_field("path", dst.string())});
        return {};
    }
    return copy_file_atomic(src, dst);
}

Result<void> ArtifactCollector::collect_element(const BuildPlan &plan, size_t element_index,
                                                const ResultLedger &ledger) const {
    const Element &element = plan.elements()[element_index];
    const fs::path element_dir = output_root_ / element_key(element, element_index);

    std::error_code ec;
    fs::create_directories(element_dir, ec);
    if (ec) {
        return fail(ErrorKind::Io, "cannot create {}: {}", element_dir.string(), ec.message());
    }

    for (size_t unit_id : plan.element_units(element_index)) {
        const ResolvedBuildUnit &unit = plan.units()[unit_id];
        auto report = ledger.find(unit.element_key, unit.image.name);
        if (!report || report->status != UnitStatus::Built)
            continue;

        // Installed by an earlier pass over the same ledger.
        if (!fs::exists(unit.build_output(), ec) && fs::is_regular_file(unit.artifact, ec))
            continue;

        if (auto res = move_file_atomic(unit.build_output(), unit.artifact); !res)
            return res;
        fs::remove_all(unit.work_dir, ec);
        GENESIS_LOG_INFO("image installed", {str_field("image", unit.image.name), str_field("path", unit.artifact.string())});
    }

    if (element.manifest) {
        const fs::path src = plan.config_dir() / *element.manifest;
        if (auto res = place_file(src, element_dir / src.filename()); !res)
            return res;
    }
    for (const auto &artifact : element.artifacts) {
        const fs::path src = plan.config_dir() / artifact;
        if (auto res = place_file(src, element_dir / src.filename()); !res)
            return res;
    }
    return {};
}

Result<void> ArtifactCollector::write_version(const std::string &version) const {
    auto res = write_if_changed(output_root_ / "version", version + "\n");
    if (!res)
        return std::unexpected(res.error());
    return {};
}

Result<void> ArtifactCollector::write_summary(const RunSummary &summary) const {
    auto res = write_if_changed(output_root_ / "build-summary.json", to_json(summary).dump(2) + "\n");
    if (!res)
        return std::unexpected(res.error());
    return {};
}

} // namespace genesis
