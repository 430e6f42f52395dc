#include "genesis/plan.hpp"

#include <format>

namespace fs = std::filesystem;

namespace genesis {

Result<size_t> BuildPlan::add_unit(ResolvedBuildUnit unit) {
    const std::string output = unit.artifact.string();
    if (index_.contains(output)) { // 2 images would land on the same file.
        return fail(ErrorKind::ConfigMalformed, "Duplicate producer for output: {}", output);
    }

    size_t unit_id = units_.size();
    index_.emplace(output, unit_id);
    element_units_[unit.element_index].push_back(unit_id);
    units_.push_back(std::move(unit));
    return unit_id;
}

Result<BuildPlan> BuildPlan::resolve(const ConfigModel &config, const PlanLayout &layout,
                                     const ImageParameterMerger &merger, const std::string &version) {
    BuildPlan plan;
    plan.config_dir_ = config.config_dir;
    plan.elements_ = config.elements;
    plan.element_units_.resize(config.elements.size());

    for (size_t e = 0; e < config.elements.size(); ++e) {
        const Element &element = config.elements[e];
        const std::string key = element_key(element, e);

        for (const auto &image : element.images) {
            ResolvedBuildUnit unit{
                .element_index = e,
                .element_key = key,
                .image = image,
                .parameters = merger.merge(image),
                .script = image.script ? std::optional<fs::path>(config.resolve(*image.script)) : std::nullopt,
                .deps_root = layout.deps_root,
                .work_dir = layout.work_root / key / image.name,
                .artifact = layout.output_root / key / image.file_name(),
                .version = version,
            };
            if (auto res = plan.add_unit(std::move(unit)); !res)
                return std::unexpected(res.error());
        }
    }
    return plan;
}

} // namespace genesis
