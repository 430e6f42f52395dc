#pragma once

#include "genesis/domain.hpp"
#include "genesis/params.hpp"
#include "genesis/utility.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace genesis {

/**
 * @brief One image ready to hand to the builder.
 */
struct ResolvedBuildUnit {
    size_t element_index = 0;
    std::string element_key;
    ImageSpec image;
    ParameterBag parameters;
    std::optional<std::filesystem::path> script; ///< Absolute, when the image declares one.
    std::filesystem::path deps_root;             ///< Shared, read-only staged tree.
    std::filesystem::path work_dir;              ///< Owned by this unit alone.
    std::filesystem::path artifact;              ///< Final location in the output tree.
    std::string version;

    /// Where the builder must leave its single image file.
    std::filesystem::path build_output() const {
        return work_dir / "out" / image.file_name();
    }

    std::string id() const {
        return element_key + "/" + image.name;
    }
};

struct PlanLayout {
    std::filesystem::path deps_root;
    std::filesystem::path work_root;
    std::filesystem::path output_root;
};

/**
 * @brief Every image of every element, resolved in declaration order.
 *
 * Unit indices are stable; `element_units(i)` lists the units of element i.
 */
class BuildPlan {
public:
    static Result<BuildPlan> resolve(const ConfigModel &config, const PlanLayout &layout,
                                     const ImageParameterMerger &merger, const std::string &version);

    const std::vector<ResolvedBuildUnit> &units() const {
        return units_;
    }
    const std::vector<Element> &elements() const {
        return elements_;
    }
    const std::vector<size_t> &element_units(size_t element_index) const {
        return element_units_[element_index];
    }
    const std::filesystem::path &config_dir() const {
        return config_dir_;
    }

private:
    Result<size_t> add_unit(ResolvedBuildUnit unit);

    std::filesystem::path config_dir_;
    std::vector<Element> elements_;
    std::vector<ResolvedBuildUnit> units_;
    std::vector<std::vector<size_t>> element_units_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace genesis
