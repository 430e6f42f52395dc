#pragma once

#include "genesis/plan.hpp"
#include "genesis/utility.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <string>

namespace genesis {

using StopPredicate = std::function<bool()>;

/**
 * @brief The external image builder seam.
 *
 * An implementation turns one unit into exactly one file at
 * `unit.build_output()`. It may only write below `unit.work_dir`.
 */
class ImageBuilder {
public:
    virtual ~ImageBuilder() = default;

    /**
     * @return Success once the image file exists, `BuildFailed` naming the
     *         image otherwise, `Cancelled` when @p should_stop fired.
     */
    virtual Result<void> build(const ResolvedBuildUnit &unit, const StopPredicate &should_stop) = 0;
};

/**
 * @brief Packer JSON template (qemu builder) for one unit.
 */
nlohmann::json render_packer_template(const ResolvedBuildUnit &unit);

struct PackerOptions {
    std::string packer = "packer";
    std::chrono::seconds timeout{0}; ///< Per invocation; zero means none.
};

class PackerImageBuilder : public ImageBuilder {
public:
    explicit PackerImageBuilder(PackerOptions options = {});

    Result<void> build(const ResolvedBuildUnit &unit, const StopPredicate &should_stop) override;

private:
    PackerOptions options_;
};

} // namespace genesis
