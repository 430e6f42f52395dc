#pragma once

#include "genesis/ledger.hpp"
#include "genesis/plan.hpp"
#include "genesis/utility.hpp"

#include <filesystem>
#include <string>

namespace genesis {

/**
 * @brief Assembles `<output>/<element>/` from finished units, the element's
 *        manifest and its extra artifacts.
 *
 * Files only ever appear through a rename, never half-written. Without
 * `force`, files that already hold the right bytes are not rewritten.
 */
class ArtifactCollector {
public:
    explicit ArtifactCollector(std::filesystem::path output_root, bool force = false);

    /**
     * @brief Installs the images of element @p element_index that the ledger
     *        reports as Built, then copies its manifest and artifacts.
     *
     * Call once every unit of the element has been recorded.
     * @return `ArtifactMissing` for an absent manifest/artifact, `Io` otherwise.
     */
    Result<void> collect_element(const BuildPlan &plan, size_t element_index, const ResultLedger &ledger) const;

    /// `<output>/version`, rewritten only when it changes.
    Result<void> write_version(const std::string &version) const;

    /// `<output>/build-summary.json`, rewritten only when it changes.
    Result<void> write_summary(const RunSummary &summary) const;

private:
    Result<void> place_file(const std::filesystem::path &src, const std::filesystem::path &dst) const;

    std::filesystem::path output_root_;
    bool force_;
};

} // namespace genesis
