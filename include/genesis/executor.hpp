#pragma once

#include "genesis/collector.hpp"
#include "genesis/image_builder.hpp"
#include "genesis/ledger.hpp"
#include "genesis/plan.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <thread>
#include <vector>

namespace genesis {

struct ExecutorConfig {
    size_t jobs = 0; // 0 means auto-detect
    bool force = false;
    const std::atomic<bool> *interrupt = nullptr; ///< Set from a signal handler.
};

/**
 * @brief Runs every unit of a plan on a bounded worker pool.
 *
 * Units share the read-only staged tree and each write only to their own
 * work directory. After the first failure no further unit starts, while the
 * ones already running finish. An element's output is assembled as soon as
 * its last unit has been recorded.
 */
class Executor {
public:
    Executor(BuildPlan plan, ImageBuilder &builder, ArtifactCollector &collector, ExecutorConfig config = {});

    /**
     * @brief Builds the plan. Returns once every started unit has terminated;
     *        the summary lists every declared image.
     */
    RunSummary execute();

    /// Async-signal-safe.
    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_relaxed);
    }

    bool cancelled() const noexcept;

    /// The resolved plan as JSON, without environment values.
    nlohmann::json emit_plan() const;

private:
    UnitReport run_unit(const ResolvedBuildUnit &unit);

    BuildPlan plan_;
    ImageBuilder &builder_;
    ArtifactCollector &collector_;
    ExecutorConfig config_;
    ResultLedger ledger_;
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> failed_{false};
    std::vector<std::jthread> pool_;
};

} // namespace genesis
