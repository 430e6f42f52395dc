#include "genesis/executor.hpp"

#include "genesis/logging.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>
#include <print>
#include <queue>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace genesis {

namespace {

UnitReport make_report(const ResolvedBuildUnit &unit, UnitStatus status, std::string message = {}) {
    return UnitReport{
        .element = unit.element_key,
        .image = unit.image.name,
        .status = status,
        .message = std::move(message),
        .artifact = unit.artifact,
        .duration = std::chrono::milliseconds(0),
    };
}

} // namespace

Executor::Executor(BuildPlan plan, ImageBuilder &builder, ArtifactCollector &collector, ExecutorConfig config)
    : plan_(std::move(plan)), builder_(builder), collector_(collector), config_(config) {
}

bool Executor::cancelled() const noexcept {
    if (cancelled_.load(std::memory_order_relaxed))
        return true;
    return config_.interrupt && config_.interrupt->load(std::memory_order_relaxed);
}

nlohmann::json Executor::emit_plan() const {
    using json = nlohmann::json;
    json units = json::array();
    for (const auto &unit : plan_.units()) {
        json envs = json::array();
        for (const auto &name : unit.image.envs)
            envs.push_back(name);

        json entry{
            {"element", unit.element_key},
            {"image", unit.image.name},
            {"profile", std::string(traits(unit.parameters.profile).name)},
            {"format", std::string(traits(unit.parameters.format).name)},
            {"variables", unit.parameters.variables},
            {"envs", envs},
            {"deps_root", unit.deps_root.string()},
            {"work_dir", unit.work_dir.string()},
            {"artifact", unit.artifact.string()},
            {"version", unit.version},
        };
        if (unit.script)
            entry["script"] = unit.script->string();
        // never print key material
        if (entry["variables"].contains("developer_keys"))
            entry["variables"]["developer_keys"] = "<redacted>";
        units.push_back(std::move(entry));
    }
    return json{{"units", units}};
}

UnitReport Executor::run_unit(const ResolvedBuildUnit &unit) {
    const auto start = std::chrono::steady_clock::now();
    auto finish = [&](UnitStatus status, std::string message = {}) {
        UnitReport report = make_report(unit, status, std::move(message));
        report.duration =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        return report;
    };

    std::error_code ec;
    if (!config_.force && fs::exists(unit.artifact, ec)) {
        return finish(UnitStatus::Skipped, "already present");
    }

    // Fresh, exclusively owned scratch space for the builder.
    fs::remove_all(unit.work_dir, ec);
    fs::create_directories(unit.build_output().parent_path(), ec);
    if (ec) {
        return finish(UnitStatus::Failed, std::format("cannot prepare {}: {}", unit.work_dir.string(), ec.message()));
    }

    GENESIS_LOG_INFO("building image", {str_field("element", unit.element_key), str_field("image", unit.image.name),
                                        str_field("profile", traits(unit.image.profile).name),
                                        str_field("format", traits(unit.image.format).name)});

    auto res = builder_.build(unit, [this] { return cancelled(); });
    if (res) {
        return finish(UnitStatus::Built);
    }
    if (res.error().kind == ErrorKind::Cancelled) {
        return finish(UnitStatus::Cancelled, res.error().describe());
    }
    GENESIS_LOG_ERROR("image build failed", {str_field("image", unit.image.name), str_field("error", res.error().message)});
    return finish(UnitStatus::Failed, res.error().describe());
}

RunSummary Executor::execute() {
    pool_.clear(); // Ensure clean state

    const auto &units = plan_.units();
    const size_t total_units = units.size();

    std::queue<size_t> ready_queue;
    for (size_t i = 0; i < total_units; ++i)
        ready_queue.push(i);

    std::vector<size_t> remaining(plan_.elements().size(), 0);
    for (size_t e = 0; e < remaining.size(); ++e)
        remaining[e] = plan_.element_units(e).size();

    std::mutex mtx;
    std::mutex cout_mtx;
    size_t completed_count = 0;
    std::vector<Error> errors;

    auto worker = [&]() {
        while (true) {
            size_t unit_id;
            {
                std::lock_guard lock(mtx);
                if (ready_queue.empty())
                    return;
                unit_id = ready_queue.front();
                ready_queue.pop();
            }

            const ResolvedBuildUnit &unit = units[unit_id];
            UnitReport report;
            if (cancelled()) {
                report = make_report(unit, UnitStatus::Cancelled, "run cancelled before this image started");
            } else if (failed_.load()) {
                report = make_report(unit, UnitStatus::Cancelled, "not started after an earlier failure");
            } else {
                report = run_unit(unit);
            }

            if (report.status == UnitStatus::Failed)
                failed_.store(true);

            // A forced unit that did not rebuild must not leave the previous image behind.
            if (config_.force && (report.status == UnitStatus::Failed || report.status == UnitStatus::Cancelled)) {
                std::error_code ec;
                if (fs::remove(unit.artifact, ec))
                    GENESIS_LOG_WARN("removed stale image", {str_field("path", unit.artifact.string())});
                if (ec) {
                    GENESIS_LOG_ERROR("cannot remove stale image",
                                      {str_field("path", unit.artifact.string()), str_field("error", ec.message())});
                    std::lock_guard lock(mtx);
                    errors.push_back(Error{ErrorKind::Io, std::format("cannot remove stale image {}: {}",
                                                                      unit.artifact.string(), ec.message())});
                }
            }

            const UnitStatus status = report.status;
            ledger_.record(std::move(report));

            bool element_done = false;
            size_t done = 0;
            {
                std::lock_guard lock(mtx);
                done = ++completed_count;
                element_done = --remaining[unit.element_index] == 0;
            }
            {
                std::lock_guard lock(cout_mtx);
                std::println("[{}/{}] {:<9} {}", done, total_units, to_string(status), unit.id());
            }

            if (element_done) {
                if (auto res = collector_.collect_element(plan_, unit.element_index, ledger_); !res) {
                    GENESIS_LOG_ERROR("output assembly failed",
                                      {str_field("element", unit.element_key), str_field("error", res.error().message)});
                    std::lock_guard lock(mtx);
                    errors.push_back(res.error());
                }
            }
        }
    };

    size_t thread_count = config_.jobs;
    if (thread_count == 0)
        thread_count = std::thread::hardware_concurrency();
    if (thread_count == 0)
        thread_count = 1;
    thread_count = std::min(thread_count, std::max<size_t>(total_units, 1));

    for (size_t i = 0; i < thread_count; ++i) {
        pool_.emplace_back(worker);
    }

    pool_.clear(); // Join all threads

    RunSummary summary;
    summary.version = units.empty() ? std::string() : units.front().version;
    summary.errors = std::move(errors);
    summary.reports.reserve(total_units);
    for (const auto &unit : units) {
        if (auto report = ledger_.find(unit.element_key, unit.image.name)) {
            summary.reports.push_back(std::move(*report));
        }
    }
    return summary;
}

} // namespace genesis
