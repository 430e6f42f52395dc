#pragma once

#include "genesis/utility.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace genesis {

enum class UnitStatus { Built, Skipped, Failed, Cancelled };

std::string_view to_string(UnitStatus status);

struct UnitReport {
    std::string element;
    std::string image;
    UnitStatus status = UnitStatus::Cancelled;
    std::string message;
    std::filesystem::path artifact;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Per-run record of finished units, keyed by element and image.
 *
 * Safe to write from every worker. Recording a key twice keeps the first
 * entry.
 */
class ResultLedger {
public:
    /// @return false when the unit was already recorded.
    bool record(UnitReport report);

    std::optional<UnitReport> find(const std::string &element, const std::string &image) const;
    size_t size() const;

private:
    mutable std::mutex mtx_;
    std::map<std::pair<std::string, std::string>, UnitReport> entries_;
};

struct RunSummary {
    std::string version;
    std::vector<UnitReport> reports; ///< Declaration order.
    std::vector<Error> errors;       ///< Output assembly problems.

    size_t count(UnitStatus status) const;

    /// No Failed or Cancelled image and no assembly error.
    bool success() const;
};

nlohmann::json to_json(const RunSummary &summary);

} // namespace genesis
