#include "genesis/ledger.hpp"

#include <algorithm>

namespace genesis {

std::string_view to_string(UnitStatus status) {
    switch (status) {
    case UnitStatus::Built:
        return "Built";
    case UnitStatus::Skipped:
        return "Skipped";
    case UnitStatus::Failed:
        return "Failed";
    case UnitStatus::Cancelled:
        return "Cancelled";
    }
    return "Cancelled";
}

bool ResultLedger::record(UnitReport report) {
    std::lock_guard lock(mtx_);
    auto key = std::make_pair(report.element, report.image);
    return entries_.try_emplace(std::move(key), std::move(report)).second;
}

std::optional<UnitReport> ResultLedger::find(const std::string &element, const std::string &image) const {
    std::lock_guard lock(mtx_);
    if (auto it = entries_.find({element, image}); it != entries_.end())
        return it->second;
    return std::nullopt;
}

size_t ResultLedger::size() const {
    std::lock_guard lock(mtx_);
    return entries_.size();
}

size_t RunSummary::count(UnitStatus status) const {
    return static_cast<size_t>(
        std::count_if(reports.begin(), reports.end(), [status](const UnitReport &r) { return r.status == status; }));
}

bool RunSummary::success() const {
    return errors.empty() && count(UnitStatus::Failed) == 0 && count(UnitStatus::Cancelled) == 0;
}

nlohmann::json to_json(const RunSummary &summary) {
    using json = nlohmann::json;

    json images = json::array();
    for (const auto &report : summary.reports) {
        json entry{
            {"element", report.element},
            {"image", report.image},
            {"status", std::string(to_string(report.status))},
        };
        if (report.status == UnitStatus::Built || report.status == UnitStatus::Skipped)
            entry["artifact"] = report.artifact.string();
        if (!report.message.empty())
            entry["message"] = report.message;
        images.push_back(std::move(entry));
    }

    json errors = json::array();
    for (const auto &error : summary.errors) {
        errors.push_back({{"kind", std::string(to_string(error.kind))}, {"message", error.message}});
    }

    return json{
        {"version", summary.version},
        {"success", summary.success()},
        {"images", images},
        {"errors", errors},
    };
}

} // namespace genesis
