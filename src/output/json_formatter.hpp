#pragma once

#include "core/anomaly.hpp"
#include "detection/orchestrator.hpp"
#include "review/anomaly_review.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace apwatch::output {

/// Formats findings and run results as JSON
class JsonFormatter {
public:
    /// Format one anomaly, kind-specific metadata under "metadata"
    [[nodiscard]] static nlohmann::json format_anomaly(const Anomaly& anomaly);

    /// Format export rows as an array
    [[nodiscard]] static nlohmann::json format_rows(const std::vector<AnomalyRow>& rows);

    /// Format a run summary
    [[nodiscard]] static nlohmann::json format_run_summary(const RunSummary& summary);

    /// Format dashboard totals
    [[nodiscard]] static nlohmann::json format_dashboard(const DashboardStats& stats);

    /// ISO8601 UTC timestamp string with milliseconds
    [[nodiscard]] static std::string iso_timestamp(WallTime time);
};

}  // namespace apwatch::output
