#include "output/json_formatter.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace apwatch::output {

namespace {

nlohmann::json format_detail(const AnomalyDetail& detail) {
    return std::visit([](const auto& d) -> nlohmann::json {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, DuplicateDetail>) {
            return {
                {"relatedBillId", d.related_bill},
                {"daysApart", d.days_apart}
            };
        } else if constexpr (std::is_same_v<T, PriceOutlierDetail>) {
            return {
                {"zScore", d.z_score},
                {"baselineMean", d.baseline_mean},
                {"baselineStdDev", d.baseline_std_dev}
            };
        } else {
            return {
                {"roundValue", d.round_value.to_string()}
            };
        }
    }, detail);
}

}  // namespace

nlohmann::json JsonFormatter::format_anomaly(const Anomaly& anomaly) {
    nlohmann::json j{
        {"id", anomaly.id},
        {"tenantId", anomaly.tenant_id},
        {"billId", nullptr},
        {"type", std::string(to_string(anomaly.kind()))},
        {"severity", std::string(to_string(anomaly.severity))},
        {"amount", anomaly.amount.to_string()},
        {"confidence", anomaly.confidence},
        {"description", anomaly.description},
        {"metadata", format_detail(anomaly.detail)},
        {"shouldAlert", anomaly.alert_worthy},
        {"status", std::string(to_string(anomaly.status))},
        {"createdAt", iso_timestamp(anomaly.created_at)}
    };
    if (anomaly.bill_id) {
        j["billId"] = *anomaly.bill_id;
    }
    if (anomaly.resolution_notes) {
        j["resolutionNotes"] = *anomaly.resolution_notes;
    }
    return j;
}

nlohmann::json JsonFormatter::format_rows(const std::vector<AnomalyRow>& rows) {
    auto arr = nlohmann::json::array();
    for (const auto& row : rows) {
        auto j = format_anomaly(row.anomaly);
        j["vendorName"] = row.vendor_name;
        j["billNumber"] = row.bill_number;
        arr.push_back(std::move(j));
    }
    return arr;
}

nlohmann::json JsonFormatter::format_run_summary(const RunSummary& summary) {
    auto detectors = nlohmann::json::array();
    for (const auto& d : summary.detectors) {
        detectors.push_back({
            {"name", d.name},
            {"type", std::string(to_string(d.kind))},
            {"created", d.created}
        });
    }

    return nlohmann::json{
        {"tenantId", summary.tenant_id},
        {"windowStart", dates::to_iso(summary.window_start)},
        {"windowEnd", dates::to_iso(summary.window_end)},
        {"baselinesInserted", summary.baselines_inserted},
        {"baselinesUpdated", summary.baselines_updated},
        {"detectors", detectors},
        {"anomaliesFound", summary.new_anomalies()},
        {"phase", std::string(to_string(summary.phase))},
        {"elapsedUs", summary.elapsed.count()}
    };
}

nlohmann::json JsonFormatter::format_dashboard(const DashboardStats& stats) {
    return nlohmann::json{
        {"tenantId", stats.tenant_id},
        {"vendorCount", stats.vendor_count},
        {"billCount", stats.bill_count},
        {"anomalyCount", stats.anomaly_count},
        {"totalAnomalyAmount", stats.total_anomaly_amount.to_string()},
        {"highConfidenceCount", stats.alert_worthy_count}
    };
}

std::string JsonFormatter::iso_timestamp(WallTime time) {
    auto time_t_value = std::chrono::system_clock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()
    ) % 1000;

    std::tm tm_utc{};
    gmtime_r(&time_t_value, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace apwatch::output
