#include "output/console_logger.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace apwatch::output {

void ConsoleLogger::log_run_summary(const RunSummary& summary) {
    std::ostringstream counts;
    for (std::size_t i = 0; i < summary.detectors.size(); ++i) {
        if (i > 0) {
            counts << " | ";
        }
        counts << summary.detectors[i].name << ": " << summary.detectors[i].created;
    }

    // Format: TENANT: X | WINDOW: a..b | BASELINES: +i ~u | <detector>: n ... | TOTAL: n
    spdlog::info(
        "TENANT: {} | WINDOW: {}..{} | BASELINES: +{} ~{} | {} | TOTAL: {} ({} us)",
        summary.tenant_id,
        dates::to_iso(summary.window_start),
        dates::to_iso(summary.window_end),
        summary.baselines_inserted,
        summary.baselines_updated,
        counts.str(),
        summary.new_anomalies(),
        summary.elapsed.count()
    );
}

void ConsoleLogger::log_anomaly(const Anomaly& anomaly) {
    if (anomaly.alert_worthy) {
        spdlog::warn(
            "ALERT: {} {} {} ({:.0f}%): {}",
            to_string(anomaly.severity),
            to_string(anomaly.kind()),
            anomaly.amount.to_string(),
            anomaly.confidence * 100.0,
            anomaly.description
        );
    } else {
        spdlog::info(
            "{} {} {} ({:.0f}%): {}",
            to_string(anomaly.severity),
            to_string(anomaly.kind()),
            anomaly.amount.to_string(),
            anomaly.confidence * 100.0,
            anomaly.description
        );
    }
}

void ConsoleLogger::log_failure(TenantId tenant, const Error& error) {
    spdlog::error("Detection failed for tenant {}: {}", tenant, error.to_string());
}

void ConsoleLogger::log_dashboard(const DashboardStats& stats) {
    spdlog::info(
        "TENANT: {} | VENDORS: {} | BILLS: {} | ANOMALIES: {} | FLAGGED AMOUNT: {} | ALERTS: {}",
        stats.tenant_id,
        stats.vendor_count,
        stats.bill_count,
        stats.anomaly_count,
        stats.total_anomaly_amount.to_string(),
        stats.alert_worthy_count
    );
}

}  // namespace apwatch::output
