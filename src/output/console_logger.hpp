#pragma once

#include "core/anomaly.hpp"
#include "core/status.hpp"
#include "detection/orchestrator.hpp"
#include "review/anomaly_review.hpp"
#include <vector>

namespace apwatch::output {

/// Console output for detection runs and their findings
class ConsoleLogger {
public:
    /// Log a completed run with per-detector counts
    static void log_run_summary(const RunSummary& summary);

    /// Log one finding (alert-worthy findings at warn level)
    static void log_anomaly(const Anomaly& anomaly);

    /// Log a failed run
    static void log_failure(TenantId tenant, const Error& error);

    /// Log the dashboard totals for a tenant
    static void log_dashboard(const DashboardStats& stats);
};

}  // namespace apwatch::output
