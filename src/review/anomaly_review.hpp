#pragma once

#include "core/anomaly.hpp"
#include "storage/storage.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apwatch {

/// Tenant-level totals for a summary view
struct DashboardStats {
    TenantId tenant_id{0};
    std::size_t vendor_count{0};
    std::size_t bill_count{0};
    std::size_t anomaly_count{0};
    Money total_anomaly_amount;   // Sum over distinct flagged bills
    std::size_t alert_worthy_count{0};
};

/// Anomaly joined with display fields of its bill and vendor
struct AnomalyRow {
    Anomaly anomaly;
    std::string vendor_name;
    std::string bill_number;
};

/// Read/write contract used by the API and notification collaborators
class AnomalyReview {
public:
    static constexpr std::size_t kDefaultListLimit = 100;
    static constexpr std::size_t kMaxListLimit = 500;
    static constexpr std::size_t kDefaultAlertLimit = 50;

    explicit AnomalyReview(Storage& storage);

    /// List anomalies newest first
    /// @param status "open", "acknowledged", "dismissed" or "all"
    /// @param limit 1..500
    [[nodiscard]] Result<std::vector<Anomaly>> list(TenantId tenant,
                                                    std::string_view status = "open",
                                                    std::size_t limit = kDefaultListLimit,
                                                    std::size_t offset = 0) const;

    /// Alert-worthy open anomalies, newest first
    [[nodiscard]] std::vector<Anomaly> pending_alerts(TenantId tenant,
                                                      std::size_t limit = kDefaultAlertLimit) const;

    /// Transition an open anomaly to acknowledged
    [[nodiscard]] Result<Anomaly> acknowledge(TenantId tenant, AnomalyId id,
                                              std::optional<std::string> notes = std::nullopt);

    /// Transition an open anomaly to dismissed
    [[nodiscard]] Result<Anomaly> dismiss(TenantId tenant, AnomalyId id,
                                          std::optional<std::string> notes = std::nullopt);

    [[nodiscard]] DashboardStats dashboard(TenantId tenant) const;

    /// All anomalies newest first with vendor name and bill number
    [[nodiscard]] std::vector<AnomalyRow> export_rows(TenantId tenant) const;

private:
    [[nodiscard]] Result<Anomaly> transition(TenantId tenant, AnomalyId id, AnomalyStatus to,
                                             std::optional<std::string> notes);

    Storage& storage_;
};

}  // namespace apwatch
