#include "review/anomaly_review.hpp"
#include <set>
#include <spdlog/spdlog.h>
#include <unordered_map>

namespace apwatch {

AnomalyReview::AnomalyReview(Storage& storage)
    : storage_(storage)
{}

Result<std::vector<Anomaly>> AnomalyReview::list(TenantId tenant, std::string_view status,
                                                 std::size_t limit, std::size_t offset) const {
    using ListResult = Result<std::vector<Anomaly>>;

    if (limit < 1 || limit > kMaxListLimit) {
        return fail<std::vector<Anomaly>>(ErrorCode::InvalidArgument,
                                          "limit must be between 1 and " + std::to_string(kMaxListLimit));
    }

    AnomalyQuery query{.tenant_id = tenant, .status = std::nullopt, .alert_worthy = std::nullopt,
                       .offset = offset, .limit = limit};
    if (status != "all") {
        auto parsed = parse_anomaly_status(status);
        if (parsed.is_err()) {
            return fail<std::vector<Anomaly>>(
                ErrorCode::InvalidArgument,
                "status must be one of: open, acknowledged, dismissed, all");
        }
        query.status = parsed.value();
    }

    return ListResult::Ok(storage_.anomalies(query));
}

std::vector<Anomaly> AnomalyReview::pending_alerts(TenantId tenant, std::size_t limit) const {
    return storage_.anomalies(AnomalyQuery{
        .tenant_id = tenant,
        .status = AnomalyStatus::Open,
        .alert_worthy = true,
        .offset = 0,
        .limit = limit
    });
}

Result<Anomaly> AnomalyReview::acknowledge(TenantId tenant, AnomalyId id,
                                           std::optional<std::string> notes) {
    return transition(tenant, id, AnomalyStatus::Acknowledged, std::move(notes));
}

Result<Anomaly> AnomalyReview::dismiss(TenantId tenant, AnomalyId id,
                                       std::optional<std::string> notes) {
    return transition(tenant, id, AnomalyStatus::Dismissed, std::move(notes));
}

Result<Anomaly> AnomalyReview::transition(TenantId tenant, AnomalyId id, AnomalyStatus to,
                                          std::optional<std::string> notes) {
    // Only open findings move; the check and the write happen under one storage lock
    auto updated = storage_.update_anomaly_status(tenant, id, AnomalyStatus::Open, to, notes);
    if (updated.is_ok()) {
        spdlog::info("Anomaly {} of tenant {} marked {}", id, tenant, to_string(to));
    }
    return updated;
}

DashboardStats AnomalyReview::dashboard(TenantId tenant) const {
    DashboardStats stats;
    stats.tenant_id = tenant;
    stats.vendor_count = storage_.vendors(tenant).size();

    const auto bills = storage_.bills(tenant);
    stats.bill_count = bills.size();

    const auto all = storage_.anomalies(AnomalyQuery{.tenant_id = tenant});
    stats.anomaly_count = all.size();

    std::set<BillId> flagged;
    for (const auto& a : all) {
        if (a.alert_worthy) {
            ++stats.alert_worthy_count;
        }
        if (a.bill_id) {
            flagged.insert(*a.bill_id);
        }
    }
    // Count each flagged bill once even when it carries several anomalies
    for (const auto& bill : bills) {
        if (flagged.count(bill.id) != 0) {
            stats.total_anomaly_amount += bill.total_amount;
        }
    }
    return stats;
}

std::vector<AnomalyRow> AnomalyReview::export_rows(TenantId tenant) const {
    std::unordered_map<VendorId, std::string> vendor_names;
    for (const auto& vendor : storage_.vendors(tenant)) {
        vendor_names.emplace(vendor.id, vendor.name);
    }
    std::unordered_map<BillId, const Bill*> bills_by_id;
    const auto bills = storage_.bills(tenant);
    for (const auto& bill : bills) {
        bills_by_id.emplace(bill.id, &bill);
    }

    std::vector<AnomalyRow> rows;
    for (auto& anomaly : storage_.anomalies(AnomalyQuery{.tenant_id = tenant})) {
        AnomalyRow row{.anomaly = std::move(anomaly), .vendor_name = {}, .bill_number = {}};
        if (row.anomaly.bill_id) {
            auto it = bills_by_id.find(*row.anomaly.bill_id);
            if (it != bills_by_id.end()) {
                row.bill_number = it->second->bill_number;
                auto vendor = vendor_names.find(it->second->vendor_id);
                if (vendor != vendor_names.end()) {
                    row.vendor_name = vendor->second;
                }
            }
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

}  // namespace apwatch
