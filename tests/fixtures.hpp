#pragma once

#include "core/records.hpp"
#include "detection/detector.hpp"
#include "storage/memory_storage.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace apwatch::test {

inline constexpr TenantId kTenant = 1;

/// Day `offset` relative to 2024-01-01
inline Date day(int offset) {
    return dates::make(2024, 1, 1) + std::chrono::days{offset};
}

inline Vendor make_vendor(VendorId id, std::string name, TenantId tenant = kTenant) {
    return Vendor{
        .id = id,
        .tenant_id = tenant,
        .external_id = "V" + std::to_string(id),
        .name = std::move(name)
    };
}

inline Bill make_bill(BillId id, VendorId vendor, std::string_view amount, Date date,
                      bool has_line_items = true, TenantId tenant = kTenant) {
    return Bill{
        .id = id,
        .tenant_id = tenant,
        .vendor_id = vendor,
        .external_id = "B" + std::to_string(id),
        .bill_number = "INV-" + std::to_string(id),
        .total_amount = Money::parse(amount),
        .txn_date = date,
        .has_line_items = has_line_items
    };
}

inline TenantRecords make_tenant(TenantId id, std::vector<Vendor> vendors, std::vector<Bill> bills) {
    return TenantRecords{
        .tenant = Tenant{.id = id, .name = "Tenant " + std::to_string(id)},
        .vendors = std::move(vendors),
        .bills = std::move(bills)
    };
}

/// Import or throw; keeps fixture setup to one line
inline void import_records(MemoryStorage& storage, const TenantRecords& records) {
    auto result = storage.import(records);
    if (result.is_err()) {
        throw std::runtime_error("fixture import failed: " + result.error().to_string());
    }
}

/// Run one detector over the tenant's stored bills and commit
inline std::size_t run_detector(const Detector& detector, MemoryStorage& storage,
                                TenantId tenant, Date today,
                                const std::vector<VendorBaseline>& baselines = {}) {
    const auto bills = storage.bills(tenant);
    auto tx = storage.begin(tenant);
    DetectionContext ctx{
        .tenant_id = tenant,
        .today = today,
        .bills = bills,
        .baselines = baselines,
        .tx = *tx
    };
    std::size_t created = detector.detect(ctx);
    tx->commit();
    return created;
}

inline std::vector<Anomaly> all_anomalies(const MemoryStorage& storage, TenantId tenant = kTenant) {
    return storage.anomalies(AnomalyQuery{.tenant_id = tenant});
}

}  // namespace apwatch::test
