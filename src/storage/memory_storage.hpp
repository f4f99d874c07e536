#pragma once

#include "storage/storage.hpp"
#include <cstddef>
#include <map>
#include <mutex>
#include <tuple>

namespace apwatch {

/// Counts reported by MemoryStorage::import
struct ImportStats {
    std::size_t vendors{0};
    std::size_t bills{0};
};

/// Thread-safe in-process storage
/// Enforces the uniqueness constraints of the persisted layout:
/// (tenant, external_id) for vendors and bills, (vendor, window) for baselines,
/// (tenant, bill, kind) for anomalies.
class MemoryStorage final : public Storage {
public:
    MemoryStorage() = default;

    MemoryStorage(const MemoryStorage&) = delete;
    MemoryStorage& operator=(const MemoryStorage&) = delete;

    /// Ingestion seam: add one tenant's canonical records
    /// All-or-nothing; ids of 0 are assigned by storage
    [[nodiscard]] Result<ImportStats> import(const TenantRecords& records);

    [[nodiscard]] std::vector<Tenant> tenants() const override;
    [[nodiscard]] std::vector<Vendor> vendors(TenantId tenant) const override;
    [[nodiscard]] std::vector<Bill> bills(TenantId tenant) const override;

    [[nodiscard]] std::optional<VendorBaseline> find_baseline(
        VendorId vendor, Date window_start, Date window_end) const override;
    [[nodiscard]] std::vector<VendorBaseline> baselines(TenantId tenant) const override;

    [[nodiscard]] std::optional<Anomaly> find_anomaly(
        TenantId tenant, BillId bill, AnomalyKind kind) const override;
    [[nodiscard]] std::optional<Anomaly> find_anomaly_by_id(
        TenantId tenant, AnomalyId id) const override;
    [[nodiscard]] std::vector<Anomaly> anomalies(const AnomalyQuery& query) const override;

    [[nodiscard]] std::unique_ptr<Transaction> begin(TenantId tenant) override;

    Result<Anomaly> update_anomaly_status(
        TenantId tenant, AnomalyId id, AnomalyStatus expected, AnomalyStatus status,
        const std::optional<std::string>& resolution_notes) override;

private:
    friend class MemoryTransaction;

    using BaselineKey = std::tuple<VendorId, Date, Date>;
    using AnomalyKey = std::tuple<TenantId, BillId, AnomalyKind>;

    /// Validate a baseline and resolve its id against committed rows
    std::pair<VendorBaseline, UpsertOutcome> prepare_baseline(
        TenantId tenant, const VendorBaseline& baseline);
    /// Validate an anomaly and reserve its id
    /// @return nullopt when its key is already committed
    std::optional<Anomaly> prepare_anomaly(TenantId tenant, Anomaly anomaly);
    /// Apply staged writes under one lock
    /// @return Number of staged anomalies skipped because their key was committed meanwhile
    std::size_t apply(const std::vector<VendorBaseline>& baselines, std::vector<Anomaly>& anomalies);

    mutable std::mutex mutex_;

    std::map<TenantId, Tenant> tenants_;
    std::map<VendorId, Vendor> vendors_;
    std::map<BillId, Bill> bills_;
    std::map<BaselineId, VendorBaseline> baselines_;
    std::map<BaselineKey, BaselineId> baseline_index_;
    std::map<AnomalyId, Anomaly> anomalies_;
    std::map<AnomalyKey, AnomalyId> anomaly_index_;

    VendorId next_vendor_id_{1};
    BillId next_bill_id_{1};
    BaselineId next_baseline_id_{1};
    AnomalyId next_anomaly_id_{1};
};

}  // namespace apwatch
