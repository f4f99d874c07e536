#pragma once

#include "core/anomaly.hpp"
#include "core/records.hpp"
#include "core/status.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace apwatch {

/// Thrown by storage implementations when a read or write fails
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Outcome of a baseline upsert
enum class UpsertOutcome {
    Inserted,
    Updated
};

/// Filter for anomaly listings; results are newest first
struct AnomalyQuery {
    TenantId tenant_id{0};
    std::optional<AnomalyStatus> status;   // nullopt = all statuses
    std::optional<bool> alert_worthy;
    std::size_t offset{0};
    std::optional<std::size_t> limit;
};

/// Write scope of one detection run
/// Writes are staged privately and become visible together on commit; readers never see
/// them before that. Rollback drops the staged writes. Destroying an uncommitted
/// transaction rolls it back.
class Transaction {
public:
    virtual ~Transaction() = default;

    /// Insert or overwrite the baseline keyed by (vendor, window_start, window_end)
    /// @return Stored baseline (id assigned) and whether it was inserted or updated
    virtual std::pair<VendorBaseline, UpsertOutcome> upsert_baseline(const VendorBaseline& baseline) = 0;

    /// Insert-or-skip keyed by (tenant, bill, kind)
    /// @return Assigned id, or nullopt when the key is already committed or staged here
    virtual std::optional<AnomalyId> insert_anomaly(Anomaly anomaly) = 0;

    /// Apply the staged writes atomically
    /// Staged anomalies whose key was committed meanwhile by another run are skipped.
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

/// Persistence port consumed by the detection core
/// All methods throw StorageError on failure.
class Storage {
public:
    virtual ~Storage() = default;

    [[nodiscard]] virtual std::vector<Tenant> tenants() const = 0;
    [[nodiscard]] virtual std::vector<Vendor> vendors(TenantId tenant) const = 0;
    [[nodiscard]] virtual std::vector<Bill> bills(TenantId tenant) const = 0;

    [[nodiscard]] virtual std::optional<VendorBaseline> find_baseline(
        VendorId vendor, Date window_start, Date window_end) const = 0;
    [[nodiscard]] virtual std::vector<VendorBaseline> baselines(TenantId tenant) const = 0;

    [[nodiscard]] virtual std::optional<Anomaly> find_anomaly(
        TenantId tenant, BillId bill, AnomalyKind kind) const = 0;
    [[nodiscard]] virtual std::optional<Anomaly> find_anomaly_by_id(
        TenantId tenant, AnomalyId id) const = 0;
    [[nodiscard]] virtual std::vector<Anomaly> anomalies(const AnomalyQuery& query) const = 0;

    /// Open the write scope for one run against `tenant`
    [[nodiscard]] virtual std::unique_ptr<Transaction> begin(TenantId tenant) = 0;

    /// Compare-and-set the review status of an anomaly
    /// The status changes only if it still equals `expected`; notes are replaced when given.
    /// @return Updated anomaly, NotFound if it does not exist for the tenant,
    ///         Conflict if its current status differs from `expected`
    virtual Result<Anomaly> update_anomaly_status(
        TenantId tenant, AnomalyId id, AnomalyStatus expected, AnomalyStatus status,
        const std::optional<std::string>& resolution_notes) = 0;
};

}  // namespace apwatch
