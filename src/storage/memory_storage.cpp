#include "storage/memory_storage.hpp"
#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>
#include <utility>

namespace apwatch {

/// Staging transaction over MemoryStorage
/// Nothing reaches the shared tables before commit.
class MemoryTransaction final : public Transaction {
public:
    MemoryTransaction(MemoryStorage& storage, TenantId tenant)
        : storage_(storage)
        , tenant_(tenant)
    {}

    ~MemoryTransaction() override {
        if (state_ != State::Active) {
            return;
        }
        try {
            rollback();
        } catch (const std::exception& e) {
            spdlog::error("Rollback of tenant {} transaction failed: {}", tenant_, e.what());
        }
    }

    MemoryTransaction(const MemoryTransaction&) = delete;
    MemoryTransaction& operator=(const MemoryTransaction&) = delete;

    std::pair<VendorBaseline, UpsertOutcome> upsert_baseline(const VendorBaseline& baseline) override {
        ensure_active();
        MemoryStorage::BaselineKey key{baseline.vendor_id, baseline.window_start, baseline.window_end};

        auto staged = staged_baselines_.find(key);
        if (staged != staged_baselines_.end()) {
            BaselineId id = staged->second.id;
            staged->second = baseline;
            staged->second.id = id;
            return {staged->second, UpsertOutcome::Updated};
        }

        auto result = storage_.prepare_baseline(tenant_, baseline);
        staged_baselines_.emplace(key, result.first);
        return result;
    }

    std::optional<AnomalyId> insert_anomaly(Anomaly anomaly) override {
        ensure_active();
        if (anomaly.bill_id &&
            staged_keys_.count(MemoryStorage::AnomalyKey{anomaly.tenant_id, *anomaly.bill_id,
                                                         anomaly.kind()}) != 0) {
            return std::nullopt;
        }

        auto prepared = storage_.prepare_anomaly(tenant_, std::move(anomaly));
        if (!prepared) {
            return std::nullopt;
        }
        if (prepared->bill_id) {
            staged_keys_.emplace(prepared->tenant_id, *prepared->bill_id, prepared->kind());
        }
        AnomalyId id = prepared->id;
        staged_anomalies_.push_back(std::move(*prepared));
        return id;
    }

    void commit() override {
        ensure_active();

        std::vector<VendorBaseline> baselines;
        baselines.reserve(staged_baselines_.size());
        for (const auto& [key, baseline] : staged_baselines_) {
            baselines.push_back(baseline);
        }
        const std::size_t staged = staged_anomalies_.size();
        const std::size_t skipped = storage_.apply(baselines, staged_anomalies_);
        state_ = State::Committed;

        if (skipped > 0) {
            spdlog::warn("Tenant {} commit skipped {} of {} anomalies committed meanwhile by another run",
                         tenant_, skipped, staged);
        }
        clear();
    }

    void rollback() override {
        ensure_active();
        state_ = State::RolledBack;
        spdlog::debug("Rolled back tenant {} transaction ({} anomalies, {} baselines)",
                      tenant_, staged_anomalies_.size(), staged_baselines_.size());
        clear();
    }

private:
    enum class State {
        Active,
        Committed,
        RolledBack
    };

    void ensure_active() const {
        if (state_ != State::Active) {
            throw StorageError("Transaction for tenant " + std::to_string(tenant_) +
                               " is already finished");
        }
    }

    void clear() {
        staged_baselines_.clear();
        staged_anomalies_.clear();
        staged_keys_.clear();
    }

    MemoryStorage& storage_;
    TenantId tenant_;
    State state_{State::Active};
    std::map<MemoryStorage::BaselineKey, VendorBaseline> staged_baselines_;
    std::vector<Anomaly> staged_anomalies_;
    std::set<MemoryStorage::AnomalyKey> staged_keys_;
};

Result<ImportStats> MemoryStorage::import(const TenantRecords& records) {
    std::lock_guard lock(mutex_);

    const TenantId tenant = records.tenant.id;
    if (tenant == 0) {
        return fail<ImportStats>(ErrorCode::InvalidArgument, "Tenant id must be non-zero");
    }

    // Existing keys for this tenant
    std::set<std::string> vendor_external_ids;
    std::set<std::string> bill_external_ids;
    for (const auto& [id, vendor] : vendors_) {
        if (vendor.tenant_id == tenant) {
            vendor_external_ids.insert(vendor.external_id);
        }
    }
    for (const auto& [id, bill] : bills_) {
        if (bill.tenant_id == tenant) {
            bill_external_ids.insert(bill.external_id);
        }
    }

    // Validate everything before touching the tables
    std::vector<Vendor> new_vendors;
    std::set<VendorId> seen_vendor_ids;
    VendorId next_vendor = next_vendor_id_;
    for (Vendor vendor : records.vendors) {
        vendor.tenant_id = tenant;
        if (vendor.id == 0) {
            while (vendors_.count(next_vendor) != 0 || seen_vendor_ids.count(next_vendor) != 0) {
                ++next_vendor;
            }
            vendor.id = next_vendor++;
        }
        if (vendors_.count(vendor.id) != 0 || !seen_vendor_ids.insert(vendor.id).second) {
            return fail<ImportStats>(ErrorCode::Conflict,
                                     "Vendor id " + std::to_string(vendor.id) + " already exists");
        }
        if (!vendor_external_ids.insert(vendor.external_id).second) {
            return fail<ImportStats>(ErrorCode::Conflict,
                                     "Duplicate vendor external id for tenant " +
                                         std::to_string(tenant) + ": " + vendor.external_id);
        }
        new_vendors.push_back(std::move(vendor));
    }

    std::vector<Bill> new_bills;
    std::set<BillId> seen_bill_ids;
    BillId next_bill = next_bill_id_;
    for (Bill bill : records.bills) {
        bill.tenant_id = tenant;
        bool vendor_known = seen_vendor_ids.count(bill.vendor_id) != 0;
        if (!vendor_known) {
            auto it = vendors_.find(bill.vendor_id);
            vendor_known = it != vendors_.end() && it->second.tenant_id == tenant;
        }
        if (!vendor_known) {
            return fail<ImportStats>(ErrorCode::InvalidArgument,
                                     "Bill " + bill.external_id + " references unknown vendor " +
                                         std::to_string(bill.vendor_id));
        }
        if (bill.total_amount.is_negative()) {
            return fail<ImportStats>(ErrorCode::InvalidArgument,
                                     "Bill " + bill.external_id + " has a negative amount");
        }
        if (bill.id == 0) {
            while (bills_.count(next_bill) != 0 || seen_bill_ids.count(next_bill) != 0) {
                ++next_bill;
            }
            bill.id = next_bill++;
        }
        if (bills_.count(bill.id) != 0 || !seen_bill_ids.insert(bill.id).second) {
            return fail<ImportStats>(ErrorCode::Conflict,
                                     "Bill id " + std::to_string(bill.id) + " already exists");
        }
        if (!bill_external_ids.insert(bill.external_id).second) {
            return fail<ImportStats>(ErrorCode::Conflict,
                                     "Duplicate bill external id for tenant " +
                                         std::to_string(tenant) + ": " + bill.external_id);
        }
        new_bills.push_back(std::move(bill));
    }

    tenants_[tenant] = records.tenant;
    ImportStats stats{.vendors = new_vendors.size(), .bills = new_bills.size()};
    for (auto& vendor : new_vendors) {
        next_vendor_id_ = std::max(next_vendor_id_, vendor.id + 1);
        vendors_.emplace(vendor.id, std::move(vendor));
    }
    for (auto& bill : new_bills) {
        next_bill_id_ = std::max(next_bill_id_, bill.id + 1);
        bills_.emplace(bill.id, std::move(bill));
    }

    spdlog::debug("Imported tenant {}: {} vendors, {} bills", tenant, stats.vendors, stats.bills);
    return Result<ImportStats>::Ok(stats);
}

std::vector<Tenant> MemoryStorage::tenants() const {
    std::lock_guard lock(mutex_);
    std::vector<Tenant> result;
    result.reserve(tenants_.size());
    for (const auto& [id, tenant] : tenants_) {
        result.push_back(tenant);
    }
    return result;
}

std::vector<Vendor> MemoryStorage::vendors(TenantId tenant) const {
    std::lock_guard lock(mutex_);
    std::vector<Vendor> result;
    for (const auto& [id, vendor] : vendors_) {
        if (vendor.tenant_id == tenant) {
            result.push_back(vendor);
        }
    }
    return result;
}

std::vector<Bill> MemoryStorage::bills(TenantId tenant) const {
    std::lock_guard lock(mutex_);
    std::vector<Bill> result;
    for (const auto& [id, bill] : bills_) {
        if (bill.tenant_id == tenant) {
            result.push_back(bill);
        }
    }
    return result;
}

std::optional<VendorBaseline> MemoryStorage::find_baseline(
    VendorId vendor, Date window_start, Date window_end) const {
    std::lock_guard lock(mutex_);
    auto it = baseline_index_.find(BaselineKey{vendor, window_start, window_end});
    if (it == baseline_index_.end()) {
        return std::nullopt;
    }
    return baselines_.at(it->second);
}

std::vector<VendorBaseline> MemoryStorage::baselines(TenantId tenant) const {
    std::lock_guard lock(mutex_);
    std::vector<VendorBaseline> result;
    for (const auto& [id, baseline] : baselines_) {
        auto vendor = vendors_.find(baseline.vendor_id);
        if (vendor != vendors_.end() && vendor->second.tenant_id == tenant) {
            result.push_back(baseline);
        }
    }
    return result;
}

std::optional<Anomaly> MemoryStorage::find_anomaly(
    TenantId tenant, BillId bill, AnomalyKind kind) const {
    std::lock_guard lock(mutex_);
    auto it = anomaly_index_.find(AnomalyKey{tenant, bill, kind});
    if (it == anomaly_index_.end()) {
        return std::nullopt;
    }
    return anomalies_.at(it->second);
}

std::optional<Anomaly> MemoryStorage::find_anomaly_by_id(TenantId tenant, AnomalyId id) const {
    std::lock_guard lock(mutex_);
    auto it = anomalies_.find(id);
    if (it == anomalies_.end() || it->second.tenant_id != tenant) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Anomaly> MemoryStorage::anomalies(const AnomalyQuery& query) const {
    std::lock_guard lock(mutex_);
    std::vector<Anomaly> result;
    std::size_t skipped = 0;

    // Newest first: ids are assigned in creation order
    for (auto it = anomalies_.rbegin(); it != anomalies_.rend(); ++it) {
        const Anomaly& a = it->second;
        if (a.tenant_id != query.tenant_id) {
            continue;
        }
        if (query.status && a.status != *query.status) {
            continue;
        }
        if (query.alert_worthy && a.alert_worthy != *query.alert_worthy) {
            continue;
        }
        if (skipped < query.offset) {
            ++skipped;
            continue;
        }
        if (query.limit && result.size() >= *query.limit) {
            break;
        }
        result.push_back(a);
    }
    return result;
}

std::unique_ptr<Transaction> MemoryStorage::begin(TenantId tenant) {
    return std::make_unique<MemoryTransaction>(*this, tenant);
}

Result<Anomaly> MemoryStorage::update_anomaly_status(
    TenantId tenant, AnomalyId id, AnomalyStatus expected, AnomalyStatus status,
    const std::optional<std::string>& resolution_notes) {
    std::lock_guard lock(mutex_);
    auto it = anomalies_.find(id);
    if (it == anomalies_.end() || it->second.tenant_id != tenant) {
        return fail<Anomaly>(ErrorCode::NotFound, "Anomaly not found: " + std::to_string(id));
    }
    if (it->second.status != expected) {
        return fail<Anomaly>(ErrorCode::Conflict,
                             "Anomaly " + std::to_string(id) + " is already " +
                                 std::string(to_string(it->second.status)));
    }
    it->second.status = status;
    if (resolution_notes) {
        it->second.resolution_notes = resolution_notes;
    }
    return Result<Anomaly>::Ok(it->second);
}

std::pair<VendorBaseline, UpsertOutcome> MemoryStorage::prepare_baseline(
    TenantId tenant, const VendorBaseline& baseline) {
    std::lock_guard lock(mutex_);

    auto vendor = vendors_.find(baseline.vendor_id);
    if (vendor == vendors_.end() || vendor->second.tenant_id != tenant) {
        throw StorageError("Baseline references vendor " + std::to_string(baseline.vendor_id) +
                           " outside tenant " + std::to_string(tenant));
    }

    VendorBaseline stored = baseline;
    auto existing = baseline_index_.find(BaselineKey{baseline.vendor_id, baseline.window_start,
                                                     baseline.window_end});
    if (existing != baseline_index_.end()) {
        stored.id = existing->second;
        return {stored, UpsertOutcome::Updated};
    }
    stored.id = next_baseline_id_++;
    return {stored, UpsertOutcome::Inserted};
}

std::optional<Anomaly> MemoryStorage::prepare_anomaly(TenantId tenant, Anomaly anomaly) {
    std::lock_guard lock(mutex_);

    if (anomaly.tenant_id != tenant) {
        throw StorageError("Anomaly tenant " + std::to_string(anomaly.tenant_id) +
                           " does not match transaction tenant " + std::to_string(tenant));
    }

    if (anomaly.bill_id) {
        auto bill = bills_.find(*anomaly.bill_id);
        if (bill == bills_.end() || bill->second.tenant_id != tenant) {
            throw StorageError("Anomaly references unknown bill " + std::to_string(*anomaly.bill_id));
        }
        if (anomaly_index_.count(AnomalyKey{tenant, *anomaly.bill_id, anomaly.kind()}) != 0) {
            return std::nullopt;
        }
    }

    anomaly.id = next_anomaly_id_++;
    anomaly.status = AnomalyStatus::Open;
    if (anomaly.created_at == WallTime{}) {
        anomaly.created_at = std::chrono::system_clock::now();
    }
    return anomaly;
}

std::size_t MemoryStorage::apply(const std::vector<VendorBaseline>& baselines,
                                 std::vector<Anomaly>& anomalies) {
    std::lock_guard lock(mutex_);

    for (const auto& baseline : baselines) {
        BaselineKey key{baseline.vendor_id, baseline.window_start, baseline.window_end};
        auto existing = baseline_index_.find(key);
        if (existing != baseline_index_.end()) {
            VendorBaseline& stored = baselines_.at(existing->second);
            BaselineId id = stored.id;
            stored = baseline;
            stored.id = id;
            continue;
        }
        baseline_index_.emplace(key, baseline.id);
        baselines_.emplace(baseline.id, baseline);
    }

    std::size_t skipped = 0;
    for (auto& anomaly : anomalies) {
        // Anomalies without a bill never collide
        if (anomaly.bill_id &&
            !anomaly_index_.emplace(AnomalyKey{anomaly.tenant_id, *anomaly.bill_id, anomaly.kind()},
                                    anomaly.id).second) {
            ++skipped;
            continue;
        }
        AnomalyId id = anomaly.id;
        anomalies_.emplace(id, std::move(anomaly));
    }
    return skipped;
}

}  // namespace apwatch
