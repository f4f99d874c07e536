#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace apwatch {

/// Audited organization
struct Tenant {
    TenantId id{0};
    std::string name;
};

/// Payee; unit of grouping for baselines and duplicate/outlier checks
struct Vendor {
    VendorId id{0};
    TenantId tenant_id{0};
    std::string external_id;      // Unique per tenant
    std::string name;
};

/// One payable transaction record (read-only to detection)
struct Bill {
    BillId id{0};
    TenantId tenant_id{0};
    VendorId vendor_id{0};
    std::string external_id;      // Unique per tenant
    std::string bill_number;      // Display only, may be empty
    Money total_amount;           // Non-negative
    Date txn_date{};
    bool has_line_items{false};
};

/// Rolling statistics of a vendor's amounts over [window_start, window_end]
struct VendorBaseline {
    BaselineId id{0};
    VendorId vendor_id{0};
    Date window_start{};
    Date window_end{};
    std::size_t sample_count{0};
    double mean{0.0};
    double std_dev{0.0};          // Sample standard deviation (n - 1)
    Money min_amount;
    Money max_amount;
};

/// Canonical records for one tenant as handed over by ingestion
struct TenantRecords {
    Tenant tenant;
    std::vector<Vendor> vendors;
    std::vector<Bill> bills;
};

}  // namespace apwatch
