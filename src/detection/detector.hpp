#pragma once

#include "core/anomaly.hpp"
#include "core/records.hpp"
#include "storage/storage.hpp"
#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace apwatch {

/// Inputs shared by every detector within one run
struct DetectionContext {
    TenantId tenant_id;
    Date today;
    const std::vector<Bill>& bills;                 // All of the tenant's bills
    const std::vector<VendorBaseline>& baselines;   // Baselines written earlier in this run
    Transaction& tx;
};

/// One stateless detection unit: tenant in, new-anomaly count out
class Detector {
public:
    virtual ~Detector() = default;

    /// Kind of anomaly this detector writes
    [[nodiscard]] virtual AnomalyKind kind() const noexcept = 0;

    /// Short name for logs
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Examine the context and insert findings through ctx.tx
    /// @return Number of anomalies newly created
    [[nodiscard]] virtual std::size_t detect(const DetectionContext& ctx) const = 0;
};

using DetectorPtr = std::unique_ptr<Detector>;

}  // namespace apwatch
