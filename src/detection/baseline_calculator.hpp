#pragma once

#include "core/records.hpp"
#include "storage/storage.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace apwatch {

/// Summary statistics of a set of amounts
struct AmountStats {
    std::size_t count{0};
    double mean{0.0};
    double std_dev{0.0};   // Sample standard deviation, 0 when count == 1
    Money min;
    Money max;
};

/// Result of one baseline pass
struct BaselineResult {
    Date window_start{};
    Date window_end{};
    std::vector<VendorBaseline> baselines;   // One per vendor with data in the window
    std::size_t inserted{0};
    std::size_t updated{0};
};

/// Computes per-vendor rolling baselines over [today - baseline_days, today]
class BaselineCalculator {
public:
    /// @param baseline_days Trailing window length in days
    explicit BaselineCalculator(std::int64_t baseline_days = 90);

    /// Welford's algorithm with Bessel's correction
    /// @return nullopt for an empty set
    [[nodiscard]] static std::optional<AmountStats> compute_stats(const std::vector<Money>& amounts);

    /// Compute and upsert baselines for every vendor with bills in the window
    /// Vendors without bills in the window are skipped.
    [[nodiscard]] BaselineResult run(const std::vector<Vendor>& vendors,
                                     const std::vector<Bill>& bills,
                                     Date today,
                                     Transaction& tx) const;

    [[nodiscard]] std::int64_t baseline_days() const noexcept;

private:
    std::int64_t baseline_days_;
};

}  // namespace apwatch
