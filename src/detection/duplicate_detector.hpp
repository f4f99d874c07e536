#pragma once

#include "detection/detector.hpp"
#include <cstdint>

namespace apwatch {

/// Flags same-vendor, same-amount bills dated within a day window of each other
///
/// Bills are grouped by (vendor, amount in cents) and visited in (txn_date, id) order.
/// For each qualifying pair (A, B) with A earlier, A is flagged referencing B unless
/// A already carries a duplicate anomaly. A bill therefore receives at most one
/// duplicate finding, and the latest bill of a cluster is never the flagged member.
class DuplicateDetector final : public Detector {
public:
    /// @param day_window Maximum |date difference| in days for a pair to qualify
    /// @param alert_min_amount Findings at or above this amount are alert-worthy
    DuplicateDetector(std::int64_t day_window, Money alert_min_amount);

    [[nodiscard]] AnomalyKind kind() const noexcept override;
    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] std::size_t detect(const DetectionContext& ctx) const override;

    /// `high` at or above 1000.00, `medium` below
    [[nodiscard]] static Severity severity_for(Money amount) noexcept;

    static constexpr Confidence kConfidence = 0.95;

private:
    std::int64_t day_window_;
    Money alert_min_amount_;
};

}  // namespace apwatch
