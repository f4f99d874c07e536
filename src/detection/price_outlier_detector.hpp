#pragma once

#include "detection/detector.hpp"

namespace apwatch {

/// Flags bills priced more than sigma standard deviations above the vendor baseline
class PriceOutlierDetector final : public Detector {
public:
    /// @param sigma_threshold Number of standard deviations above the mean (e.g., 2.0)
    /// @param alert_min_amount Findings at or above this amount are alert-worthy
    PriceOutlierDetector(double sigma_threshold, Money alert_min_amount);

    [[nodiscard]] AnomalyKind kind() const noexcept override;
    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] std::size_t detect(const DetectionContext& ctx) const override;

    /// Score a single amount against a baseline
    /// @return Detail if the amount is strictly above mean + sigma * std_dev, nullopt otherwise
    [[nodiscard]] std::optional<PriceOutlierDetail> check_amount(
        Money amount, const VendorBaseline& baseline) const;

    /// `high` when z >= 3, `medium` below
    [[nodiscard]] static Severity severity_for(double z_score) noexcept;

    /// min(0.99, 0.5 + z / 10)
    [[nodiscard]] static Confidence confidence_for(double z_score) noexcept;

    /// Multiplier applied to the baseline std dev, not an amount
    [[nodiscard]] double sigma_threshold() const noexcept;

private:
    double sigma_threshold_;
    Money alert_min_amount_;
};

}  // namespace apwatch
