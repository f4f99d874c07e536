#pragma once

#include "detection/detector.hpp"

namespace apwatch {

/// Flags un-itemized bills whose total is an exact multiple of 500
class RoundNumberDetector final : public Detector {
public:
    /// @param alert_min_amount Smaller amounts are ignored
    explicit RoundNumberDetector(Money alert_min_amount);

    [[nodiscard]] AnomalyKind kind() const noexcept override;
    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] std::size_t detect(const DetectionContext& ctx) const override;

    /// True if the bill qualifies as a round-number finding
    [[nodiscard]] bool is_suspicious(const Bill& bill) const noexcept;

    static constexpr Money::underlying_type kRoundUnit = 500;
    static constexpr Confidence kConfidence = 0.6;

private:
    Money alert_min_amount_;
};

}  // namespace apwatch
