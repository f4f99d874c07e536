#include "detection/price_outlier_detector.hpp"
#include <algorithm>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <unordered_map>

namespace apwatch {

PriceOutlierDetector::PriceOutlierDetector(double sigma_threshold, Money alert_min_amount)
    : sigma_threshold_(sigma_threshold)
    , alert_min_amount_(alert_min_amount)
{}

AnomalyKind PriceOutlierDetector::kind() const noexcept {
    return AnomalyKind::PriceCreep;
}

std::string_view PriceOutlierDetector::name() const noexcept {
    return "price_outliers";
}

Severity PriceOutlierDetector::severity_for(double z_score) noexcept {
    return z_score >= 3.0 ? Severity::High : Severity::Medium;
}

Confidence PriceOutlierDetector::confidence_for(double z_score) noexcept {
    return std::min(0.99, 0.5 + z_score / 10.0);
}

double PriceOutlierDetector::sigma_threshold() const noexcept {
    return sigma_threshold_;
}

std::optional<PriceOutlierDetail> PriceOutlierDetector::check_amount(
    Money amount, const VendorBaseline& baseline) const {
    // Insufficient history to judge
    if (!(baseline.std_dev > 0.0)) {
        return std::nullopt;
    }

    double limit = baseline.mean + sigma_threshold_ * baseline.std_dev;
    double value = amount.to_double();
    if (!(value > limit)) {
        return std::nullopt;
    }

    return PriceOutlierDetail{
        .z_score = (value - baseline.mean) / baseline.std_dev,
        .baseline_mean = baseline.mean,
        .baseline_std_dev = baseline.std_dev
    };
}

std::size_t PriceOutlierDetector::detect(const DetectionContext& ctx) const {
    std::unordered_map<VendorId, std::vector<const Bill*>> bills_by_vendor;
    for (const Bill& bill : ctx.bills) {
        bills_by_vendor[bill.vendor_id].push_back(&bill);
    }

    std::size_t created = 0;
    for (const VendorBaseline& baseline : ctx.baselines) {
        auto it = bills_by_vendor.find(baseline.vendor_id);
        if (it == bills_by_vendor.end()) {
            continue;
        }

        for (const Bill* bill : it->second) {
            auto detail = check_amount(bill->total_amount, baseline);
            if (!detail) {
                continue;
            }

            double z = detail->z_score;
            Anomaly anomaly{
                .id = 0,
                .tenant_id = ctx.tenant_id,
                .bill_id = bill->id,
                .severity = severity_for(z),
                .amount = bill->total_amount,
                .confidence = confidence_for(z),
                .description = fmt::format("Amount {} is {:.1f} sigma above vendor baseline ({:.2f})",
                                           bill->total_amount.to_string(), z, baseline.mean),
                .detail = *detail,
                .alert_worthy = bill->total_amount >= alert_min_amount_ || z >= sigma_threshold_,
                .status = AnomalyStatus::Open,
                .resolution_notes = std::nullopt,
                .created_at = {}
            };

            if (ctx.tx.insert_anomaly(std::move(anomaly))) {
                ++created;
                spdlog::debug("Price outlier: bill {} amount {} z={:.2f}",
                              bill->id, bill->total_amount.to_string(), z);
            }
        }
    }

    return created;
}

}  // namespace apwatch
