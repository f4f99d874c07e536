#include "detection/baseline_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include <unordered_map>

namespace apwatch {

BaselineCalculator::BaselineCalculator(std::int64_t baseline_days)
    : baseline_days_(baseline_days)
{}

std::optional<AmountStats> BaselineCalculator::compute_stats(const std::vector<Money>& amounts) {
    if (amounts.empty()) {
        return std::nullopt;
    }

    AmountStats stats;
    stats.min = amounts.front();
    stats.max = amounts.front();

    // Welford's algorithm for mean and sum of squared deviations
    double mean = 0.0;
    double m2 = 0.0;
    std::size_t count = 0;
    for (const Money& amount : amounts) {
        double x = amount.to_double();
        ++count;
        double delta = x - mean;
        mean += delta / static_cast<double>(count);
        double delta2 = x - mean;
        m2 += delta * delta2;

        if (amount < stats.min) stats.min = amount;
        if (amount > stats.max) stats.max = amount;
    }

    stats.count = count;
    stats.mean = mean;
    if (count > 1) {
        // Clamp m2 to avoid negative values due to floating point errors
        double variance = std::max(m2, 0.0) / static_cast<double>(count - 1);
        stats.std_dev = std::sqrt(variance);
    }
    return stats;
}

BaselineResult BaselineCalculator::run(const std::vector<Vendor>& vendors,
                                       const std::vector<Bill>& bills,
                                       Date today,
                                       Transaction& tx) const {
    BaselineResult result;
    result.window_end = today;
    result.window_start = dates::minus_days(today, baseline_days_);

    std::unordered_map<VendorId, std::vector<Money>> amounts_by_vendor;
    for (const Bill& bill : bills) {
        if (bill.txn_date >= result.window_start && bill.txn_date <= result.window_end) {
            amounts_by_vendor[bill.vendor_id].push_back(bill.total_amount);
        }
    }

    for (const Vendor& vendor : vendors) {
        auto it = amounts_by_vendor.find(vendor.id);
        if (it == amounts_by_vendor.end()) {
            continue;
        }
        auto stats = compute_stats(it->second);
        if (!stats) {
            continue;
        }

        VendorBaseline baseline{
            .id = 0,
            .vendor_id = vendor.id,
            .window_start = result.window_start,
            .window_end = result.window_end,
            .sample_count = stats->count,
            .mean = stats->mean,
            .std_dev = stats->std_dev,
            .min_amount = stats->min,
            .max_amount = stats->max
        };

        auto [stored, outcome] = tx.upsert_baseline(baseline);
        if (outcome == UpsertOutcome::Inserted) {
            ++result.inserted;
        } else {
            ++result.updated;
        }
        spdlog::debug("Baseline vendor {} ({}): n={} mean={:.2f} std={:.2f}",
                      vendor.id, vendor.name, stored.sample_count, stored.mean, stored.std_dev);
        result.baselines.push_back(std::move(stored));
    }

    return result;
}

std::int64_t BaselineCalculator::baseline_days() const noexcept {
    return baseline_days_;
}

}  // namespace apwatch
