#include "detection/duplicate_detector.hpp"
#include <algorithm>
#include <cstdlib>
#include <map>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <utility>

namespace apwatch {

namespace {

constexpr Money kHighSeverityAmount = Money::from_units(1000);

}  // namespace

DuplicateDetector::DuplicateDetector(std::int64_t day_window, Money alert_min_amount)
    : day_window_(day_window)
    , alert_min_amount_(alert_min_amount)
{}

AnomalyKind DuplicateDetector::kind() const noexcept {
    return AnomalyKind::Duplicate;
}

std::string_view DuplicateDetector::name() const noexcept {
    return "duplicates";
}

Severity DuplicateDetector::severity_for(Money amount) noexcept {
    return amount >= kHighSeverityAmount ? Severity::High : Severity::Medium;
}

std::size_t DuplicateDetector::detect(const DetectionContext& ctx) const {
    // (vendor, cents) -> bills; std::map keeps group iteration deterministic
    std::map<std::pair<VendorId, Money::underlying_type>, std::vector<const Bill*>> groups;
    for (const Bill& bill : ctx.bills) {
        groups[{bill.vendor_id, bill.total_amount.cents()}].push_back(&bill);
    }

    std::size_t created = 0;
    for (auto& [key, group] : groups) {
        if (group.size() < 2) {
            continue;
        }

        std::sort(group.begin(), group.end(), [](const Bill* a, const Bill* b) {
            if (a->txn_date != b->txn_date) {
                return a->txn_date < b->txn_date;
            }
            return a->id < b->id;
        });

        for (std::size_t i = 0; i < group.size(); ++i) {
            const Bill& first = *group[i];
            for (std::size_t j = i + 1; j < group.size(); ++j) {
                const Bill& second = *group[j];
                std::int64_t days_apart = std::llabs(dates::days_between(first.txn_date, second.txn_date));
                if (days_apart > day_window_) {
                    continue;
                }

                Anomaly anomaly{
                    .id = 0,
                    .tenant_id = ctx.tenant_id,
                    .bill_id = first.id,
                    .severity = severity_for(first.total_amount),
                    .amount = first.total_amount,
                    .confidence = kConfidence,
                    .description = fmt::format(
                        "Possible duplicate: same vendor and amount within {} days", day_window_),
                    .detail = DuplicateDetail{.related_bill = second.id, .days_apart = days_apart},
                    .alert_worthy = first.total_amount >= alert_min_amount_,
                    .status = AnomalyStatus::Open,
                    .resolution_notes = std::nullopt,
                    .created_at = {}
                };

                // Insert-or-skip: a bill already flagged as duplicate stays as is
                if (ctx.tx.insert_anomaly(std::move(anomaly))) {
                    ++created;
                    spdlog::debug("Duplicate: bill {} matches bill {} ({} days apart, {})",
                                  first.id, second.id, days_apart, first.total_amount.to_string());
                }
            }
        }
    }

    return created;
}

}  // namespace apwatch
