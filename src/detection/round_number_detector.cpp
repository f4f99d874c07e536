#include "detection/round_number_detector.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace apwatch {

RoundNumberDetector::RoundNumberDetector(Money alert_min_amount)
    : alert_min_amount_(alert_min_amount)
{}

AnomalyKind RoundNumberDetector::kind() const noexcept {
    return AnomalyKind::RoundNumber;
}

std::string_view RoundNumberDetector::name() const noexcept {
    return "round_numbers";
}

bool RoundNumberDetector::is_suspicious(const Bill& bill) const noexcept {
    if (bill.has_line_items) {
        return false;
    }
    if (bill.total_amount < alert_min_amount_) {
        return false;
    }
    return bill.total_amount.is_multiple_of_units(kRoundUnit);
}

std::size_t RoundNumberDetector::detect(const DetectionContext& ctx) const {
    std::size_t created = 0;
    for (const Bill& bill : ctx.bills) {
        if (!is_suspicious(bill)) {
            continue;
        }

        Anomaly anomaly{
            .id = 0,
            .tenant_id = ctx.tenant_id,
            .bill_id = bill.id,
            .severity = Severity::Low,
            .amount = bill.total_amount,
            .confidence = kConfidence,
            .description = fmt::format(
                "Round number ({}) with no line-item detail, verify against the source invoice",
                bill.total_amount.to_string()),
            .detail = RoundNumberDetail{.round_value = bill.total_amount},
            .alert_worthy = bill.total_amount >= alert_min_amount_,
            .status = AnomalyStatus::Open,
            .resolution_notes = std::nullopt,
            .created_at = {}
        };

        if (ctx.tx.insert_anomaly(std::move(anomaly))) {
            ++created;
            spdlog::debug("Round number: bill {} amount {}", bill.id, bill.total_amount.to_string());
        }
    }
    return created;
}

}  // namespace apwatch
