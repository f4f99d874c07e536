#include "core/anomaly.hpp"

namespace apwatch {

std::string_view to_string(AnomalyKind kind) noexcept {
    switch (kind) {
        case AnomalyKind::Duplicate: return "duplicate";
        case AnomalyKind::PriceCreep: return "price_creep";
        case AnomalyKind::RoundNumber: return "round_number";
    }
    return "unknown";
}

std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
    }
    return "unknown";
}

std::string_view to_string(AnomalyStatus status) noexcept {
    switch (status) {
        case AnomalyStatus::Open: return "open";
        case AnomalyStatus::Acknowledged: return "acknowledged";
        case AnomalyStatus::Dismissed: return "dismissed";
    }
    return "unknown";
}

Result<AnomalyKind> parse_anomaly_kind(std::string_view s) {
    if (s == "duplicate") return Result<AnomalyKind>::Ok(AnomalyKind::Duplicate);
    if (s == "price_creep") return Result<AnomalyKind>::Ok(AnomalyKind::PriceCreep);
    if (s == "round_number") return Result<AnomalyKind>::Ok(AnomalyKind::RoundNumber);
    return fail<AnomalyKind>(ErrorCode::InvalidArgument, "Unknown anomaly kind: " + std::string(s));
}

Result<AnomalyStatus> parse_anomaly_status(std::string_view s) {
    if (s == "open") return Result<AnomalyStatus>::Ok(AnomalyStatus::Open);
    if (s == "acknowledged") return Result<AnomalyStatus>::Ok(AnomalyStatus::Acknowledged);
    if (s == "dismissed") return Result<AnomalyStatus>::Ok(AnomalyStatus::Dismissed);
    return fail<AnomalyStatus>(ErrorCode::InvalidArgument,
                               "status must be one of: open, acknowledged, dismissed");
}

}  // namespace apwatch
