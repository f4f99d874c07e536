#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace apwatch {

enum class AnomalyKind {
    Duplicate,
    PriceCreep,
    RoundNumber
};

enum class Severity {
    Low,
    Medium,
    High
};

/// Review status; Open is initial, the other two are terminal
enum class AnomalyStatus {
    Open,
    Acknowledged,
    Dismissed
};

/// Same vendor, same amount, within the duplicate day window
struct DuplicateDetail {
    BillId related_bill{0};
    std::int64_t days_apart{0};
};

/// Amount above the vendor baseline by more than sigma standard deviations
struct PriceOutlierDetail {
    double z_score{0.0};
    double baseline_mean{0.0};
    double baseline_std_dev{0.0};
};

/// Round total without line-item detail
struct RoundNumberDetail {
    Money round_value;
};

/// Kind-specific metadata; the alternative determines the anomaly kind
using AnomalyDetail = std::variant<
    DuplicateDetail,
    PriceOutlierDetail,
    RoundNumberDetail
>;

[[nodiscard]] inline AnomalyKind kind_of(const AnomalyDetail& detail) {
    return std::visit([](const auto& d) -> AnomalyKind {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, DuplicateDetail>) return AnomalyKind::Duplicate;
        else if constexpr (std::is_same_v<T, PriceOutlierDetail>) return AnomalyKind::PriceCreep;
        else return AnomalyKind::RoundNumber;
    }, detail);
}

/// Persisted finding
struct Anomaly {
    AnomalyId id{0};
    TenantId tenant_id{0};
    std::optional<BillId> bill_id;
    Severity severity{Severity::Medium};
    Money amount;
    Confidence confidence{0.0};
    std::string description;
    AnomalyDetail detail;
    bool alert_worthy{false};
    AnomalyStatus status{AnomalyStatus::Open};
    std::optional<std::string> resolution_notes;
    WallTime created_at{};

    [[nodiscard]] AnomalyKind kind() const {
        return kind_of(detail);
    }
};

[[nodiscard]] std::string_view to_string(AnomalyKind kind) noexcept;
[[nodiscard]] std::string_view to_string(Severity severity) noexcept;
[[nodiscard]] std::string_view to_string(AnomalyStatus status) noexcept;

[[nodiscard]] Result<AnomalyKind> parse_anomaly_kind(std::string_view s);
[[nodiscard]] Result<AnomalyStatus> parse_anomaly_status(std::string_view s);

}  // namespace apwatch
