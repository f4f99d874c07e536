#pragma once

#include "core/config.hpp"
#include "detection/baseline_calculator.hpp"
#include "detection/detector.hpp"
#include "storage/storage.hpp"
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace apwatch {

/// Progress of a single detection run
enum class RunPhase {
    Start,
    BaselinesComputed,
    DuplicatesChecked,
    OutliersChecked,
    RoundNumbersChecked,
    Done
};

[[nodiscard]] std::string_view to_string(RunPhase phase) noexcept;

/// Phase reached after the detector of `kind` finishes
[[nodiscard]] RunPhase phase_after(AnomalyKind kind) noexcept;

/// New findings written by one detector
struct DetectorCount {
    std::string name;
    AnomalyKind kind;
    std::size_t created{0};
};

/// Outcome of a successful run
struct RunSummary {
    TenantId tenant_id{0};
    Date window_start{};
    Date window_end{};
    std::size_t baselines_inserted{0};
    std::size_t baselines_updated{0};
    std::vector<DetectorCount> detectors;
    RunPhase phase{RunPhase::Start};
    std::chrono::microseconds elapsed{0};

    /// Sum of anomalies created across detectors
    [[nodiscard]] std::size_t new_anomalies() const noexcept;
};

/// Runs baselines then every detector, in order, for one tenant
///
/// Holds no state across runs; safe to call from several threads for different
/// tenants. Every write of a run goes through one transaction that is rolled back
/// if any step fails.
class DetectionOrchestrator {
public:
    /// Builds the default pipeline: duplicates, price outliers, round numbers
    DetectionOrchestrator(Storage& storage, const Config::Detection& config);

    DetectionOrchestrator(const DetectionOrchestrator&) = delete;
    DetectionOrchestrator& operator=(const DetectionOrchestrator&) = delete;

    /// Append a detector after the existing ones
    void add_detector(DetectorPtr detector);

    /// Run detection for a tenant as of `today`
    [[nodiscard]] Result<RunSummary> run(TenantId tenant, Date today) const;

    /// Run detection as of the current UTC date
    /// @return Number of newly created anomalies
    [[nodiscard]] Result<std::size_t> run_detection(TenantId tenant) const;

    [[nodiscard]] const std::vector<DetectorPtr>& detectors() const noexcept;

private:
    Storage& storage_;
    Config::Detection config_;
    BaselineCalculator baselines_;
    std::vector<DetectorPtr> detectors_;
};

}  // namespace apwatch
