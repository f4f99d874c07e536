#include "detection/orchestrator.hpp"
#include "detection/duplicate_detector.hpp"
#include "detection/price_outlier_detector.hpp"
#include "detection/round_number_detector.hpp"
#include <spdlog/spdlog.h>

namespace apwatch {

std::string_view to_string(RunPhase phase) noexcept {
    switch (phase) {
        case RunPhase::Start: return "start";
        case RunPhase::BaselinesComputed: return "baselines_computed";
        case RunPhase::DuplicatesChecked: return "duplicates_checked";
        case RunPhase::OutliersChecked: return "outliers_checked";
        case RunPhase::RoundNumbersChecked: return "round_numbers_checked";
        case RunPhase::Done: return "done";
    }
    return "unknown";
}

RunPhase phase_after(AnomalyKind kind) noexcept {
    switch (kind) {
        case AnomalyKind::Duplicate: return RunPhase::DuplicatesChecked;
        case AnomalyKind::PriceCreep: return RunPhase::OutliersChecked;
        case AnomalyKind::RoundNumber: return RunPhase::RoundNumbersChecked;
    }
    return RunPhase::Start;
}

std::size_t RunSummary::new_anomalies() const noexcept {
    std::size_t total = 0;
    for (const auto& d : detectors) {
        total += d.created;
    }
    return total;
}

DetectionOrchestrator::DetectionOrchestrator(Storage& storage, const Config::Detection& config)
    : storage_(storage)
    , config_(config)
    , baselines_(config.baseline_days)
{
    detectors_.push_back(std::make_unique<DuplicateDetector>(
        config.duplicate_day_window, config.alert_min_amount));
    detectors_.push_back(std::make_unique<PriceOutlierDetector>(
        config.alert_sigma_threshold, config.alert_min_amount));
    detectors_.push_back(std::make_unique<RoundNumberDetector>(config.alert_min_amount));
}

void DetectionOrchestrator::add_detector(DetectorPtr detector) {
    detectors_.push_back(std::move(detector));
}

const std::vector<DetectorPtr>& DetectionOrchestrator::detectors() const noexcept {
    return detectors_;
}

Result<RunSummary> DetectionOrchestrator::run(TenantId tenant, Date today) const {
    auto started = std::chrono::steady_clock::now();
    RunSummary summary;
    summary.tenant_id = tenant;

    spdlog::info("Detection run for tenant {} as of {}", tenant, dates::to_iso(today));

    try {
        auto tx = storage_.begin(tenant);

        const std::vector<Vendor> vendors = storage_.vendors(tenant);
        const std::vector<Bill> bills = storage_.bills(tenant);

        BaselineResult baseline_result = baselines_.run(vendors, bills, today, *tx);
        summary.window_start = baseline_result.window_start;
        summary.window_end = baseline_result.window_end;
        summary.baselines_inserted = baseline_result.inserted;
        summary.baselines_updated = baseline_result.updated;
        summary.phase = RunPhase::BaselinesComputed;

        DetectionContext ctx{
            .tenant_id = tenant,
            .today = today,
            .bills = bills,
            .baselines = baseline_result.baselines,
            .tx = *tx
        };

        for (const auto& detector : detectors_) {
            std::size_t created = detector->detect(ctx);
            summary.detectors.push_back(DetectorCount{
                .name = std::string(detector->name()),
                .kind = detector->kind(),
                .created = created
            });
            summary.phase = phase_after(detector->kind());
            spdlog::debug("Tenant {}: {} created {} anomalies", tenant, detector->name(), created);
        }

        tx->commit();
        summary.phase = RunPhase::Done;

    } catch (const StorageError& e) {
        spdlog::error("Detection run for tenant {} failed after {}: {}",
                      tenant, to_string(summary.phase), e.what());
        return fail<RunSummary>(ErrorCode::StorageFailure,
                                "Detection run for tenant " + std::to_string(tenant) +
                                    " failed after " + std::string(to_string(summary.phase)) +
                                    ": " + e.what());
    } catch (const std::exception& e) {
        spdlog::error("Detection run for tenant {} aborted after {}: {}",
                      tenant, to_string(summary.phase), e.what());
        return fail<RunSummary>(ErrorCode::Internal,
                                "Detection run for tenant " + std::to_string(tenant) +
                                    " aborted after " + std::string(to_string(summary.phase)) +
                                    ": " + e.what());
    }

    summary.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    spdlog::info("Detection run for tenant {}: {} anomalies found ({} baselines, {} us)",
                 tenant, summary.new_anomalies(),
                 summary.baselines_inserted + summary.baselines_updated,
                 summary.elapsed.count());
    return Result<RunSummary>::Ok(std::move(summary));
}

Result<std::size_t> DetectionOrchestrator::run_detection(TenantId tenant) const {
    return run(tenant, dates::today()).map([](const RunSummary& s) { return s.new_anomalies(); });
}

}  // namespace apwatch
