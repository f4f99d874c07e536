#include <gtest/gtest.h>

#include "detection/orchestrator.hpp"
#include "engine/detection_scheduler.hpp"
#include "fixtures.hpp"
#include "input/dataset_loader.hpp"
#include "review/anomaly_review.hpp"

#include <atomic>
#include <functional>
#include <set>
#include <thread>

using namespace apwatch;
using namespace apwatch::test;

namespace {

/// MemoryStorage whose writes start failing after a set number of anomaly inserts
class FlakyStorage final : public Storage {
public:
    explicit FlakyStorage(MemoryStorage& inner) : inner_(inner) {}

    void fail_after_inserts(int n) { inserts_before_failure_ = n; }
    void fail_bill_reads(bool fail) { fail_bill_reads_ = fail; }

    std::vector<Tenant> tenants() const override { return inner_.tenants(); }
    std::vector<Vendor> vendors(TenantId t) const override { return inner_.vendors(t); }
    std::vector<Bill> bills(TenantId t) const override {
        if (fail_bill_reads_) {
            throw StorageError("bills table unavailable");
        }
        return inner_.bills(t);
    }
    std::optional<VendorBaseline> find_baseline(VendorId v, Date s, Date e) const override {
        return inner_.find_baseline(v, s, e);
    }
    std::vector<VendorBaseline> baselines(TenantId t) const override { return inner_.baselines(t); }
    std::optional<Anomaly> find_anomaly(TenantId t, BillId b, AnomalyKind k) const override {
        return inner_.find_anomaly(t, b, k);
    }
    std::optional<Anomaly> find_anomaly_by_id(TenantId t, AnomalyId id) const override {
        return inner_.find_anomaly_by_id(t, id);
    }
    std::vector<Anomaly> anomalies(const AnomalyQuery& q) const override { return inner_.anomalies(q); }
    Result<Anomaly> update_anomaly_status(TenantId t, AnomalyId id, AnomalyStatus expected,
                                          AnomalyStatus s,
                                          const std::optional<std::string>& notes) override {
        return inner_.update_anomaly_status(t, id, expected, s, notes);
    }

    std::unique_ptr<Transaction> begin(TenantId tenant) override {
        return std::make_unique<FlakyTransaction>(inner_.begin(tenant), inserts_before_failure_);
    }

private:
    class FlakyTransaction final : public Transaction {
    public:
        FlakyTransaction(std::unique_ptr<Transaction> inner, int remaining)
            : inner_(std::move(inner)), remaining_(remaining) {}

        std::pair<VendorBaseline, UpsertOutcome> upsert_baseline(const VendorBaseline& b) override {
            return inner_->upsert_baseline(b);
        }
        std::optional<AnomalyId> insert_anomaly(Anomaly a) override {
            if (remaining_ >= 0 && remaining_-- == 0) {
                throw StorageError("connection reset during insert");
            }
            return inner_->insert_anomaly(std::move(a));
        }
        void commit() override { inner_->commit(); }
        void rollback() override { inner_->rollback(); }

    private:
        std::unique_ptr<Transaction> inner_;
        int remaining_;
    };

    MemoryStorage& inner_;
    int inserts_before_failure_{-1};
    bool fail_bill_reads_{false};
};

/// Appended detector that always fails
class BrokenDetector final : public Detector {
public:
    AnomalyKind kind() const noexcept override { return AnomalyKind::RoundNumber; }
    std::string_view name() const noexcept override { return "broken"; }
    std::size_t detect(const DetectionContext&) const override {
        throw std::runtime_error("unexpected input");
    }
};

/// Appended detector that runs `during_run` while the run is still uncommitted, then fails
class InterruptingDetector final : public Detector {
public:
    explicit InterruptingDetector(std::function<void()> during_run)
        : during_run_(std::move(during_run)) {}

    AnomalyKind kind() const noexcept override { return AnomalyKind::RoundNumber; }
    std::string_view name() const noexcept override { return "interrupting"; }
    std::size_t detect(const DetectionContext&) const override {
        during_run_();
        throw StorageError("connection lost before commit");
    }

private:
    std::function<void()> during_run_;
};

/// Seed-like tenant: duplicates, outliers and round numbers all present
TenantRecords demo_tenant(TenantId tenant, BillId first_id, VendorId first_vendor) {
    std::vector<Vendor> vendors;
    for (VendorId v = 0; v < 3; ++v) {
        vendors.push_back(make_vendor(first_vendor + v, "Vendor " + std::to_string(v), tenant));
    }
    BillId id = first_id;
    auto bill = [&](VendorId v, const char* amount, int offset, bool lines) {
        return make_bill(id++, first_vendor + v, amount, day(offset), lines, tenant);
    };
    return make_tenant(tenant, vendors, {
        bill(0, "1200", 20, true),
        bill(0, "800", 23, true),
        bill(0, "5000", 26, false),
        bill(0, "5000", 29, false),
        bill(1, "450", 32, true),
        bill(1, "1100", 35, true),
        bill(2, "999", 38, false),
        bill(2, "5000", 41, false),
        bill(1, "400", 44, true),
        bill(1, "420", 45, true),
        bill(1, "410", 46, true),
        bill(1, "430", 47, true),
    });
}

}  // namespace

// ============================================================================
// Detection Orchestrator Tests
// ============================================================================

class DetectionPipelineTest : public ::testing::Test {
protected:
    MemoryStorage storage;
    Config config = Config::defaults();
    Date today = day(90);

    void SetUp() override {
        import_records(storage, demo_tenant(kTenant, 1, 1));
    }
};

TEST_F(DetectionPipelineTest, RunReachesDoneWithPerDetectorCounts) {
    DetectionOrchestrator orchestrator(storage, config.detection);

    auto result = orchestrator.run(kTenant, today);

    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    const auto& summary = result.value();
    EXPECT_EQ(summary.phase, RunPhase::Done);
    EXPECT_EQ(summary.window_start, day(0));
    EXPECT_EQ(summary.window_end, today);
    EXPECT_EQ(summary.baselines_inserted, 3u);
    ASSERT_EQ(summary.detectors.size(), 3u);
    EXPECT_EQ(summary.detectors[0].name, "duplicates");
    EXPECT_EQ(summary.detectors[1].name, "price_outliers");
    EXPECT_EQ(summary.detectors[2].name, "round_numbers");

    // Duplicate: first 5000 bill of vendor 0
    EXPECT_EQ(summary.detectors[0].created, 1u);
    // Outlier: 1100 against vendor 1 (450, 1100, 400, 420, 410, 430)
    EXPECT_EQ(summary.detectors[1].created, 1u);
    // Round: both 5000 bills of vendor 0 and the 5000 bill of vendor 2
    EXPECT_EQ(summary.detectors[2].created, 3u);
    EXPECT_EQ(summary.new_anomalies(), 5u);
    EXPECT_EQ(all_anomalies(storage).size(), 5u);
}

TEST_F(DetectionPipelineTest, SecondRunCreatesNothing) {
    DetectionOrchestrator orchestrator(storage, config.detection);

    auto first = orchestrator.run(kTenant, today);
    auto second = orchestrator.run(kTenant, today);

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_GT(first.value().new_anomalies(), 0u);
    EXPECT_EQ(second.value().new_anomalies(), 0u);
    EXPECT_EQ(second.value().baselines_updated, 3u);
    EXPECT_EQ(second.value().baselines_inserted, 0u);
}

TEST_F(DetectionPipelineTest, RunDetectionReturnsTotal) {
    DetectionOrchestrator orchestrator(storage, config.detection);

    auto count = orchestrator.run_detection(kTenant);

    ASSERT_TRUE(count.is_ok());
    // Current date: bills from 2024 fall outside the baseline window, other detectors still apply
    EXPECT_EQ(count.value(), 4u);
    EXPECT_EQ(orchestrator.run_detection(kTenant).value(), 0u);
}

TEST_F(DetectionPipelineTest, UnknownTenantIsEmptyRun) {
    DetectionOrchestrator orchestrator(storage, config.detection);

    auto result = orchestrator.run(42, today);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().new_anomalies(), 0u);
    EXPECT_EQ(result.value().baselines_inserted, 0u);
}

TEST_F(DetectionPipelineTest, ConfigThresholdsFlowToDetectors) {
    config.detection.alert_min_amount = Money::from_units(10000);
    config.detection.duplicate_day_window = 2;
    DetectionOrchestrator orchestrator(storage, config.detection);

    auto result = orchestrator.run(kTenant, today);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().detectors[0].created, 0u);   // 5000 pair is 3 days apart
    EXPECT_EQ(result.value().detectors[2].created, 0u);   // Below the round-number floor
}

// ===== Failure and Atomicity Tests =====

TEST_F(DetectionPipelineTest, StorageFailureMidRunRollsBackEverything) {
    FlakyStorage flaky(storage);
    flaky.fail_after_inserts(1);
    DetectionOrchestrator orchestrator(flaky, config.detection);

    auto result = orchestrator.run(kTenant, today);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code, ErrorCode::StorageFailure);
    EXPECT_NE(result.error().message.find("duplicates_checked"), std::string::npos);
    EXPECT_TRUE(all_anomalies(storage).empty());
    EXPECT_TRUE(storage.baselines(kTenant).empty());
}

TEST_F(DetectionPipelineTest, FailedRunKeepsEarlierCommittedState) {
    DetectionOrchestrator good(storage, config.detection);
    ASSERT_TRUE(good.run(kTenant, today).is_ok());
    auto baselines_before = storage.baselines(kTenant);

    import_records(storage, make_tenant(kTenant, {}, {make_bill(100, 3, "7500", day(80), false)}));
    FlakyStorage flaky(storage);
    flaky.fail_after_inserts(0);
    DetectionOrchestrator orchestrator(flaky, config.detection);

    auto result = orchestrator.run(kTenant, today);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(all_anomalies(storage).size(), 5u);
    auto baselines_after = storage.baselines(kTenant);
    ASSERT_EQ(baselines_after.size(), baselines_before.size());
    for (std::size_t i = 0; i < baselines_after.size(); ++i) {
        EXPECT_DOUBLE_EQ(baselines_after[i].mean, baselines_before[i].mean);
        EXPECT_EQ(baselines_after[i].sample_count, baselines_before[i].sample_count);
    }

    // Recovers once storage is healthy
    flaky.fail_after_inserts(-1);
    auto retry = orchestrator.run(kTenant, today);
    ASSERT_TRUE(retry.is_ok());
    EXPECT_EQ(retry.value().detectors[2].created, 1u);
}

TEST_F(DetectionPipelineTest, ReadFailureReportedAtStart) {
    FlakyStorage flaky(storage);
    flaky.fail_bill_reads(true);
    DetectionOrchestrator orchestrator(flaky, config.detection);

    auto result = orchestrator.run(kTenant, today);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code, ErrorCode::StorageFailure);
    EXPECT_NE(result.error().message.find("start"), std::string::npos);
}

TEST_F(DetectionPipelineTest, AppendedDetectorFailureIsInternalError) {
    DetectionOrchestrator orchestrator(storage, config.detection);
    orchestrator.add_detector(std::make_unique<BrokenDetector>());
    ASSERT_EQ(orchestrator.detectors().size(), 4u);

    auto result = orchestrator.run(kTenant, today);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code, ErrorCode::Internal);
    EXPECT_NE(result.error().message.find("round_numbers_checked"), std::string::npos);
    EXPECT_TRUE(all_anomalies(storage).empty());
}

TEST_F(DetectionPipelineTest, UncommittedFindingsInvisibleToReaders) {
    AnomalyReview review(storage);
    std::size_t alerts_mid_run = 99;
    std::size_t anomalies_mid_run = 99;
    std::size_t baselines_mid_run = 99;

    DetectionOrchestrator orchestrator(storage, config.detection);
    orchestrator.add_detector(std::make_unique<InterruptingDetector>([&]() {
        alerts_mid_run = review.pending_alerts(kTenant).size();
        anomalies_mid_run = all_anomalies(storage).size();
        baselines_mid_run = storage.baselines(kTenant).size();
    }));

    auto result = orchestrator.run(kTenant, today);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code, ErrorCode::StorageFailure);
    EXPECT_EQ(alerts_mid_run, 0u);
    EXPECT_EQ(anomalies_mid_run, 0u);
    EXPECT_EQ(baselines_mid_run, 0u);
    EXPECT_TRUE(all_anomalies(storage).empty());
}

TEST_F(DetectionPipelineTest, RollbackKeepsFindingsOfInterleavedRun) {
    DetectionOrchestrator other(storage, config.detection);
    bool other_ok = false;
    std::size_t other_created = 0;

    DetectionOrchestrator orchestrator(storage, config.detection);
    orchestrator.add_detector(std::make_unique<InterruptingDetector>([&]() {
        auto interleaved = other.run(kTenant, today);
        other_ok = interleaved.is_ok();
        if (other_ok) {
            other_created = interleaved.value().new_anomalies();
        }
    }));

    auto result = orchestrator.run(kTenant, today);

    ASSERT_TRUE(result.is_err());
    ASSERT_TRUE(other_ok);
    EXPECT_EQ(other_created, 5u);
    EXPECT_EQ(all_anomalies(storage).size(), 5u);
    EXPECT_EQ(storage.baselines(kTenant).size(), 3u);

    // Nothing left to find once the interleaved run has committed
    DetectionOrchestrator again(storage, config.detection);
    EXPECT_EQ(again.run(kTenant, today).value().new_anomalies(), 0u);
}

// ============================================================================
// Scheduler Tests
// ============================================================================

class DetectionSchedulerTest : public ::testing::Test {
protected:
    static constexpr TenantId kTenantCount = 6;

    MemoryStorage storage;
    Config config = Config::defaults();
    Date today = day(90);

    void SetUp() override {
        for (TenantId t = 1; t <= kTenantCount; ++t) {
            import_records(storage, demo_tenant(t, t * 100, t * 10));
        }
    }

    std::vector<TenantId> all_tenants() const {
        std::vector<TenantId> ids;
        for (TenantId t = 1; t <= kTenantCount; ++t) {
            ids.push_back(t);
        }
        return ids;
    }
};

TEST_F(DetectionSchedulerTest, ParallelRunsMatchSequentialRuns) {
    MemoryStorage sequential_storage;
    for (TenantId t = 1; t <= kTenantCount; ++t) {
        import_records(sequential_storage, demo_tenant(t, t * 100, t * 10));
    }
    DetectionOrchestrator sequential(sequential_storage, config.detection);
    std::vector<std::size_t> expected;
    for (TenantId t : all_tenants()) {
        expected.push_back(sequential.run(t, today).value().new_anomalies());
    }

    DetectionOrchestrator orchestrator(storage, config.detection);
    DetectionScheduler scheduler(orchestrator, 4);
    auto results = scheduler.run_all(all_tenants(), today);

    ASSERT_EQ(results.size(), expected.size());
    for (std::size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].tenant_id, i + 1);
        ASSERT_TRUE(results[i].result.is_ok());
        EXPECT_EQ(results[i].result.value().new_anomalies(), expected[i]);
        EXPECT_EQ(all_anomalies(storage, results[i].tenant_id).size(), expected[i]);
    }
}

TEST_F(DetectionSchedulerTest, SameTenantRunsNeverDuplicateRows) {
    DetectionOrchestrator orchestrator(storage, config.detection);
    DetectionScheduler scheduler(orchestrator, 4);

    std::vector<std::future<Result<RunSummary>>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(scheduler.submit(kTenant, today));
    }

    std::size_t total = 0;
    for (auto& f : futures) {
        auto result = f.get();
        ASSERT_TRUE(result.is_ok());
        total += result.value().new_anomalies();
    }

    auto stored = all_anomalies(storage, kTenant);
    EXPECT_EQ(total, stored.size());
    EXPECT_EQ(stored.size(), 5u);

    std::set<std::pair<BillId, AnomalyKind>> keys;
    for (const auto& a : stored) {
        EXPECT_TRUE(keys.insert({*a.bill_id, a.kind()}).second);
    }
}

TEST_F(DetectionSchedulerTest, DirectConcurrentRunsStayUnique) {
    DetectionOrchestrator orchestrator(storage, config.detection);
    std::atomic<std::size_t> total{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&]() {
            auto result = orchestrator.run(kTenant, today);
            if (result.is_ok()) {
                total += result.value().new_anomalies();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    // Overlapping runs may each stage a finding; only one copy is ever committed
    EXPECT_GE(total.load(), 5u);
    EXPECT_EQ(all_anomalies(storage, kTenant).size(), 5u);
}

TEST_F(DetectionSchedulerTest, FailedTenantDoesNotStopBatch) {
    FlakyStorage flaky(storage);
    flaky.fail_after_inserts(0);
    DetectionOrchestrator orchestrator(flaky, config.detection);
    DetectionScheduler scheduler(orchestrator, 2);

    auto results = scheduler.run_all({1, 2}, today);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].result.is_err());
    EXPECT_TRUE(results[1].result.is_err());
    EXPECT_TRUE(all_anomalies(storage, 1).empty());
}

TEST_F(DetectionSchedulerTest, SubmitAfterShutdownThrows) {
    DetectionOrchestrator orchestrator(storage, config.detection);
    DetectionScheduler scheduler(orchestrator, 1);
    scheduler.shutdown();

    EXPECT_THROW((void)scheduler.submit(kTenant, today), std::logic_error);
}

// ============================================================================
// Dataset to Review Round Trip
// ============================================================================

TEST(DatasetPipelineTest, LoadImportDetectReview) {
    auto dataset = DatasetLoader::parse(R"({
        "tenants": [{
            "id": 9,
            "name": "Demo",
            "vendors": [{"id": 1, "external_id": "v1", "name": "CloudHost Inc"}],
            "bills": [
                {"id": 1, "external_id": "b1", "vendor_id": 1, "total_amount": "2500", "txn_date": "2024-05-01"},
                {"id": 2, "external_id": "b2", "vendor_id": 1, "total_amount": "2500", "txn_date": "2024-05-04"}
            ]
        }]
    })");
    ASSERT_TRUE(dataset.is_ok()) << dataset.error().to_string();

    MemoryStorage storage;
    ASSERT_TRUE(storage.import(dataset.value().tenants.front()).is_ok());

    DetectionOrchestrator orchestrator(storage, Config::defaults().detection);
    auto today = dates::parse_iso("2024-05-10").value();
    auto run = orchestrator.run(9, today);
    ASSERT_TRUE(run.is_ok());
    // One duplicate plus a round-number finding per bill
    EXPECT_EQ(run.value().new_anomalies(), 3u);

    AnomalyReview review(storage);
    EXPECT_EQ(review.pending_alerts(9).size(), 3u);
    EXPECT_EQ(review.dashboard(9).total_anomaly_amount, Money::from_units(5000));
}
