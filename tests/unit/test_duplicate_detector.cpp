#include <gtest/gtest.h>
#include "detection/duplicate_detector.hpp"
#include "fixtures.hpp"
#include <set>

using namespace apwatch;
using namespace apwatch::test;

class DuplicateDetectorTest : public ::testing::Test {
protected:
    MemoryStorage storage;
    DuplicateDetector detector{7, Money::from_units(500)};

    void load(std::vector<Bill> bills) {
        import_records(storage, make_tenant(kTenant,
            {make_vendor(1, "Acme"), make_vendor(2, "TechCorp")}, std::move(bills)));
    }

    std::size_t detect() {
        return run_detector(detector, storage, kTenant, day(60));
    }
};

// ===== Basic Detection Tests =====

TEST_F(DuplicateDetectorTest, SameAmountThreeDaysApart) {
    load({
        make_bill(1, 1, "5000.00", day(10)),
        make_bill(2, 1, "5000.00", day(13)),
    });

    EXPECT_EQ(detect(), 1u);

    auto found = all_anomalies(storage);
    ASSERT_EQ(found.size(), 1u);
    const auto& a = found.front();
    EXPECT_EQ(a.kind(), AnomalyKind::Duplicate);
    EXPECT_EQ(a.severity, Severity::High);
    EXPECT_DOUBLE_EQ(a.confidence, 0.95);
    EXPECT_TRUE(a.alert_worthy);
    EXPECT_EQ(a.status, AnomalyStatus::Open);
    EXPECT_EQ(a.amount, Money::from_units(5000));
    EXPECT_EQ(a.bill_id, std::optional<BillId>(1));
    EXPECT_NE(a.description.find("7 days"), std::string::npos);

    const auto& detail = std::get<DuplicateDetail>(a.detail);
    EXPECT_EQ(detail.related_bill, 2u);
    EXPECT_EQ(detail.days_apart, 3);
}

TEST_F(DuplicateDetectorTest, WindowBoundaryIsInclusive) {
    load({
        make_bill(1, 1, "800", day(0)),
        make_bill(2, 1, "800", day(7)),
        make_bill(3, 1, "650", day(20)),
        make_bill(4, 1, "650", day(28)),
    });

    EXPECT_EQ(detect(), 1u);

    auto found = all_anomalies(storage);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found.front().bill_id, std::optional<BillId>(1));
}

TEST_F(DuplicateDetectorTest, DifferentVendorOrAmountNotGrouped) {
    load({
        make_bill(1, 1, "5000.00", day(10)),
        make_bill(2, 2, "5000.00", day(10)),
        make_bill(3, 1, "5000.01", day(11)),
    });

    EXPECT_EQ(detect(), 0u);
    EXPECT_TRUE(all_anomalies(storage).empty());
}

TEST_F(DuplicateDetectorTest, SameDaySameAmountIsDuplicate) {
    load({
        make_bill(5, 1, "120.00", day(3)),
        make_bill(4, 1, "120.00", day(3)),
    });

    EXPECT_EQ(detect(), 1u);

    auto found = all_anomalies(storage);
    ASSERT_EQ(found.size(), 1u);
    // Same date: lower id is the earlier member
    EXPECT_EQ(found.front().bill_id, std::optional<BillId>(4));
    EXPECT_EQ(std::get<DuplicateDetail>(found.front().detail).days_apart, 0);
    EXPECT_FALSE(found.front().alert_worthy);
}

// ===== Severity Tests =====

TEST(DuplicateSeverityTest, ThousandIsHigh) {
    EXPECT_EQ(DuplicateDetector::severity_for(Money::parse("1000.00")), Severity::High);
    EXPECT_EQ(DuplicateDetector::severity_for(Money::parse("999.99")), Severity::Medium);
}

TEST_F(DuplicateDetectorTest, SeverityBoundaryThroughDetection) {
    load({
        make_bill(1, 1, "1000.00", day(1)),
        make_bill(2, 1, "1000.00", day(2)),
        make_bill(3, 2, "999.99", day(1)),
        make_bill(4, 2, "999.99", day(2)),
    });

    EXPECT_EQ(detect(), 2u);

    auto high = storage.find_anomaly(kTenant, 1, AnomalyKind::Duplicate);
    auto medium = storage.find_anomaly(kTenant, 3, AnomalyKind::Duplicate);
    ASSERT_TRUE(high.has_value());
    ASSERT_TRUE(medium.has_value());
    EXPECT_EQ(high->severity, Severity::High);
    EXPECT_EQ(medium->severity, Severity::Medium);
}

// ===== Cluster Tests =====

TEST_F(DuplicateDetectorTest, ClusterFlagsEachBillAtMostOnce) {
    load({
        make_bill(1, 1, "300", day(0)),
        make_bill(2, 1, "300", day(2)),
        make_bill(3, 1, "300", day(4)),
        make_bill(4, 1, "300", day(6)),
    });

    EXPECT_EQ(detect(), 3u);

    auto found = all_anomalies(storage);
    std::set<BillId> flagged;
    for (const auto& a : found) {
        ASSERT_TRUE(a.bill_id.has_value());
        EXPECT_TRUE(flagged.insert(*a.bill_id).second) << "bill flagged twice: " << *a.bill_id;
    }
    // Latest bill of the cluster is never the flagged member
    EXPECT_EQ(flagged, (std::set<BillId>{1, 2, 3}));
}

TEST_F(DuplicateDetectorTest, FirstPairInOrderWins) {
    load({
        make_bill(1, 1, "300", day(0)),
        make_bill(2, 1, "300", day(2)),
        make_bill(3, 1, "300", day(4)),
    });

    (void)detect();

    auto first = storage.find_anomaly(kTenant, 1, AnomalyKind::Duplicate);
    auto second = storage.find_anomaly(kTenant, 2, AnomalyKind::Duplicate);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(std::get<DuplicateDetail>(first->detail).related_bill, 2u);
    EXPECT_EQ(std::get<DuplicateDetail>(second->detail).related_bill, 3u);
    EXPECT_FALSE(storage.find_anomaly(kTenant, 3, AnomalyKind::Duplicate).has_value());
}

TEST_F(DuplicateDetectorTest, ResultIndependentOfInputOrder) {
    load({
        make_bill(3, 1, "300", day(4)),
        make_bill(1, 1, "300", day(0)),
        make_bill(2, 1, "300", day(2)),
    });

    EXPECT_EQ(detect(), 2u);
    EXPECT_TRUE(storage.find_anomaly(kTenant, 1, AnomalyKind::Duplicate).has_value());
    EXPECT_TRUE(storage.find_anomaly(kTenant, 2, AnomalyKind::Duplicate).has_value());
}

// ===== Idempotency Tests =====

TEST_F(DuplicateDetectorTest, SecondRunCreatesNothing) {
    load({
        make_bill(1, 1, "5000.00", day(10)),
        make_bill(2, 1, "5000.00", day(13)),
    });

    EXPECT_EQ(detect(), 1u);
    EXPECT_EQ(detect(), 0u);
    EXPECT_EQ(all_anomalies(storage).size(), 1u);
}

TEST(DuplicateDetectorMetaTest, KindAndName) {
    DuplicateDetector detector(7, Money::from_units(500));
    EXPECT_EQ(detector.kind(), AnomalyKind::Duplicate);
    EXPECT_EQ(detector.name(), "duplicates");
}
