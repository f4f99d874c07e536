#include <benchmark/benchmark.h>
#include "detection/duplicate_detector.hpp"
#include "storage/memory_storage.hpp"
#include <random>

using namespace apwatch;

namespace {

constexpr TenantId kTenant = 1;

/// Tenant with `bills` bills spread over 20 vendors and a small set of repeating amounts
TenantRecords make_records(std::size_t bills) {
    TenantRecords records;
    records.tenant = Tenant{.id = kTenant, .name = "bench"};
    for (VendorId v = 1; v <= 20; ++v) {
        records.vendors.push_back(Vendor{
            .id = v, .tenant_id = kTenant, .external_id = "V" + std::to_string(v), .name = "Vendor"
        });
    }

    std::mt19937 rng(42);
    std::uniform_int_distribution<VendorId> vendor(1, 20);
    std::uniform_int_distribution<int> amount(1, 50);
    std::uniform_int_distribution<int> offset(0, 365);
    Date base = dates::make(2024, 1, 1);

    for (BillId id = 1; id <= bills; ++id) {
        records.bills.push_back(Bill{
            .id = id,
            .tenant_id = kTenant,
            .vendor_id = vendor(rng),
            .external_id = "B" + std::to_string(id),
            .bill_number = {},
            .total_amount = Money::from_units(amount(rng) * 100),
            .txn_date = base + std::chrono::days{offset(rng)},
            .has_line_items = true
        });
    }
    return records;
}

}  // namespace

// Benchmark full clustering pass; fresh storage each iteration so every finding is new
static void BM_DuplicateDetect(benchmark::State& state) {
    auto records = make_records(static_cast<std::size_t>(state.range(0)));
    DuplicateDetector detector(7, Money::from_units(500));

    for (auto _ : state) {
        state.PauseTiming();
        MemoryStorage storage;
        (void)storage.import(records);
        auto bills = storage.bills(kTenant);
        std::vector<VendorBaseline> baselines;
        auto tx = storage.begin(kTenant);
        state.ResumeTiming();

        DetectionContext ctx{
            .tenant_id = kTenant,
            .today = dates::make(2025, 1, 1),
            .bills = bills,
            .baselines = baselines,
            .tx = *tx
        };
        benchmark::DoNotOptimize(detector.detect(ctx));
        tx->commit();
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_DuplicateDetect)->Range(100, 10000);

// Benchmark a rerun where every finding already exists (insert-or-skip path)
static void BM_DuplicateRerun(benchmark::State& state) {
    auto records = make_records(static_cast<std::size_t>(state.range(0)));
    DuplicateDetector detector(7, Money::from_units(500));
    MemoryStorage storage;
    (void)storage.import(records);
    auto bills = storage.bills(kTenant);
    std::vector<VendorBaseline> baselines;

    for (auto _ : state) {
        auto tx = storage.begin(kTenant);
        DetectionContext ctx{
            .tenant_id = kTenant,
            .today = dates::make(2025, 1, 1),
            .bills = bills,
            .baselines = baselines,
            .tx = *tx
        };
        benchmark::DoNotOptimize(detector.detect(ctx));
        tx->commit();
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_DuplicateRerun)->Range(100, 10000);

BENCHMARK_MAIN();
