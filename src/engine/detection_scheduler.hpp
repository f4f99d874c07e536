#pragma once

#include "detection/orchestrator.hpp"
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <future>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace apwatch {

/// Result of one tenant's run within a batch
struct TenantRunResult {
    TenantId tenant_id;
    Result<RunSummary> result;
};

/// Runs detection for many tenants on a worker pool
/// Runs of different tenants execute in parallel; runs of the same tenant are
/// serialized on a per-tenant strand and never overlap.
class DetectionScheduler {
public:
    /// @param orchestrator Shared, stateless orchestrator (must outlive the scheduler)
    /// @param worker_threads Pool size
    DetectionScheduler(const DetectionOrchestrator& orchestrator, std::size_t worker_threads);

    ~DetectionScheduler();

    // Non-copyable, non-movable
    DetectionScheduler(const DetectionScheduler&) = delete;
    DetectionScheduler& operator=(const DetectionScheduler&) = delete;

    /// Queue a run for `tenant`
    [[nodiscard]] std::future<Result<RunSummary>> submit(TenantId tenant, Date today);

    /// Queue one run per tenant and wait for all of them
    /// @return Results in the order of `tenants`
    [[nodiscard]] std::vector<TenantRunResult> run_all(const std::vector<TenantId>& tenants, Date today);

    /// Finish queued work and stop the pool
    void shutdown();

private:
    using Strand = boost::asio::strand<boost::asio::thread_pool::executor_type>;

    Strand& strand_for(TenantId tenant);

    const DetectionOrchestrator& orchestrator_;
    boost::asio::thread_pool pool_;

    std::mutex strands_mutex_;
    std::unordered_map<TenantId, Strand> strands_;
    bool stopped_{false};
};

}  // namespace apwatch
