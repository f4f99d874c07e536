#include "engine/detection_scheduler.hpp"
#include <boost/asio/post.hpp>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace apwatch {

DetectionScheduler::DetectionScheduler(const DetectionOrchestrator& orchestrator,
                                       std::size_t worker_threads)
    : orchestrator_(orchestrator)
    , pool_(worker_threads == 0 ? 1 : worker_threads)
{
    spdlog::debug("Detection scheduler started with {} workers", worker_threads);
}

DetectionScheduler::~DetectionScheduler() {
    shutdown();
}

DetectionScheduler::Strand& DetectionScheduler::strand_for(TenantId tenant) {
    auto it = strands_.find(tenant);
    if (it == strands_.end()) {
        it = strands_.emplace(tenant, boost::asio::make_strand(pool_.get_executor())).first;
    }
    return it->second;
}

std::future<Result<RunSummary>> DetectionScheduler::submit(TenantId tenant, Date today) {
    auto task = std::make_shared<std::packaged_task<Result<RunSummary>()>>(
        [this, tenant, today]() {
            return orchestrator_.run(tenant, today);
        }
    );
    auto future = task->get_future();

    std::lock_guard lock(strands_mutex_);
    if (stopped_) {
        throw std::logic_error("DetectionScheduler is shut down");
    }
    boost::asio::post(strand_for(tenant), [task]() { (*task)(); });
    return future;
}

std::vector<TenantRunResult> DetectionScheduler::run_all(const std::vector<TenantId>& tenants,
                                                         Date today) {
    std::vector<std::future<Result<RunSummary>>> futures;
    futures.reserve(tenants.size());
    for (TenantId tenant : tenants) {
        futures.push_back(submit(tenant, today));
    }

    std::vector<TenantRunResult> results;
    results.reserve(tenants.size());
    for (std::size_t i = 0; i < tenants.size(); ++i) {
        results.push_back(TenantRunResult{
            .tenant_id = tenants[i],
            .result = futures[i].get()
        });
    }

    std::size_t failed = 0;
    for (const auto& r : results) {
        if (r.result.is_err()) {
            ++failed;
        }
    }
    spdlog::info("Batch detection finished: {} tenants, {} failed", results.size(), failed);
    return results;
}

void DetectionScheduler::shutdown() {
    {
        std::lock_guard lock(strands_mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }
    pool_.join();
}

}  // namespace apwatch
