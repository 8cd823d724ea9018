#pragma once

#include <string>
#include <vector>
#include <clusterlink/core/job.hpp>
#include <clusterlink/core/types.hpp>
#include "job_cache.hpp"
#include "scheduler.hpp"
#include "transfer.hpp"

namespace clusterlink {

struct DiscoveryFailure {
    std::string directory;
    std::string reason;
};

struct SyncJobError {
    std::string job_id;
    Error error;
};

struct SyncReport {
    int jobs_checked = 0;       // jobs sent to the scheduler query
    int jobs_updated = 0;       // jobs whose state changed
    int cache_writes = 0;
    int discovered = 0;         // jobs imported from the cluster
    std::vector<DiscoveryFailure> discovery_failures;
    std::vector<SyncJobError> errors;

    bool clean() const { return errors.empty() && discovery_failures.empty(); }
};

// Pulls scheduler state into the job cache. The cluster is authoritative,
// except that a job already terminal in the cache is never touched again.
class Reconciler {
public:
    Reconciler(JobCache& cache, Scheduler& scheduler, TransferEngine& transfer);

    // project_base is where discovery looks for job directories when the
    // cache is empty.
    SyncReport sync(const std::string& project_base, StatusCallback on_status = nullptr);

private:
    void discover(const std::string& project_base, SyncReport& report, const StatusCallback& on_status);
    void apply(const JobStatusRecord& record, SyncReport& report);

    JobCache& cache_;
    Scheduler& scheduler_;
    TransferEngine& transfer_;
};

} // namespace clusterlink
