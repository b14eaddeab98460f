#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/job.hpp>
#include <core/resource.hpp>
#include <core/job_source.hpp>

// One <Queue-List> entry from `qstat -f -xml`
struct Queue {
    std::string name;          // "all.q@node01"
    std::string qtype;         // "BIP"
    int slots_used = 0;
    int slots_reserved = 0;
    int slots_total = 0;
    std::string arch;
    std::string state;         // queue state flags ("d", "au", "" when healthy)
    ResourceList resources;
    JobList jobs;              // jobs running in this queue
};

// Whole `qstat -xml` document: running jobs grouped per queue plus the
// pending list.
struct JobInfo {
    std::vector<Queue> queues;
    JobList pending;
};

// Decode a qstat XML document. Malformed XML, a foreign root element or any
// job whose numeric fields / tasks fail to decode fails the whole document
// with Parse. Unknown elements are ignored.
Result<JobInfo> parse_job_info(const std::string& xml);

// Every queue's running jobs in queue order, then the pending jobs.
JobList collect_jobs(const JobInfo& info);

// fetch + parse + collect; all-or-nothing.
Result<JobList> get_jobs(JobInfoSource& source);

// get_jobs followed by filter(pred)
Result<JobList> get_jobs_with_filter(JobInfoSource& source, const JobFilter& pred);
