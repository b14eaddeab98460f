#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstdint>
#include <core/types.hpp>
#include <core/task.hpp>

// One Grid Engine job, or one array-task slot after range expansion.
// Timestamps stay in the scheduler's own text form.
struct Job {
    std::string state_attribute;   // state="running" / "pending" on <job_list>
    std::string state;             // short state code: "r", "qw", "Eqw", ...
    int64_t job_number = 0;
    double priority = 0.0;
    std::string name;
    std::string owner;
    std::string start_time;        // JAT_start_time (running jobs)
    std::string submission_time;   // JB_submission_time (pending jobs)
    int32_t slots = 0;
    Task tasks;
};

using JobFilter = std::function<bool(const Job&)>;
using JobLess = std::function<bool(const Job&, const Job&)>;
using JobIndexLess = std::function<bool(size_t, size_t)>;
using JobTransform = std::function<Job(const Job&)>;

// Ordered job collection. filter() and map() return new lists; sort()
// reorders in place and returns *this so calls chain:
//
//   jobs.filter(running()).filter(owner_is("alice")).sort(by_priority);
//
// Not internally synchronized: concurrent readers are fine, sorting needs
// a single writer or external locking.
class JobList {
public:
    JobList() = default;
    JobList(std::vector<Job> jobs) : jobs_(std::move(jobs)) {}
    JobList(std::initializer_list<Job> jobs) : jobs_(jobs) {}

    void push_back(Job job) { jobs_.push_back(std::move(job)); }
    void append(const JobList& other);

    size_t size() const { return jobs_.size(); }
    bool empty() const { return jobs_.empty(); }
    const Job& operator[](size_t i) const { return jobs_[i]; }
    Job& operator[](size_t i) { return jobs_[i]; }
    std::vector<Job>::const_iterator begin() const { return jobs_.begin(); }
    std::vector<Job>::const_iterator end() const { return jobs_.end(); }
    const std::vector<Job>& jobs() const { return jobs_; }

    // Jobs for which `pred` holds, in original relative order
    JobList filter(const JobFilter& pred) const;

    // Sort in place with an element comparator
    JobList& sort(const JobLess& less);

    // Sort in place with a comparator over positions in the list as it
    // stood before the call. Not stable.
    JobList& sort_by_index(const JobIndexLess& less);

    JobList map(const JobTransform& fn) const;

    // Replace every range-bearing job with its expansion; other jobs are
    // copied as-is. The first failed expansion fails the whole call.
    Result<JobList> expand_task_ranges() const;

private:
    std::vector<Job> jobs_;
};

// Same as jobs.filter(pred)
JobList filter_jobs(const JobList& jobs, const JobFilter& pred);

bool is_job_running(const Job& job);

// True when the job's tasks source contains a "<start>-<end>:<step>" range
bool job_contains_task_range(const Job& job);

// Upper bound on the clones a single range may expand to
constexpr int64_t MAX_EXPANDED_TASKS = 1000000;

// Materialize a range-bearing job as one clone per task id
// (start, start+step, ... <= end), ascending, with tasks.task_id set.
// Domain when the job has no range, the step is not positive,
// start > end or the range holds more than MAX_EXPANDED_TASKS ids;
// Parse when a bound does not fit in 64 bits.
Result<JobList> extrapolate_tasks_to_jobs(const Job& original);
