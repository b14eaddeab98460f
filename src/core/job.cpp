#include "job.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <numeric>

void JobList::append(const JobList& other) {
    jobs_.insert(jobs_.end(), other.jobs_.begin(), other.jobs_.end());
}

JobList JobList::filter(const JobFilter& pred) const {
    JobList out;
    for (const auto& j : jobs_) {
        if (pred(j)) out.jobs_.push_back(j);
    }
    return out;
}

JobList& JobList::sort(const JobLess& less) {
    std::sort(jobs_.begin(), jobs_.end(), less);
    return *this;
}

JobList& JobList::sort_by_index(const JobIndexLess& less) {
    std::vector<size_t> order(jobs_.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), less);

    std::vector<Job> sorted;
    sorted.reserve(jobs_.size());
    for (size_t i : order) sorted.push_back(std::move(jobs_[i]));
    jobs_ = std::move(sorted);
    return *this;
}

JobList JobList::map(const JobTransform& fn) const {
    JobList out;
    out.jobs_.reserve(jobs_.size());
    for (const auto& j : jobs_) out.jobs_.push_back(fn(j));
    return out;
}

Result<JobList> JobList::expand_task_ranges() const {
    JobList out;
    for (const auto& j : jobs_) {
        if (!job_contains_task_range(j)) {
            out.jobs_.push_back(j);
            continue;
        }
        auto expanded = extrapolate_tasks_to_jobs(j);
        if (expanded.is_err()) return expanded;
        out.append(expanded.value);
    }
    return Result<JobList>::Ok(std::move(out));
}

JobList filter_jobs(const JobList& jobs, const JobFilter& pred) {
    return jobs.filter(pred);
}

bool is_job_running(const Job& job) {
    return job.state == "r";
}

bool job_contains_task_range(const Job& job) {
    return contains_task_range(job.tasks.source);
}

Result<JobList> extrapolate_tasks_to_jobs(const Job& original) {
    if (!job_contains_task_range(original)) {
        return Result<JobList>::Err(ErrorKind::Domain,
            fmt::format("job {} does not indicate a range of tasks ('{}')",
                        original.job_number, original.tasks.source));
    }

    auto range = parse_task_range(original.tasks.source);
    if (range.is_err()) {
        gestat_log(fmt::format("expand: job {}: {}", original.job_number, range.error));
        return Result<JobList>::Fail(range);
    }

    const TaskRange& r = range.value;
    if (r.start > r.end) {
        return Result<JobList>::Err(ErrorKind::Domain,
            fmt::format("job {}: task range '{}' starts after it ends",
                        original.job_number, original.tasks.source));
    }

    // Bounds are non-negative, so end - start cannot overflow
    int64_t count = (r.end - r.start) / r.step + 1;
    if (count > MAX_EXPANDED_TASKS) {
        gestat_log(fmt::format("expand: job {}: {} tasks in '{}'",
                               original.job_number, count, original.tasks.source));
        return Result<JobList>::Err(ErrorKind::Domain,
            fmt::format("job {}: task range '{}' expands to {} tasks (limit {})",
                        original.job_number, original.tasks.source, count, MAX_EXPANDED_TASKS));
    }

    JobList out;
    for (int64_t i = r.start; ; i += r.step) {
        Job clone = original;
        clone.tasks.task_id = i;
        out.push_back(std::move(clone));
        // Stop before i + step could pass end (or overflow int64)
        if (r.end - i < r.step) break;
    }
    return Result<JobList>::Ok(std::move(out));
}
