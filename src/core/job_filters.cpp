#include "job_filters.hpp"
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>

JobFilter state_is(const std::string& state) {
    return [state](const Job& j) { return j.state == state; };
}

JobFilter owner_is(const std::string& owner) {
    return [owner](const Job& j) { return j.owner == owner; };
}

JobFilter name_contains(const std::string& text) {
    return [text](const Job& j) { return j.name.find(text) != std::string::npos; };
}

JobFilter running() {
    return [](const Job& j) { return is_job_running(j); };
}

JobFilter pending() {
    return [](const Job& j) { return j.state_attribute == "pending"; };
}

// Parse a job timestamp for window matching; logs and returns nullopt on failure
static std::optional<std::time_t> job_time(const Job& j, const std::string& ts,
                                           const char* field) {
    auto t = parse_scheduler_time(ts);
    if (!t) {
        gestat_log(fmt::format("filter: job {} has unparseable {} '{}', excluded",
                               j.job_number, field, ts));
    }
    return t;
}

JobFilter submitted_before(std::time_t t) {
    return [t](const Job& j) {
        auto jt = job_time(j, j.submission_time, "submission time");
        return jt && *jt < t;
    };
}

JobFilter submitted_after(std::time_t t) {
    return [t](const Job& j) {
        auto jt = job_time(j, j.submission_time, "submission time");
        return jt && *jt > t;
    };
}

JobFilter submitted_between(std::time_t start, std::time_t end) {
    return [start, end](const Job& j) {
        auto jt = job_time(j, j.submission_time, "submission time");
        return jt && *jt > start && *jt < end;
    };
}

JobFilter started_before(std::time_t t) {
    return [t](const Job& j) {
        auto jt = job_time(j, j.start_time, "start time");
        return jt && *jt < t;
    };
}

JobFilter started_after(std::time_t t) {
    return [t](const Job& j) {
        auto jt = job_time(j, j.start_time, "start time");
        return jt && *jt > t;
    };
}
