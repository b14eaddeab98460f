#include <gtest/gtest.h>
#include <core/job.hpp>
#include <core/job_filters.hpp>

static Job make_job(int64_t number, const std::string& state, const std::string& owner,
                    double priority = 0.5, const std::string& tasks = "") {
    Job j;
    j.job_number = number;
    j.state = state;
    j.state_attribute = state == "r" ? "running" : "pending";
    j.owner = owner;
    j.name = "job" + std::to_string(number);
    j.priority = priority;
    j.slots = 1;
    j.tasks.source = tasks;
    return j;
}

static JobList make_jobs() {
    return {
        make_job(1, "r", "alice"),
        make_job(2, "r", "bob"),
        make_job(3, "qw", "alice"),
        make_job(4, "r", "alice"),
        make_job(5, "qw", "carol"),
    };
}

static std::vector<int64_t> numbers(const JobList& jobs) {
    std::vector<int64_t> out;
    for (const auto& j : jobs) out.push_back(j.job_number);
    return out;
}

// ── filter ──────────────────────────────────────────────────

TEST(JobList, FilterChain) {
    auto jobs = make_jobs();
    auto result = jobs.filter(running()).filter(owner_is("alice"));
    EXPECT_EQ(numbers(result), (std::vector<int64_t>{1, 4}));
}

TEST(JobList, FilterIsPure) {
    auto jobs = make_jobs();
    auto none = jobs.filter([](const Job&) { return false; });
    EXPECT_TRUE(none.empty());
    EXPECT_EQ(jobs.size(), 5u);
}

TEST(JobList, FilterJobsFreeFunction) {
    auto result = filter_jobs(make_jobs(), state_is("qw"));
    EXPECT_EQ(numbers(result), (std::vector<int64_t>{3, 5}));
}

// ── sort / map ──────────────────────────────────────────────

TEST(JobList, SortInPlaceAndChain) {
    JobList jobs = {make_job(3, "r", "a"), make_job(1, "r", "b"), make_job(2, "r", "c")};
    JobList& same = jobs.sort([](const Job& a, const Job& b) { return a.job_number < b.job_number; });
    EXPECT_EQ(&same, &jobs);
    EXPECT_EQ(numbers(jobs), (std::vector<int64_t>{1, 2, 3}));
}

TEST(JobList, SortByIndex) {
    JobList jobs = {make_job(1, "r", "a", 0.2), make_job(2, "r", "b", 0.9),
                    make_job(3, "r", "c", 0.5)};
    std::vector<double> prio;
    for (const auto& j : jobs) prio.push_back(j.priority);

    jobs.sort_by_index([&prio](size_t i, size_t k) { return prio[i] > prio[k]; });
    EXPECT_EQ(numbers(jobs), (std::vector<int64_t>{2, 3, 1}));
}

TEST(JobList, FilterThenSort) {
    auto jobs = make_jobs();
    auto result = jobs.filter(owner_is("alice"))
                      .sort([](const Job& a, const Job& b) { return a.job_number > b.job_number; });
    EXPECT_EQ(numbers(result), (std::vector<int64_t>{4, 3, 1}));
}

TEST(JobList, Map) {
    auto renamed = make_jobs().map([](const Job& j) {
        Job c = j;
        c.name = "x";
        return c;
    });
    ASSERT_EQ(renamed.size(), 5u);
    for (const auto& j : renamed) EXPECT_EQ(j.name, "x");
}

TEST(JobList, IsJobRunning) {
    EXPECT_TRUE(is_job_running(make_job(1, "r", "a")));
    EXPECT_FALSE(is_job_running(make_job(1, "qw", "a")));
    EXPECT_FALSE(is_job_running(make_job(1, "Eqw", "a")));
}

// ── Range detection and expansion ───────────────────────────

TEST(JobList, ContainsTaskRange) {
    EXPECT_TRUE(job_contains_task_range(make_job(1, "qw", "a", 0.5, "40-55:5")));
    EXPECT_FALSE(job_contains_task_range(make_job(1, "qw", "a", 0.5, "42")));
    EXPECT_FALSE(job_contains_task_range(make_job(1, "qw", "a", 0.5, "")));
}

TEST(JobList, Extrapolate) {
    Job original = make_job(77, "qw", "alice", 0.55, "40-55:5");
    original.submission_time = "2019-03-21T10:00:00";

    auto r = extrapolate_tasks_to_jobs(original);
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 4u);

    std::vector<int64_t> ids;
    for (const auto& j : r.value) {
        ids.push_back(j.tasks.task_id);
        EXPECT_EQ(j.job_number, 77);
        EXPECT_EQ(j.owner, "alice");
        EXPECT_EQ(j.name, original.name);
        EXPECT_EQ(j.state, "qw");
        EXPECT_DOUBLE_EQ(j.priority, 0.55);
        EXPECT_EQ(j.submission_time, original.submission_time);
        EXPECT_EQ(j.tasks.source, "40-55:5");
    }
    EXPECT_EQ(ids, (std::vector<int64_t>{40, 45, 50, 55}));
}

TEST(JobList, ExtrapolateStepPastEnd) {
    auto r = extrapolate_tasks_to_jobs(make_job(1, "qw", "a", 0.5, "1-10:4"));
    ASSERT_TRUE(r.is_ok());
    std::vector<int64_t> ids;
    for (const auto& j : r.value) ids.push_back(j.tasks.task_id);
    EXPECT_EQ(ids, (std::vector<int64_t>{1, 5, 9}));
}

TEST(JobList, ExtrapolateSingleTask) {
    auto r = extrapolate_tasks_to_jobs(make_job(1, "qw", "a", 0.5, "7-7:1"));
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 1u);
    EXPECT_EQ(r.value[0].tasks.task_id, 7);
}

TEST(JobList, ExtrapolatePlainTaskFails) {
    auto r = extrapolate_tasks_to_jobs(make_job(1, "r", "a", 0.5, "42"));
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Domain);
    EXPECT_TRUE(r.value.empty());
}

TEST(JobList, ExtrapolateZeroStepFails) {
    auto r = extrapolate_tasks_to_jobs(make_job(1, "qw", "a", 0.5, "1-10:0"));
    EXPECT_EQ(r.kind, ErrorKind::Domain);
    EXPECT_TRUE(r.value.empty());
}

TEST(JobList, ExtrapolateStartAfterEndFails) {
    auto r = extrapolate_tasks_to_jobs(make_job(1, "qw", "a", 0.5, "10-1:1"));
    EXPECT_EQ(r.kind, ErrorKind::Domain);
    EXPECT_TRUE(r.value.empty());
}

TEST(JobList, ExtrapolateNearInt64Max) {
    auto r = extrapolate_tasks_to_jobs(
        make_job(1, "qw", "a", 0.5, "9223372036854775806-9223372036854775807:5"));
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 1u);
    EXPECT_EQ(r.value[0].tasks.task_id, 9223372036854775806LL);
}

TEST(JobList, ExtrapolateTooManyTasksFails) {
    auto r = extrapolate_tasks_to_jobs(make_job(1, "qw", "a", 0.5, "1-99999999999:1"));
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Domain);
    EXPECT_TRUE(r.value.empty());
}

TEST(JobList, ExtrapolateLimitCountsIdsNotSpan) {
    // One past the limit fails; a wide range with a large step does not
    auto over = extrapolate_tasks_to_jobs(make_job(1, "qw", "a", 0.5, "1-1000001:1"));
    EXPECT_EQ(over.kind, ErrorKind::Domain);

    auto sparse = extrapolate_tasks_to_jobs(make_job(1, "qw", "a", 0.5, "1-99999999999:10000000"));
    ASSERT_TRUE(sparse.is_ok());
    EXPECT_EQ(sparse.value.size(), 10000u);
    EXPECT_EQ(sparse.value[9999].tasks.task_id, 99990000001LL);
}

TEST(JobList, ExpandTaskRanges) {
    JobList jobs = {make_job(1, "r", "a", 0.5, "3"),
                    make_job(2, "qw", "b", 0.5, "1-3:1"),
                    make_job(3, "qw", "c")};
    auto r = jobs.expand_task_ranges();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(numbers(r.value), (std::vector<int64_t>{1, 2, 2, 2, 3}));
    EXPECT_EQ(r.value[2].tasks.task_id, 2);
}

TEST(JobList, ExpandTaskRangesFailsAsWhole) {
    JobList jobs = {make_job(1, "qw", "a", 0.5, "1-3:1"), make_job(2, "qw", "b", 0.5, "5-1:1")};
    auto r = jobs.expand_task_ranges();
    EXPECT_EQ(r.kind, ErrorKind::Domain);
    EXPECT_TRUE(r.value.empty());
}
