#include "gestat_cli.hpp"
#include "theme.hpp"
#include <core/job_filters.hpp>
#include <core/job_source.hpp>
#include <core/job_yaml.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <iostream>

// ── Option parsing ───────────────────────────────────────────

Result<CommandOptions> parse_command_options(const std::vector<std::string>& args) {
    CommandOptions opts;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];

        auto need_value = [&](const std::string& flag) -> Result<std::string> {
            if (i + 1 >= args.size()) {
                return Result<std::string>::Err(ErrorKind::Parse, flag + " needs a value");
            }
            return Result<std::string>::Ok(args[++i]);
        };

        if (a == "--owner" || a == "--state" || a == "--sort") {
            auto v = need_value(a);
            if (v.is_err()) return Result<CommandOptions>::Fail(v);
            if (a == "--owner") {
                opts.owner = v.value;
            } else if (a == "--state") {
                opts.state = v.value;
            } else {
                opts.sort = parse_sort_key(v.value);
                if (!opts.sort) {
                    return Result<CommandOptions>::Err(ErrorKind::Parse,
                        "unknown sort key '" + v.value + "' (number, priority, submitted)");
                }
            }
        } else if (a == "--expand") {
            opts.expand = true;
        } else if (a == "--no-expand") {
            opts.expand = false;
        } else if (a == "--yaml") {
            opts.format = OutputFormat::Yaml;
        } else if (a == "--table") {
            opts.format = OutputFormat::Table;
        } else if (a.size() > 1 && a[0] == '-' && a != "-") {
            return Result<CommandOptions>::Err(ErrorKind::Parse, "unknown option " + a);
        } else {
            opts.positional.push_back(a);
        }
    }

    return Result<CommandOptions>::Ok(opts);
}

// ── Ordering and rendering ───────────────────────────────────

static bool by_number(const Job& a, const Job& b) {
    if (a.job_number != b.job_number) return a.job_number < b.job_number;
    return a.tasks.task_id < b.tasks.task_id;
}

// Pending jobs carry a submission time, running ones a start time
static const std::string& job_timestamp(const Job& j) {
    return j.submission_time.empty() ? j.start_time : j.submission_time;
}

JobLess job_order(JobSortKey key) {
    switch (key) {
        case JobSortKey::Number:
            return by_number;
        case JobSortKey::Priority:
            return [](const Job& a, const Job& b) {
                if (a.priority != b.priority) return a.priority > b.priority;
                return by_number(a, b);
            };
        case JobSortKey::Submitted:
            return [](const Job& a, const Job& b) {
                auto ta = parse_scheduler_time(job_timestamp(a));
                auto tb = parse_scheduler_time(job_timestamp(b));
                // Unparseable timestamps sort last
                if (ta.has_value() != tb.has_value()) return ta.has_value();
                if (ta && tb && *ta != *tb) return *ta < *tb;
                return by_number(a, b);
            };
    }
    return by_number;
}

static std::string task_column(const Task& t) {
    if (t.task_id != 0) return std::to_string(t.task_id);
    return encode_task(t);
}

std::string format_job_table(const JobList& jobs) {
    std::string s = fmt::format("{:<10} {:<7} {:<16} {:<12} {:<5} {:<19} {:>6} {:>5} {}\n",
                                "job-ID", "prior", "name", "user", "state",
                                "submit/start at", "age", "slots", "ja-task-ID");
    for (const auto& j : jobs) {
        const std::string& ts = job_timestamp(j);
        s += fmt::format("{:<10} {:<7.5f} {:<16.16} {:<12.12} {:<5} {:<19.19} {:>6} {:>5} {}\n",
                         j.job_number, j.priority, j.name, j.owner, j.state,
                         ts, format_duration(ts), j.slots, task_column(j.tasks));
    }
    return s;
}

// ── Commands ─────────────────────────────────────────────────

GestatCLI::GestatCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config_ = config_result.value;
    } else {
        std::cerr << theme::fail(config_result.error);
    }
    set_gestat_log_path(config_.log_path());
}

Result<JobInfo> GestatCLI::load_snapshot(const std::string& file) {
    FileJobInfoSource source(file.empty() ? config_.source() : file);
    gestat_log("reading snapshot from " + source.describe());

    auto xml = source.fetch();
    if (xml.is_err()) return Result<JobInfo>::Fail(xml);
    return parse_job_info(xml.value);
}

int GestatCLI::run_jobs(const std::vector<std::string>& args) {
    auto opts = parse_command_options(args);
    if (opts.is_err()) {
        std::cout << theme::fail(opts.error);
        return 1;
    }
    const CommandOptions& o = opts.value;

    auto info = load_snapshot(o.positional.empty() ? "" : o.positional[0]);
    if (info.is_err()) {
        std::cout << theme::fail(info.error);
        return 1;
    }

    JobList jobs = collect_jobs(info.value);
    if (!o.owner.empty()) jobs = jobs.filter(owner_is(o.owner));
    if (!o.state.empty()) jobs = jobs.filter(state_is(o.state));

    if (o.expand.value_or(config_.expand_tasks())) {
        auto expanded = jobs.expand_task_ranges();
        if (expanded.is_err()) {
            std::cout << theme::fail(expanded.error);
            return 1;
        }
        jobs = expanded.value;
    }

    jobs.sort(job_order(o.sort.value_or(config_.sort_key())));

    if (o.format.value_or(config_.format()) == OutputFormat::Yaml) {
        std::cout << emit_jobs_yaml(jobs) << "\n";
    } else {
        std::cout << format_job_table(jobs);
    }
    return 0;
}

// Render a metric result: value, "-" when absent, "?" when it didn't coerce
template <typename T, typename F>
static std::string metric(const Result<T>& r, F render) {
    if (r.is_ok()) return render(r.value);
    return r.kind == ErrorKind::NotFound ? "-" : "?";
}

static std::string storage_pair(const Result<StorageValue>& used, const Result<StorageValue>& total) {
    auto show = [](const StorageValue& v) { return fmt::format("{}{}", v.size, v.scale); };
    return metric(used, show) + " / " + metric(total, show);
}

int GestatCLI::run_queues(const std::vector<std::string>& args) {
    auto opts = parse_command_options(args);
    if (opts.is_err()) {
        std::cout << theme::fail(opts.error);
        return 1;
    }
    const CommandOptions& o = opts.value;

    auto info = load_snapshot(o.positional.empty() ? "" : o.positional[0]);
    if (info.is_err()) {
        std::cout << theme::fail(info.error);
        return 1;
    }

    if (o.format.value_or(config_.format()) == OutputFormat::Yaml) {
        std::cout << emit_queues_yaml(info.value.queues) << "\n";
        return 0;
    }

    auto num = [](double v) { return fmt::format("{:.2f}", v); };
    for (const auto& q : info.value.queues) {
        const ResourceList& r = q.resources;
        std::cout << theme::section(q.name.empty() ? "(no queue)" : q.name);
        std::cout << theme::kv("type", q.qtype);
        std::cout << theme::kv("slots", fmt::format("{} used / {} reserved / {} total",
                                                    q.slots_used, q.slots_reserved, q.slots_total));
        if (!q.state.empty()) std::cout << theme::kv("state", theme::yellow(q.state));
        std::cout << theme::kv("load", fmt::format("{} {} {}",
                                                   metric(r.load("short"), num),
                                                   metric(r.load("medium"), num),
                                                   metric(r.load("long"), num)));
        std::cout << theme::kv("processors",
                               metric(r.num_processors(), [](int32_t n) { return std::to_string(n); }));
        std::cout << theme::kv("memory", storage_pair(r.memory_used(), r.total_memory()));
        std::cout << theme::kv("swap", storage_pair(r.swap_used(), r.total_swap()));
        std::cout << theme::kv("virtual free", storage_pair(r.free_virtual_memory(), r.total_virtual()));
        std::cout << theme::kv("jobs", std::to_string(q.jobs.size()));
    }
    std::cout << theme::section("Pending");
    std::cout << theme::kv("jobs", std::to_string(info.value.pending.size()));
    return 0;
}

int GestatCLI::run_expand(const std::vector<std::string>& args) {
    auto opts = parse_command_options(args);
    if (opts.is_err()) {
        std::cout << theme::fail(opts.error);
        return 1;
    }
    const CommandOptions& o = opts.value;

    if (o.positional.empty()) {
        std::cout << theme::fail("Missing job number.");
        std::cout << theme::step("Usage: gestat expand <job-number> [file]");
        return 1;
    }
    auto number = parse_int64(o.positional[0]);
    if (!number) {
        std::cout << theme::fail("Invalid job number: " + o.positional[0]);
        return 1;
    }

    auto info = load_snapshot(o.positional.size() > 1 ? o.positional[1] : "");
    if (info.is_err()) {
        std::cout << theme::fail(info.error);
        return 1;
    }

    int64_t wanted = *number;
    JobList matches = collect_jobs(info.value).filter(
        [wanted](const Job& j) { return j.job_number == wanted; });
    if (matches.empty()) {
        std::cout << theme::fail(fmt::format("Job {} not found.", wanted));
        return 1;
    }

    auto expanded_result = matches.expand_task_ranges();
    if (expanded_result.is_err()) {
        std::cout << theme::fail(fmt::format("{} ({})", expanded_result.error,
                                             error_kind_name(expanded_result.kind)));
        return 1;
    }
    JobList& expanded = expanded_result.value;
    expanded.sort(job_order(JobSortKey::Number));

    if (o.format.value_or(config_.format()) == OutputFormat::Yaml) {
        std::cout << emit_jobs_yaml(expanded) << "\n";
    } else {
        std::cout << format_job_table(expanded);
    }
    return 0;
}

int GestatCLI::run_init() {
    auto r = create_default_global_config();
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    std::cout << theme::ok("Config at " + get_global_config_path().string());
    return 0;
}
