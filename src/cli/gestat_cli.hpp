#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/config.hpp>
#include <core/job.hpp>
#include <core/job_info.hpp>

// Options shared by the jobs/queues/expand commands. Unset optionals fall
// back to the loaded Config.
struct CommandOptions {
    std::string owner;
    std::string state;
    std::optional<bool> expand;
    std::optional<OutputFormat> format;
    std::optional<JobSortKey> sort;
    std::vector<std::string> positional;   // interpreted by each command
};

// Parse "[args...] [--owner U] [--state S] [--expand] [--yaml] [--sort KEY]".
// Unknown flags and missing flag values are Parse errors.
Result<CommandOptions> parse_command_options(const std::vector<std::string>& args);

// Ordering used for `jobs --sort`
JobLess job_order(JobSortKey key);

// One qstat-like row per job
std::string format_job_table(const JobList& jobs);

class GestatCLI {
public:
    GestatCLI();

    int run_jobs(const std::vector<std::string>& args);
    int run_queues(const std::vector<std::string>& args);
    int run_expand(const std::vector<std::string>& args);
    int run_init();

private:
    // Decode the snapshot at `file`, or the configured source when empty
    Result<JobInfo> load_snapshot(const std::string& file);

    Config config_;
};
