#pragma once

#include <string>
#include <vector>
#include <core/job.hpp>
#include <core/job_info.hpp>

// YAML export for downstream tools. Field names are stable:
//   state_attribute_text, state, jb_job_number, jat_prio, jb_name, jb_owner,
//   start_time, submitted_time, slots, tasks (omitted when absent),
//   task_id (only when a task id is set)
std::string emit_jobs_yaml(const JobList& jobs);

// Queues with their raw resources plus whichever typed metrics coerce
std::string emit_queues_yaml(const std::vector<Queue>& queues);
