#pragma once

#include <string>
#include <cstdint>
#include <core/types.hpp>

// Matches a compressed array-task range anywhere in a string: "40-55:5"
constexpr const char* TASK_RANGE_PATTERN = R"(\d+-\d+:\d+)";

enum class TaskForm {
    None,   // no <tasks> element (or task id 0)
    Plain,  // single array-task id: "7"
    Range,  // compressed range: "40-55:5"
};

// The scheduler's <tasks> field. `source` keeps the text exactly as reported
// so a range survives a decode/encode round trip untouched; `task_id` is the
// numeric id for plain tasks and for clones produced by range expansion.
struct Task {
    std::string source;
    int64_t task_id = 0;

    TaskForm form() const;
    bool is_range() const { return form() == TaskForm::Range; }
};

// Parsed "<start>-<end>:<step>"
struct TaskRange {
    int64_t start = 0;
    int64_t end = 0;
    int64_t step = 0;
};

// Decode raw <tasks> text. A colon means range form (stored verbatim, id
// left at 0); anything else must be a base-10 int64 or decoding fails with
// Parse. Empty text decodes to an absent task.
Result<Task> decode_task(const std::string& text);

// Inverse of decode_task: range source verbatim, "" for an absent task,
// otherwise the decimal task id.
std::string encode_task(const Task& task);

// True when `source` contains TASK_RANGE_PATTERN.
bool contains_task_range(const std::string& source);

// Extract and parse the first range in `source`.
// Domain if there is none or the step is not positive, Parse on overflow.
Result<TaskRange> parse_task_range(const std::string& source);
