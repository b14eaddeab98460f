#include "task.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <regex>

static const std::regex& task_range_regex() {
    static const std::regex re(TASK_RANGE_PATTERN);
    return re;
}

TaskForm Task::form() const {
    if (source.find(':') != std::string::npos) return TaskForm::Range;
    if (task_id == 0) return TaskForm::None;
    return TaskForm::Plain;
}

Result<Task> decode_task(const std::string& text) {
    Task task;
    task.source = text;

    // Range form is kept verbatim; only plain ids get a numeric value
    if (text.empty() || text.find(':') != std::string::npos) {
        return Result<Task>::Ok(task);
    }

    auto id = parse_int64(text);
    if (!id) {
        gestat_log(fmt::format("task: cannot parse task identifier '{}'", text));
        return Result<Task>::Err(ErrorKind::Parse,
            fmt::format("invalid task identifier '{}'", text));
    }
    task.task_id = *id;
    return Result<Task>::Ok(task);
}

std::string encode_task(const Task& task) {
    switch (task.form()) {
        case TaskForm::Range:
            return task.source;
        case TaskForm::None:
            return "";
        case TaskForm::Plain:
            return std::to_string(task.task_id);
    }
    return "";
}

bool contains_task_range(const std::string& source) {
    return std::regex_search(source, task_range_regex());
}

Result<TaskRange> parse_task_range(const std::string& source) {
    std::smatch m;
    if (!std::regex_search(source, m, task_range_regex())) {
        return Result<TaskRange>::Err(ErrorKind::Domain,
            fmt::format("'{}' does not describe a task range", source));
    }

    std::string identifier = m.str();
    auto colon = identifier.find(':');
    std::string span = identifier.substr(0, colon);
    std::string step_text = identifier.substr(colon + 1);
    auto dash = span.find('-');

    auto start = parse_int64(span.substr(0, dash));
    auto end = parse_int64(span.substr(dash + 1));
    auto step = parse_int64(step_text);
    if (!start || !end || !step) {
        return Result<TaskRange>::Err(ErrorKind::Parse,
            fmt::format("task range '{}' does not fit in 64 bits", identifier));
    }

    if (*step <= 0) {
        return Result<TaskRange>::Err(ErrorKind::Domain,
            fmt::format("task range '{}' has non-positive step", identifier));
    }

    return Result<TaskRange>::Ok({*start, *end, *step});
}
