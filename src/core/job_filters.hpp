#pragma once

#include <string>
#include <ctime>
#include <core/job.hpp>

// Predicates for JobList::filter. All of them are pure and can be chained.

JobFilter state_is(const std::string& state);
JobFilter owner_is(const std::string& owner);
JobFilter name_contains(const std::string& text);
JobFilter running();
JobFilter pending();

// ── Time windows ─────────────────────────────────────────────
// A job whose timestamp is empty or unparseable never matches; the parse
// failure is written to the debug log. Bounds are exclusive.

JobFilter submitted_before(std::time_t t);
JobFilter submitted_after(std::time_t t);
JobFilter submitted_between(std::time_t start, std::time_t end);
JobFilter started_before(std::time_t t);
JobFilter started_after(std::time_t t);
