#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

enum class OutputFormat { Table, Yaml };

enum class JobSortKey { Number, Priority, Submitted };

class Config {
public:
    // Load global config from ~/.gestat/config.yaml
    static Result<Config> load_global();

    // Load project config from ./gestat.yaml
    static Result<Config> load_project(const fs::path& dir = fs::current_path());

    // Defaults, overlaid with the global config, overlaid with the project
    // config. Missing files are skipped; a malformed one is an error.
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Parse a config document directly (used by the loaders and tests)
    static Result<Config> from_yaml(const std::string& text);

    // Accessors
    const std::string& source() const { return source_; }
    bool expand_tasks() const { return expand_tasks_; }
    OutputFormat format() const { return format_; }
    JobSortKey sort_key() const { return sort_key_; }
    const std::string& log_path() const { return log_path_; }

public:
    Config() = default;

private:
    std::string source_ = "-";
    bool expand_tasks_ = false;
    OutputFormat format_ = OutputFormat::Table;
    JobSortKey sort_key_ = JobSortKey::Number;
    std::string log_path_;

    // Apply the keys present in `text` on top of the current values
    Result<void> overlay(const std::string& text, const std::string& origin);
};

// Parse "table"/"yaml" and "number"/"priority"/"submitted"
std::optional<OutputFormat> parse_output_format(const std::string& s);
std::optional<JobSortKey> parse_sort_key(const std::string& s);

// Helper to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// Create default global config
Result<void> create_default_global_config();
