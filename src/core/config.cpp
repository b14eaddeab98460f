#include "config.hpp"
#include <platform/platform.hpp>
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

std::optional<OutputFormat> parse_output_format(const std::string& s) {
    if (s == "table") return OutputFormat::Table;
    if (s == "yaml") return OutputFormat::Yaml;
    return std::nullopt;
}

std::optional<JobSortKey> parse_sort_key(const std::string& s) {
    if (s == "number") return JobSortKey::Number;
    if (s == "priority") return JobSortKey::Priority;
    if (s == "submitted") return JobSortKey::Submitted;
    return std::nullopt;
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".gestat";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / "gestat.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# gestat configuration
# Project-local overrides go in ./gestat.yaml

# qstat XML snapshot to read when no file is given ("-" reads stdin).
# Produce one with: qstat -u '*' -f -xml -F > /tmp/qstat.xml
source: "-"

# Expand compressed array-task ranges ("40-55:5") into one row per task
expand_tasks: false

# Output format: table or yaml
format: table

# Job ordering: number, priority or submitted
sort: number

# Debug log (default: <tmp>/gestat_debug.log)
# log_path: "/tmp/gestat_debug.log"
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err(ErrorKind::Upstream,
                "Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorKind::Upstream,
            "Failed to write config file: " + std::string(e.what()));
    }
}

static Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<std::string>::Err(ErrorKind::Upstream, "cannot read " + path.string());
    }
    return Result<std::string>::Ok(
        std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>()));
}

Result<void> Config::overlay(const std::string& text, const std::string& origin) {
    try {
        YAML::Node root = YAML::Load(text);
        if (!root || root.IsNull()) {
            return Result<void>::Ok();
        }
        if (!root.IsMap()) {
            return Result<void>::Err(ErrorKind::Parse, origin + ": expected a mapping");
        }

        if (root["source"]) {
            source_ = root["source"].as<std::string>();
        }
        if (root["expand_tasks"]) {
            expand_tasks_ = root["expand_tasks"].as<bool>();
        }
        if (root["format"]) {
            auto f = parse_output_format(root["format"].as<std::string>());
            if (!f) {
                return Result<void>::Err(ErrorKind::Parse,
                    fmt::format("{}: unknown format '{}'", origin, root["format"].as<std::string>()));
            }
            format_ = *f;
        }
        if (root["sort"]) {
            auto k = parse_sort_key(root["sort"].as<std::string>());
            if (!k) {
                return Result<void>::Err(ErrorKind::Parse,
                    fmt::format("{}: unknown sort key '{}'", origin, root["sort"].as<std::string>()));
            }
            sort_key_ = *k;
        }
        if (root["log_path"]) {
            log_path_ = root["log_path"].as<std::string>();
        }

        return Result<void>::Ok();
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(ErrorKind::Parse,
            fmt::format("Failed to parse {}: {}", origin, e.what()));
    }
}

Result<Config> Config::from_yaml(const std::string& text) {
    Config config;
    auto r = config.overlay(text, "config");
    if (r.is_err()) return Result<Config>::Fail(r);
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Err(ErrorKind::NotFound,
            "Global config not found at " + get_global_config_path().string());
    }

    auto text = read_file(get_global_config_path());
    if (text.is_err()) return Result<Config>::Fail(text);

    Config config;
    auto r = config.overlay(text.value, get_global_config_path().string());
    if (r.is_err()) return Result<Config>::Fail(r);
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_project(const fs::path& dir) {
    if (!project_config_exists(dir)) {
        return Result<Config>::Err(ErrorKind::NotFound,
            "Project config not found at " + get_project_config_path(dir).string());
    }

    auto text = read_file(get_project_config_path(dir));
    if (text.is_err()) return Result<Config>::Fail(text);

    Config config;
    auto r = config.overlay(text.value, get_project_config_path(dir).string());
    if (r.is_err()) return Result<Config>::Fail(r);
    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& project_dir) {
    Config config;

    // Global first, then the project file on top of it
    for (const fs::path& path : {get_global_config_path(), get_project_config_path(project_dir)}) {
        if (!fs::exists(path)) continue;

        auto text = read_file(path);
        if (text.is_err()) return Result<Config>::Fail(text);

        auto r = config.overlay(text.value, path.string());
        if (r.is_err()) {
            gestat_log("config: " + r.error);
            return Result<Config>::Fail(r);
        }
    }

    return Result<Config>::Ok(config);
}
