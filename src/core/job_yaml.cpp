#include "job_yaml.hpp"
#include <yaml-cpp/yaml.h>

static void emit_job(YAML::Emitter& out, const Job& j) {
    out << YAML::BeginMap;
    out << YAML::Key << "state_attribute_text" << YAML::Value << j.state_attribute;
    out << YAML::Key << "state" << YAML::Value << j.state;
    out << YAML::Key << "jb_job_number" << YAML::Value << j.job_number;
    out << YAML::Key << "jat_prio" << YAML::Value << j.priority;
    out << YAML::Key << "jb_name" << YAML::Value << j.name;
    out << YAML::Key << "jb_owner" << YAML::Value << j.owner;
    out << YAML::Key << "start_time" << YAML::Value << j.start_time;
    out << YAML::Key << "submitted_time" << YAML::Value << j.submission_time;
    out << YAML::Key << "slots" << YAML::Value << j.slots;

    std::string tasks = encode_task(j.tasks);
    if (!tasks.empty()) {
        out << YAML::Key << "tasks" << YAML::Value << tasks;
    }
    if (j.tasks.task_id != 0) {
        out << YAML::Key << "task_id" << YAML::Value << j.tasks.task_id;
    }
    out << YAML::EndMap;
}

std::string emit_jobs_yaml(const JobList& jobs) {
    YAML::Emitter out;
    out << YAML::BeginSeq;
    for (const auto& j : jobs) {
        emit_job(out, j);
    }
    out << YAML::EndSeq;
    return out.c_str();
}

static void emit_storage(YAML::Emitter& out, const char* key, const Result<StorageValue>& sv) {
    if (sv.is_err()) return;
    out << YAML::Key << key << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "size" << YAML::Value << sv.value.size;
    out << YAML::Key << "scale" << YAML::Value << sv.value.scale;
    out << YAML::Key << "bytes" << YAML::Value << sv.value.bytes;
    out << YAML::EndMap;
}

std::string emit_queues_yaml(const std::vector<Queue>& queues) {
    YAML::Emitter out;
    out << YAML::BeginSeq;
    for (const auto& q : queues) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << q.name;
        out << YAML::Key << "qtype" << YAML::Value << q.qtype;
        out << YAML::Key << "slots_used" << YAML::Value << q.slots_used;
        out << YAML::Key << "slots_resv" << YAML::Value << q.slots_reserved;
        out << YAML::Key << "slots_total" << YAML::Value << q.slots_total;
        out << YAML::Key << "arch" << YAML::Value << q.arch;
        out << YAML::Key << "state" << YAML::Value << q.state;
        out << YAML::Key << "jobs" << YAML::Value << q.jobs.size();

        const ResourceList& r = q.resources;
        out << YAML::Key << "metrics" << YAML::Value << YAML::BeginMap;
        for (const char* window : {"short", "medium", "long"}) {
            auto load = r.load(window);
            if (load.is_ok()) {
                out << YAML::Key << (std::string("load_") + window) << YAML::Value << load.value;
            }
        }
        auto nproc = r.num_processors();
        if (nproc.is_ok()) out << YAML::Key << "num_proc" << YAML::Value << nproc.value;
        emit_storage(out, "mem_free", r.free_memory());
        emit_storage(out, "mem_total", r.total_memory());
        emit_storage(out, "mem_used", r.memory_used());
        emit_storage(out, "swap_free", r.free_swap());
        emit_storage(out, "swap_total", r.total_swap());
        emit_storage(out, "swap_used", r.swap_used());
        emit_storage(out, "virtual_free", r.free_virtual_memory());
        emit_storage(out, "virtual_total", r.total_virtual());
        out << YAML::EndMap;

        out << YAML::Key << "resources" << YAML::Value << YAML::BeginSeq;
        for (const auto& res : r) {
            out << YAML::Flow << YAML::BeginMap;
            out << YAML::Key << "name" << YAML::Value << res.name;
            out << YAML::Key << "type" << YAML::Value << res.type;
            out << YAML::Key << "value" << YAML::Value << res.value;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;

        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    return out.c_str();
}
