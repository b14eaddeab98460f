#include "job_info.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <climits>
#include <cstring>
#include <memory>

// ── libxml2 helpers ──────────────────────────────────────────

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

static bool is_element(const xmlNode* node, const char* name) {
    return node->type == XML_ELEMENT_NODE &&
           std::strcmp(reinterpret_cast<const char*>(node->name), name) == 0;
}

// Trimmed text content of an element (all descendant text)
static std::string node_text(const xmlNode* node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) return "";
    std::string s(reinterpret_cast<const char*>(content));
    xmlFree(content);
    trim(s);
    return s;
}

static std::string node_attr(const xmlNode* node, const char* attr) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(attr));
    if (!value) return "";
    std::string s(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return s;
}

// ── Element decoders ─────────────────────────────────────────

static Result<Job> decode_job(const xmlNode* node) {
    Job job;
    job.state_attribute = node_attr(node, "state");

    for (const xmlNode* c = node->children; c; c = c->next) {
        if (c->type != XML_ELEMENT_NODE) continue;
        std::string text = node_text(c);

        if (is_element(c, "JB_job_number")) {
            auto n = parse_int64(text);
            if (!n) {
                return Result<Job>::Err(ErrorKind::Parse,
                    fmt::format("invalid JB_job_number '{}'", text));
            }
            job.job_number = *n;
        } else if (is_element(c, "JAT_prio")) {
            auto p = parse_double(text);
            if (!p) {
                return Result<Job>::Err(ErrorKind::Parse,
                    fmt::format("job {}: invalid JAT_prio '{}'", job.job_number, text));
            }
            job.priority = *p;
        } else if (is_element(c, "JB_name")) {
            job.name = text;
        } else if (is_element(c, "JB_owner")) {
            job.owner = text;
        } else if (is_element(c, "state")) {
            job.state = text;
        } else if (is_element(c, "JAT_start_time")) {
            job.start_time = text;
        } else if (is_element(c, "JB_submission_time")) {
            job.submission_time = text;
        } else if (is_element(c, "slots")) {
            auto s = parse_int64(text);
            if (!s || *s < INT32_MIN || *s > INT32_MAX) {
                return Result<Job>::Err(ErrorKind::Parse,
                    fmt::format("job {}: invalid slots '{}'", job.job_number, text));
            }
            job.slots = static_cast<int32_t>(*s);
        } else if (is_element(c, "tasks")) {
            auto task = decode_task(text);
            if (task.is_err()) {
                return Result<Job>::Err(task.kind,
                    fmt::format("job {}: {}", job.job_number, task.error));
            }
            job.tasks = task.value;
        }
    }

    return Result<Job>::Ok(std::move(job));
}

static Resource decode_resource(const xmlNode* node) {
    return {node_attr(node, "name"), node_attr(node, "type"), node_text(node)};
}

// Appends every <job_list> child of `parent` to `out`
static Result<void> decode_job_lists(const xmlNode* parent, JobList& out) {
    for (const xmlNode* c = parent->children; c; c = c->next) {
        if (!is_element(c, "job_list")) continue;
        auto job = decode_job(c);
        if (job.is_err()) return Result<void>::Fail(job);
        out.push_back(std::move(job.value));
    }
    return Result<void>::Ok();
}

static Result<Queue> decode_queue(const xmlNode* node) {
    Queue q;
    for (const xmlNode* c = node->children; c; c = c->next) {
        if (c->type != XML_ELEMENT_NODE) continue;

        if (is_element(c, "name")) {
            q.name = node_text(c);
        } else if (is_element(c, "qtype")) {
            q.qtype = node_text(c);
        } else if (is_element(c, "slots_used")) {
            q.slots_used = safe_stoi(node_text(c));
        } else if (is_element(c, "slots_resv")) {
            q.slots_reserved = safe_stoi(node_text(c));
        } else if (is_element(c, "slots_total")) {
            q.slots_total = safe_stoi(node_text(c));
        } else if (is_element(c, "arch")) {
            q.arch = node_text(c);
        } else if (is_element(c, "state")) {
            q.state = node_text(c);
        } else if (is_element(c, "resource")) {
            q.resources.add(decode_resource(c));
        }
    }

    auto jobs = decode_job_lists(node, q.jobs);
    if (jobs.is_err()) {
        return Result<Queue>::Err(jobs.kind, fmt::format("queue {}: {}", q.name, jobs.error));
    }
    return Result<Queue>::Ok(std::move(q));
}

static Result<void> decode_queue_info(const xmlNode* node, JobInfo& info) {
    for (const xmlNode* c = node->children; c; c = c->next) {
        if (!is_element(c, "Queue-List")) continue;
        auto q = decode_queue(c);
        if (q.is_err()) return Result<void>::Fail(q);
        info.queues.push_back(std::move(q.value));
    }

    // Plain `qstat -xml` (no -f) lists running jobs directly under
    // <queue_info>; gather them into one unnamed queue.
    JobList loose;
    auto jobs = decode_job_lists(node, loose);
    if (jobs.is_err()) return jobs;
    if (!loose.empty()) {
        Queue q;
        q.jobs = std::move(loose);
        info.queues.push_back(std::move(q));
    }
    return Result<void>::Ok();
}

// ── Public API ───────────────────────────────────────────────

Result<JobInfo> parse_job_info(const std::string& xml) {
    if (xml.size() > static_cast<size_t>(INT_MAX)) {
        return Result<JobInfo>::Err(ErrorKind::Parse, "document too large");
    }

    XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "qstat.xml",
                                nullptr, XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        auto err = xmlGetLastError();
        std::string msg = (err && err->message) ? err->message : "unknown error";
        trim(msg);
        gestat_log(fmt::format("job_info: XML parse failed: {}", msg));
        return Result<JobInfo>::Err(ErrorKind::Parse, "malformed job document: " + msg);
    }

    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!root || !is_element(root, "job_info")) {
        return Result<JobInfo>::Err(ErrorKind::Parse,
            "unexpected root element (expected <job_info>)");
    }

    JobInfo info;
    for (const xmlNode* c = root->children; c; c = c->next) {
        Result<void> r = Result<void>::Ok();
        if (is_element(c, "queue_info")) {
            r = decode_queue_info(c, info);
        } else if (is_element(c, "job_info")) {
            r = decode_job_lists(c, info.pending);
        }
        if (r.is_err()) {
            gestat_log(fmt::format("job_info: {}", r.error));
            return Result<JobInfo>::Fail(r);
        }
    }

    return Result<JobInfo>::Ok(std::move(info));
}

JobList collect_jobs(const JobInfo& info) {
    JobList jobs;
    for (const auto& q : info.queues) {
        jobs.append(q.jobs);
    }
    jobs.append(info.pending);
    return jobs;
}

Result<JobList> get_jobs(JobInfoSource& source) {
    auto xml = source.fetch();
    if (xml.is_err()) {
        return Result<JobList>::Err(ErrorKind::Upstream, xml.error);
    }

    auto info = parse_job_info(xml.value);
    if (info.is_err()) return Result<JobList>::Fail(info);

    return Result<JobList>::Ok(collect_jobs(info.value));
}

Result<JobList> get_jobs_with_filter(JobInfoSource& source, const JobFilter& pred) {
    auto jobs = get_jobs(source);
    if (jobs.is_err()) return jobs;
    return Result<JobList>::Ok(jobs.value.filter(pred));
}
