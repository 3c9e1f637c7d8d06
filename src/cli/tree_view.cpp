#include "tree_view.hpp"
#include "theme.hpp"
#include <fmt/format.h>
#include <map>

std::string status_marker(JobStatus status, bool color) {
    switch (status) {
        case JobStatus::Succeeded: return color ? theme::green("+") : "+";
        case JobStatus::Failed:    return color ? theme::red("x") : "x";
        case JobStatus::Submitted: return color ? theme::blue("~") : "~";
        case JobStatus::Skipped:   return color ? theme::dim("=") : "=";
        case JobStatus::Pending:   return color ? theme::dim(".") : ".";
    }
    return ".";
}

static void render_node(const JobNode& node, int depth, bool color, std::string& out) {
    std::string indent(4 + depth * 2, ' ');

    if (const auto* job = node.as<Job>()) {
        std::string id = job->external_id.empty() ? "-" : job->external_id;
        std::string line = fmt::format("{}{} {:<24} {:<10} {}", indent,
                                       status_marker(job->status, color), job->job_id,
                                       to_string(job->status), id);
        out += line + "\n";
        if (!job->error.empty()) {
            std::string err = indent + "    " + job->error;
            out += (color ? theme::red(err) : err) + "\n";
        }
        return;
    }
    if (const auto* pass = node.as<PassThrough>()) {
        std::string line = fmt::format("{}= {} (done, {})", indent, pass->name, pass->external_id);
        out += (color ? theme::dim(line) : line) + "\n";
        return;
    }

    std::string kind = node.is<Sequential>() ? "sequential" : "parallel";
    std::string head = fmt::format("{}{} [{}]", indent, node.label(), kind);
    out += (color ? theme::brown(head) : head) + "\n";
    for (const auto& child : *children(node)) {
        render_node(child, depth + 1, color, out);
    }
}

std::string render_tree(const Pipeline& pipeline, bool color) {
    std::string out;
    std::string title = fmt::format("  {}  {}", pipeline.name(),
                                    pipeline.job_id().value_or("(not scheduled)"));
    out += (color ? theme::bold(title) : title) + "\n";
    render_node(pipeline.definition(), 0, color, out);
    return out;
}

std::string status_summary(const Pipeline& pipeline) {
    std::map<JobStatus, int> counts;
    for (const auto& [id, status] : pipeline.job_statuses()) counts[status]++;

    std::string out;
    for (JobStatus s : {JobStatus::Succeeded, JobStatus::Failed, JobStatus::Submitted,
                        JobStatus::Skipped, JobStatus::Pending}) {
        if (!counts.count(s)) continue;
        if (!out.empty()) out += ", ";
        out += fmt::format("{} {}", counts[s], to_string(s));
    }
    return out.empty() ? "no jobs" : out;
}
