#include "directive.hpp"
#include <core/constants.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>

std::string to_string(DependsEvent event) {
    switch (event) {
        case DependsEvent::After:      return "after";
        case DependsEvent::AfterOk:    return "afterok";
        case DependsEvent::AfterAny:   return "afterany";
        case DependsEvent::AfterNotOk: return "afternotok";
        case DependsEvent::Singleton:  return "singleton";
    }
    return "afterok";
}

std::optional<DependsEvent> parse_depends_event(const std::string& s) {
    if (s == "after") return DependsEvent::After;
    if (s == "afterok") return DependsEvent::AfterOk;
    if (s == "afterany") return DependsEvent::AfterAny;
    if (s == "afternotok") return DependsEvent::AfterNotOk;
    if (s == "singleton") return DependsEvent::Singleton;
    return std::nullopt;
}

bool is_valid_external_id(const std::string& id) {
    if (id.empty()) return false;
    if (id.find(DEP_AND_SEP) != std::string::npos) return false;
    if (id.find(DEP_OR_SEP) != std::string::npos) return false;
    return !StringUtils::contains_whitespace(id) && id.find(',') == std::string::npos;
}

std::string join_ids(const std::vector<std::string>& ids) {
    return StringUtils::join(ids, DEP_AND_SEP);
}

std::vector<std::string> split_joined_id(const std::string& joined) {
    std::vector<std::string> ids;
    for (auto& part : StringUtils::split(joined, DEP_AND_SEP)) {
        if (!part.empty()) ids.push_back(part);
    }
    return ids;
}

std::string dependency_clause(DependsEvent event, const std::string& depends_on) {
    if (event == DependsEvent::Singleton) {
        return to_string(event);
    }
    return fmt::format("{}:{}", to_string(event), depends_on);
}

std::vector<std::string> SubmissionDirective::sbatch_args() const {
    std::vector<std::string> args;
    args.push_back("--parsable");
    args.push_back(fmt::format("--job-name={}", job_name));
    if (!workdir.empty()) args.push_back(fmt::format("--chdir={}", workdir));
    if (!output.empty()) args.push_back(fmt::format("--output={}", output));
    for (const auto& a : resource_args) args.push_back(a);
    if (dependency) args.push_back(fmt::format("--dependency={}", *dependency));
    args.push_back(script);
    return args;
}
