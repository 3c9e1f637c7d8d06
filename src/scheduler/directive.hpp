#pragma once

#include <string>
#include <vector>
#include <optional>

// Condition under which a submitted job is released relative to its predecessors.
enum class DependsEvent {
    After,
    AfterOk,
    AfterAny,
    AfterNotOk,
    Singleton,
};

std::string to_string(DependsEvent event);
std::optional<DependsEvent> parse_depends_event(const std::string& s);

// An external id may be used as a dependency target only if it is non-empty
// and contains neither reserved separator.
bool is_valid_external_id(const std::string& id);

// Joined id: sibling ids combined with DEP_AND_SEP ("12:13:14").
std::string join_ids(const std::vector<std::string>& ids);
std::vector<std::string> split_joined_id(const std::string& joined);

// "afterok:12:13". Singleton carries no ids.
std::string dependency_clause(DependsEvent event, const std::string& depends_on);

// Everything the scheduler needs to accept one job.
struct SubmissionDirective {
    std::string job_name;
    std::string script;                      // path of the script on the submit host
    std::string workdir;                     // remote job folder (--chdir)
    std::string output;                      // stdout/stderr file pattern (--output)
    std::vector<std::string> resource_args;  // from the job's profile
    std::optional<std::string> dependency;   // dependency clause, if any

    // Full sbatch argument list, script last.
    std::vector<std::string> sbatch_args() const;
};
