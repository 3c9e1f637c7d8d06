#include "../base_cli.hpp"
#include "../tree_view.hpp"
#include "../theme.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <pipeline/codec.hpp>
#include <pipeline/dependency_compiler.hpp>
#include <pipeline/reconcile.hpp>
#include <pipeline/rerun.hpp>
#include <util/string_utils.hpp>
#include <iostream>
#include <fmt/format.h>

// ── Helpers ──────────────────────────────────────────────────

static bool save_snapshot(BaseCLI& cli, const Pipeline& pipeline) {
    auto saved = cli.store->save(pipeline);
    if (saved.is_err()) {
        std::cout << theme::fail("Could not save snapshot: " + saved.error);
        cli.mark_failed();
        return false;
    }
    return true;
}

// Compile and submit, then persist whatever happened so a failed run can
// still be inspected and rerun.
static void submit_pipeline(BaseCLI& cli, Pipeline& pipeline) {
    DependencyCompiler compiler(*cli.scheduler->scheduler,
                                CompilerSettings::from_config(cli.config.value()));

    std::cout << theme::step(fmt::format("Submitting {} to {}", pipeline.name(),
                                         cli.scheduler->scheduler->name()));
    try {
        std::string last = pipeline.schedule(compiler);
        std::cout << theme::ok(fmt::format("{} submitted ({} jobs), final stage {}",
                                           pipeline.name(), compiler.submissions(),
                                           last.empty() ? "-" : last));
    } catch (const PipelineError& e) {
        std::cout << theme::fail(e.what());
        cli.mark_failed();
    }

    save_snapshot(cli, pipeline);
    std::cout << "\n" << render_tree(pipeline) << "\n";
}

// Submitting over jobs that may still be queued would run them twice under
// the same job_id and directory.
static bool refuse_in_flight(BaseCLI& cli, const Pipeline& previous) {
    auto busy = in_flight_jobs(previous);
    if (busy.empty()) return false;

    std::cout << theme::fail(fmt::format(
        "'{}' still has {} job(s) in flight ({}...). Run 'jobrunner status {}' first.",
        previous.name(), busy.size(), busy.front()->job_id, previous.name()));
    cli.mark_failed();
    return true;
}

static std::optional<Pipeline> load_saved(BaseCLI& cli, const std::string& name) {
    if (name.empty()) {
        std::cout << theme::fail("Missing pipeline name.");
        cli.mark_failed();
        return std::nullopt;
    }
    if (!cli.store->exists(name)) {
        std::cout << theme::fail(fmt::format("No saved pipeline named '{}'", name));
        std::cout << theme::step("Run 'jobrunner list' to see saved pipelines.");
        cli.mark_failed();
        return std::nullopt;
    }
    return cli.store->load(name);
}

// ── Commands ─────────────────────────────────────────────────

static void do_run(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_scheduler()) { cli.mark_failed(); return; }

    if (arg.empty()) {
        std::cout << theme::fail("Usage: run <definition-file|standard>");
        cli.mark_failed();
        return;
    }

    auto builtin = builtin_definition(arg);
    Pipeline pipeline = builtin ? *builtin : load_definition(arg);

    if (cli.store->exists(pipeline.name())) {
        Pipeline previous = cli.store->load(pipeline.name());
        if (refuse_in_flight(cli, previous)) return;
    }

    submit_pipeline(cli, pipeline);
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_scheduler()) { cli.mark_failed(); return; }

    auto pipeline = load_saved(cli, StringUtils::trim(arg));
    if (!pipeline) return;

    auto report = reconcile_with_backoff(*pipeline, *cli.scheduler->scheduler);
    save_snapshot(cli, *pipeline);

    std::cout << "\n" << render_tree(*pipeline) << "\n";
    std::cout << theme::kv("jobs", status_summary(*pipeline));
    std::cout << theme::kv("queried", fmt::format("{} ({} changed)", report.queried, report.updated));
    for (const auto& f : report.failures) {
        std::cout << theme::fail(fmt::format("{} ({}): {}", f.job_id, f.external_id, f.error));
    }
    if (!report.complete()) {
        std::cout << theme::step("Status unknown for some jobs; their last known state was kept.");
        cli.mark_failed();
    }
}

static void do_rerun(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_scheduler()) { cli.mark_failed(); return; }

    auto previous = load_saved(cli, StringUtils::trim(arg));
    if (!previous) return;
    if (refuse_in_flight(cli, *previous)) return;

    Pipeline next = rerun(*previous);
    int count = resubmittable_jobs(next.definition());
    if (count == 0) {
        std::cout << theme::ok(fmt::format("Every job of {} already succeeded.", next.name()));
        return;
    }

    std::cout << theme::info(fmt::format("Resubmitting {} of {} jobs", count, previous->jobs().size()));
    submit_pipeline(cli, next);
}

static void do_show(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) { cli.mark_failed(); return; }

    auto args = StringUtils::split(StringUtils::trim(arg), " ");
    bool json = false;
    std::string name;
    for (const auto& a : args) {
        if (a == "--json") json = true;
        else if (!a.empty()) name = a;
    }

    auto pipeline = load_saved(cli, name);
    if (!pipeline) return;

    if (json) {
        std::cout << to_json(*pipeline) << "\n";
        return;
    }
    std::cout << "\n" << render_tree(*pipeline) << "\n";
    std::cout << theme::kv("jobs", status_summary(*pipeline));
    std::cout << theme::kv("output", pipeline->output_dir(cli.config->local_workdir()).string());
}

static void do_list(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) { cli.mark_failed(); return; }

    auto names = cli.store->list();
    if (names.empty()) {
        std::cout << theme::dim("  No saved pipelines.") << "\n";
        return;
    }

    std::cout << "\n";
    std::cout << theme::table_header(fmt::format("{:<20} {:<42} {}", "NAME", "RUN", "JOBS"));
    for (const auto& name : names) {
        try {
            Pipeline p = cli.store->load(name);
            std::cout << fmt::format("  {:<20} {:<42} {}\n", name,
                                     p.job_id().value_or("-"), status_summary(p));
        } catch (const PipelineError& e) {
            std::cout << fmt::format("  {:<20} ", name) << theme::red(e.what()) << "\n";
        }
    }
    std::cout << "\n";
}

void register_pipeline_commands(BaseCLI& cli) {
    cli.add_command("run", do_run, "Submit a pipeline definition");
    cli.add_command("status", do_status, "Refresh job outcomes from the scheduler");
    cli.add_command("rerun", do_rerun, "Resubmit only what did not succeed");
    cli.add_command("show", do_show, "Print a saved pipeline (--json for the snapshot)");
    cli.add_command("list", do_list, "List saved pipelines");
}
