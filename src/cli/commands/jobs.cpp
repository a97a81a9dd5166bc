#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/time_utils.hpp>
#include <iostream>
#include <algorithm>
#include <fmt/format.h>

static std::string colored_status(JobStatus status) {
    std::string name = job_status_name(status);
    switch (status) {
        case JobStatus::Completed:  return theme::green(name);
        case JobStatus::Processing: return theme::teal(name);
        case JobStatus::Paused:     return theme::yellow(name);
        case JobStatus::Crashed:    return theme::red(name);
        default:                    return theme::dim(name);
    }
}

// Shared failure report for commands that read one record.
static void report_error(BaseCLI& cli, const std::string& job_id, ErrorKind kind,
                         const std::string& error) {
    cli.exit_code = 1;
    std::cout << theme::fail(fmt::format("{}: {}", error_kind_name(kind), error));
    if (kind == ErrorKind::CorruptState) {
        std::cout << theme::step(fmt::format("Discard it with: chunkpoint clear {}", job_id));
    }
}

static bool require_job_id(BaseCLI& cli, const std::string& arg, const char* usage) {
    if (arg.empty()) {
        std::cout << theme::fail("Missing job id.");
        std::cout << theme::step(std::string("Usage: ") + usage);
        cli.exit_code = 1;
        return false;
    }
    return true;
}

static void do_list(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_store()) return;

    auto ids = cli.store->list_jobs();
    if (ids.empty()) {
        std::cout << theme::dim("  No jobs in " + cli.store->state_dir().string()) << "\n";
        return;
    }

    struct Row {
        std::string id, name, progress, cost, updated;
        std::string status_plain, status_colored;
    };
    std::vector<Row> rows;

    for (const auto& id : ids) {
        Row row;
        row.id = id;
        auto summary = cli.store->summarize(id);
        if (summary.is_ok()) {
            const auto& s = summary.value;
            row.name = s.name.empty() ? "-" : s.name;
            row.progress = fmt::format("{}/{}", s.completed, s.total);
            if (s.failed > 0) row.progress += fmt::format(" ({} failed)", s.failed);
            row.cost = fmt::format("${:.4f}", s.actual_cost);
            row.updated = format_timestamp(s.last_updated);
            row.status_plain = job_status_name(s.status);
            row.status_colored = colored_status(s.status);
        } else {
            row.name = "-";
            row.progress = "-";
            row.cost = "-";
            row.updated = "-";
            row.status_plain = summary.kind == ErrorKind::CorruptState ? "corrupt" : "unreadable";
            row.status_colored = theme::red(row.status_plain);
        }
        rows.push_back(row);
    }

    // Compute column widths from headers and data
    size_t w0 = 6, w1 = 4, w2 = 6, w3 = 8, w4 = 4; // header lengths
    for (const auto& r : rows) {
        w0 = std::max(w0, r.id.size());
        w1 = std::max(w1, r.name.size());
        w2 = std::max(w2, r.status_plain.size());
        w3 = std::max(w3, r.progress.size());
        w4 = std::max(w4, r.cost.size());
    }

    std::string hfmt = fmt::format("  {{:<{}}} {{:<{}}} {{:<{}}} {{:<{}}} {{:<{}}} {{}}\n",
                                    w0 + 2, w1 + 2, w2 + 2, w3 + 2, w4 + 2);

    std::cout << "\n";
    std::cout << theme::color::DIM
              << fmt::format(fmt::runtime(hfmt), "JOB ID", "NAME", "STATUS", "PROGRESS", "COST", "UPDATED")
              << theme::color::RESET;

    for (const auto& r : rows) {
        // Pad manually for status since it has ANSI codes
        std::cout << fmt::format(fmt::runtime(fmt::format("  {{:<{}}} {{:<{}}} ", w0 + 2, w1 + 2)),
                                 r.id, r.name)
                  << r.status_colored
                  << std::string(w2 + 2 - r.status_plain.size(), ' ')
                  << fmt::format(fmt::runtime(fmt::format(" {{:<{}}} {{:<{}}} ", w3 + 2, w4 + 2)),
                                 r.progress, r.cost)
                  << r.updated << "\n";
    }
    std::cout << "\n";
}

static void print_summary(const JobSummary& s) {
    std::cout << theme::kv("Job", s.job_id);
    std::cout << theme::kv("Name", s.name.empty() ? "-" : s.name);
    std::cout << theme::kv("Status", colored_status(s.status));
    std::cout << theme::kv("Progress", fmt::format("{}/{} ({:.1f}%)", s.completed, s.total,
                                                   s.progress_pct));
    if (s.failed > 0) {
        std::cout << theme::kv("Failed", theme::yellow(std::to_string(s.failed)));
    }
    std::cout << theme::kv("Tokens", fmt::format("{} in / {} out", s.total_input_tokens,
                                                 s.total_output_tokens));
    std::cout << theme::kv("Cost", fmt::format("${:.4f} (estimated ${:.4f})", s.actual_cost,
                                               s.estimated_cost));
    std::cout << theme::kv("Created", format_timestamp(s.created_at));
    std::cout << theme::kv("Updated", fmt::format("{} ({} since start)",
                                                  format_timestamp(s.last_updated),
                                                  format_duration(s.created_at, s.last_updated)));
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_store()) return;
    if (!require_job_id(cli, arg, "chunkpoint status <job_id>")) return;

    auto summary = cli.store->summarize(arg);
    if (summary.is_err()) {
        report_error(cli, arg, summary.kind, summary.error);
        return;
    }

    std::cout << theme::section("Job status");
    print_summary(summary.value);
    if (is_resumable_status(summary.value.status)) {
        std::cout << "\n" << theme::info("Resumable");
    }
    std::cout << "\n";
}

static void do_show(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_store()) return;
    if (!require_job_id(cli, arg, "chunkpoint show <job_id>")) return;

    auto record = cli.store->read(arg);
    if (record.is_err()) {
        report_error(cli, arg, record.kind, record.error);
        return;
    }
    const JobRecord& r = record.value;

    std::cout << theme::section("Job");
    print_summary(summarize_record(r));

    if (!r.config.empty()) {
        std::cout << theme::section("Configuration");
        for (const auto& [key, val] : r.config) {
            std::cout << theme::kv(key, val);
        }
    }

    if (!r.failed_chunks.empty()) {
        std::cout << theme::section("Failed chunks");
        for (const auto& [idx, error] : r.failed_chunks) {
            std::cout << theme::fail(fmt::format("chunk {}: {}", idx, error));
        }
    }

    if (!r.last_error.empty()) {
        std::cout << theme::section("Last error");
        std::cout << theme::fail(r.last_error);
    }

    if (!r.results.empty()) {
        std::cout << theme::section("Results");
        std::cout << theme::color::DIM
                  << fmt::format("    {:<8} {:>10} {:>10} {:>10}  {}\n",
                                 "CHUNK", "IN TOK", "OUT TOK", "COST", "MODEL")
                  << theme::color::RESET;
        for (const auto& c : r.results) {
            std::cout << fmt::format("    {:<8} {:>10} {:>10} {:>10}  {}\n",
                                     c.chunk_index, c.input_tokens, c.output_tokens,
                                     fmt::format("${:.4f}", c.cost),
                                     c.model.empty() ? "-" : c.model);
        }
    }
    std::cout << "\n";
}

static void do_clear(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_store()) return;
    if (!require_job_id(cli, arg, "chunkpoint clear <job_id>")) return;

    auto owner = cli.store->claim_run(arg);
    if (owner.is_err()) {
        report_error(cli, arg, owner.kind, owner.error);
        return;
    }
    if (!owner.value->held()) {
        std::cout << theme::fail(fmt::format("Job {} is being processed by another process.", arg));
        cli.exit_code = 1;
        return;
    }

    auto result = cli.store->clear(arg);
    if (result.is_err()) {
        report_error(cli, arg, result.kind, result.error);
        return;
    }
    std::cout << theme::ok(fmt::format("Cleared {}", arg));
}

void register_jobs_commands(BaseCLI& cli) {
    cli.add_command("list", do_list, "List jobs in the state directory");
    cli.add_command("status", do_status, "Show progress of a job");
    cli.add_command("show", do_show, "Show a job with failures and results");
    cli.add_command("clear", do_clear, "Discard a job's checkpoint");
}
