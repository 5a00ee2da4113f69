#include "../coldxfer_cli.hpp"
#include "../theme.hpp"
#include <core/time_utils.hpp>
#include <iostream>
#include <algorithm>
#include <fmt/format.h>

static int do_status(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_service()) return 1;

    auto jobs = cli.service->list_jobs();
    if (jobs.is_err()) {
        std::cout << theme::fail(jobs.error);
        return 1;
    }

    std::vector<JobSummary> rows;
    for (const auto& s : jobs.value) {
        if (args.empty() || std::find(args.begin(), args.end(), s.job_id) != args.end()) {
            rows.push_back(s);
        }
    }
    if (rows.empty()) {
        std::cout << theme::dim("  No transfer jobs.") << "\n";
        return 0;
    }

    // Compute column widths from headers and data
    size_t w0 = 6, w1 = 5, w2 = 8;  // header lengths
    for (const auto& s : rows) {
        w0 = std::max(w0, s.job_id.size());
        w1 = std::max(w1, s.state.size());
        w2 = std::max(w2, s.progress.size());
    }

    std::string hfmt = fmt::format("  {{:<{}}} {{:<{}}} {{:<{}}} {{}}\n", w0 + 2, w1 + 2, w2 + 2);

    std::cout << "\n";
    std::cout << theme::color::DIM
              << fmt::format(fmt::runtime(hfmt), "JOB ID", "STATE", "PROGRESS", "TRANSFER")
              << theme::color::RESET;

    for (const auto& s : rows) {
        // Pad manually for state since it has ANSI codes
        std::string state = theme::state(s.state) + std::string(w1 + 2 - s.state.size(), ' ');
        std::string arrow = s.source + " -> " + s.destination;

        std::cout << fmt::format("  {:<{}} ", s.job_id, w0 + 2) << state << " "
                  << fmt::format("{:<{}} ", s.progress, w2 + 2) << arrow << "\n";

        if (!s.resume.empty()) {
            std::cout << theme::color::DIM << fmt::format("  {:<{}}   resumes {}", "", w0 + 2,
                                                          s.resume)
                      << theme::color::RESET << "\n";
        }
        if (!s.error.empty()) {
            std::string line = fmt::format("  {:<{}}   {}", "", w0 + 2, s.error);
            std::cout << (s.state == "failed" ? theme::red(line) : theme::dim(line)) << "\n";
        }
    }
    std::cout << "\n";
    return 0;
}

static int do_quota(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_service()) return 1;

    auto q = cli.service->quota();
    if (q.is_err()) {
        std::cout << theme::fail(q.error);
        return 1;
    }

    const QuotaSummary& s = q.value;
    const auto& policy = cli.service->config().quota();
    std::cout << theme::section("Quota " + s.month);
    if (s.limit == 0) {
        std::cout << theme::kv("used", format_bytes(s.used) + " (unlimited)");
    } else {
        int pct = static_cast<int>(std::min<uint64_t>(s.used, s.limit) * 100 / s.limit);
        std::cout << theme::kv("used", fmt::format("{} of {} ({}%)", format_bytes(s.used),
                                                   format_bytes(s.limit), pct));
        std::cout << theme::kv("remaining",
                               format_bytes(s.used >= s.limit ? 0 : s.limit - s.used));
    }
    std::cout << theme::kv("uploaded", format_bytes(s.uploaded) +
                                       (policy.count_uploads ? "" : " (not metered)"));
    std::cout << theme::kv("downloaded", format_bytes(s.downloaded) +
                                         (policy.count_downloads ? "" : " (not metered)"));

    const auto& windows = cli.service->config().schedule().windows;
    if (windows.empty()) {
        std::cout << theme::kv("windows", "any time");
    } else {
        std::string list;
        for (const auto& w : windows) {
            if (!list.empty()) list += ", ";
            list += w.to_string();
        }
        std::cout << theme::kv("windows", list + " UTC");
    }
    std::cout << "\n";
    return 0;
}

void register_status_commands(BaseCLI& cli) {
    cli.add_command("status", do_status, "[job-id...]",
                    "Show jobs with progress, errors and resume times");
    cli.add_command("quota", do_quota, "", "Show this month's transfer usage");
}
