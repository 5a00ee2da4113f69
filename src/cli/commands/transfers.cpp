#include "../coldxfer_cli.hpp"
#include "../theme.hpp"
#include <core/time_utils.hpp>
#include <platform/platform.hpp>
#include <iostream>
#include <atomic>
#include <csignal>
#include <mutex>
#include <thread>
#include <fmt/format.h>

// ── Run session ──────────────────────────────────────────────
// Ctrl-C asks the engine to stop at the next chunk boundary; every job stays
// resumable from its last checkpoint.

static volatile std::sig_atomic_t g_interrupted = 0;

static void on_interrupt(int) {
    g_interrupted = 1;
}

static void print_pass(const PassResult& pass) {
    const TransferJob& job = pass.job;
    switch (pass.kind) {
        case PassResult::Kind::Completed:
            std::cout << theme::ok(fmt::format("{} completed ({}, sha256 {})", job.id,
                                               format_bytes(job.size_bytes), job.final_digest));
            break;
        case PassResult::Kind::Failed:
            std::cout << theme::fail(fmt::format("{} failed [{}] {}", job.id,
                                                 to_string(job.failure), job.last_error));
            break;
        case PassResult::Kind::Cancelled:
            std::cout << theme::fail(job.id + " cancelled");
            break;
        case PassResult::Kind::Rescheduled:
            // A pass suspended by shutdown persists no resume time; nothing to report.
            if (job.next_attempt_at == pass.resume_at) {
                std::string why = job.last_error.empty() ? to_string(job.state) : job.last_error;
                std::cout << theme::info(fmt::format("{} {} until {} ({})", job.id,
                                                     to_string(job.state),
                                                     to_iso_utc(pass.resume_at), why));
            }
            break;
    }
}

static int run_engine(BaseCLI& cli, RunMode mode) {
    std::mutex out_mutex;
    cli.service->set_pass_callback([&out_mutex](const PassResult& pass) {
        std::lock_guard<std::mutex> lock(out_mutex);
        print_pass(pass);
    });
    cli.service->set_progress_callback([&out_mutex](const std::string& id, uint64_t done,
                                                    uint64_t total) {
        std::lock_guard<std::mutex> lock(out_mutex);
        std::cout << theme::log(fmt::format("{}  {} / {}", id, format_bytes(done),
                                            format_bytes(total)));
    });

    g_interrupted = 0;
    auto prev_int = std::signal(SIGINT, on_interrupt);
    auto prev_term = std::signal(SIGTERM, on_interrupt);

    std::atomic<bool> done{false};
    ColdxferService* service = cli.service.get();
    std::thread watcher([&done, service]() {
        while (!done) {
            if (g_interrupted) {
                service->stop();
                return;
            }
            platform::sleep_ms(100);
        }
    });

    auto r = cli.service->run(mode);
    done = true;
    watcher.join();
    std::signal(SIGINT, prev_int);
    std::signal(SIGTERM, prev_term);

    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    if (g_interrupted) {
        std::cout << theme::step("Interrupted. Run 'coldxfer run' to resume.");
    }
    return 0;
}

static void print_submitted(const CreateOutcome& outcome) {
    const TransferJob& job = outcome.job;
    if (outcome.created) {
        std::cout << theme::ok("Queued " + job.id);
    } else if (is_terminal(job.state)) {
        std::cout << theme::info(fmt::format("{} already {}. Use 'coldxfer forget {}' to "
                                             "transfer it again.", job.id,
                                             to_string(job.state), job.id));
    } else {
        std::cout << theme::info(fmt::format("Resuming {} at {} ({})", job.id,
                                             format_bytes(job.cursor), to_string(job.state)));
    }
}

// ── Commands ─────────────────────────────────────────────────

static int do_upload(BaseCLI& cli, const std::vector<std::string>& arg_list) {
    std::vector<std::string> args = arg_list;
    std::string class_name;
    if (!take_option(args, "--class", class_name)) {
        std::cout << theme::fail("--class needs a storage class");
        return 1;
    }
    bool queue_only = take_flag(args, "--queue");
    if (args.size() != 2) {
        std::cout << theme::fail("Usage: coldxfer upload <src> <key> [--class C] [--queue]");
        return 1;
    }

    std::optional<StorageClass> storage_class;
    if (!class_name.empty()) {
        StorageClass cls;
        if (!parse_storage_class(class_name, cls)) {
            std::cout << theme::fail("Unknown storage class: " + class_name);
            return 1;
        }
        storage_class = cls;
    }

    if (!cli.require_service()) return 1;
    auto r = cli.service->submit_upload(args[0], args[1], storage_class);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    print_submitted(r.value);
    if (queue_only) return 0;
    return run_engine(cli, RunMode::DueOnly);
}

static int do_download(BaseCLI& cli, const std::vector<std::string>& arg_list) {
    std::vector<std::string> args = arg_list;
    bool queue_only = take_flag(args, "--queue");
    if (args.size() != 2) {
        std::cout << theme::fail("Usage: coldxfer download <key> <dest> [--queue]");
        return 1;
    }

    if (!cli.require_service()) return 1;
    auto r = cli.service->submit_download(args[0], args[1]);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    print_submitted(r.value);
    if (queue_only) return 0;
    return run_engine(cli, RunMode::DueOnly);
}

static int do_run(BaseCLI& cli, const std::vector<std::string>& arg_list) {
    std::vector<std::string> args = arg_list;
    bool due_only = take_flag(args, "--due");
    if (!args.empty()) {
        std::cout << theme::fail("Usage: coldxfer run [--due]");
        return 1;
    }
    if (!cli.require_service()) return 1;
    return run_engine(cli, due_only ? RunMode::DueOnly : RunMode::UntilDone);
}

static int do_cancel(BaseCLI& cli, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cout << theme::fail("Usage: coldxfer cancel <job-id>");
        return 1;
    }
    if (!cli.require_service()) return 1;
    auto r = cli.service->cancel(args[0]);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    std::cout << theme::ok("Cancelled " + args[0]);
    return 0;
}

static int do_forget(BaseCLI& cli, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cout << theme::fail("Usage: coldxfer forget <job-id>");
        return 1;
    }
    if (!cli.require_service()) return 1;
    auto r = cli.service->forget(args[0]);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    std::cout << theme::ok("Forgot " + args[0]);
    return 0;
}

void register_transfer_commands(BaseCLI& cli) {
    cli.add_command("upload", do_upload, "<src> <key> [--class C]",
                    "Upload a file as one object");
    cli.add_command("download", do_download, "<key> <dest>",
                    "Download an object (restoring it first if archived)");
    cli.add_command("run", do_run, "[--due]", "Resume and run every pending job");
    cli.add_command("cancel", do_cancel, "<job-id>", "Cancel a job");
    cli.add_command("forget", do_forget, "<job-id>", "Drop a finished job from the ledger");
}
