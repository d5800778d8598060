#include <iostream>
#include <vector>
#include <string>
#include <csignal>
#include <cstdlib>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/utils.hpp>
#include <managers/transfer_service.hpp>
#include <platform/platform.hpp>
#include "cli/theme.hpp"

static volatile std::sig_atomic_t g_interrupted = 0;

static void on_signal(int) {
    g_interrupted = 1;
}

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    repoxfer-run "
              << theme::color::RESET << theme::color::BROWN << "[options] <task.json>..."
              << theme::color::RESET << theme::color::DIM
              << "   Queue task files and run until every job settles"
              << theme::color::RESET << "\n\n";
    std::cout << theme::color::DIM
              << "    --config <path>               Config file (default ~/.repoxfer/config.yaml)\n"
              << "    --download <resource> <dir>   Queue a download\n"
              << "    --priority <n>                Priority for --download jobs\n"
              << "    --condensed                   Fetch condensed copies of RT-DC downloads\n"
              << "    --retry <job_id>              Re-attempt an errored or aborted job\n"
              << "    --abort <job_id>              Abort a job\n"
              << "    --remove <job_id>             Delete a job and its local artifacts\n"
              << "    --status                      Print the job table and exit\n"
              << "    --init-config                 Write a default config file\n"
              << "    --version                     Show version\n"
              << "    --help                        Show this help"
              << theme::color::RESET << "\n\n";
}

static std::string progress_cell(const JobStatus& s) {
    if (s.bytes_total <= 0) return "-";
    int pct = static_cast<int>(100.0 * s.bytes_done / s.bytes_total);
    return fmt::format("{:>3}% of {}", pct, format_bytes(s.bytes_total));
}

static void print_jobs(const TransferService& svc) {
    for (Direction d : {Direction::Upload, Direction::Download}) {
        auto jobs = svc.list_jobs(d);
        if (jobs.empty()) continue;
        std::cout << theme::section(d == Direction::Upload ? "Uploads" : "Downloads");
        for (const auto& s : jobs) {
            std::string state = state_name(s.state);
            if (s.state == JobState::Done) state = theme::green(state);
            else if (s.state == JobState::Error) state = theme::red(state);
            else if (s.state == JobState::Aborted) state = theme::yellow(state);
            std::cout << fmt::format("    {:<32} {:<24} {:<18} {}\n", s.job_id, state,
                                     progress_cell(s),
                                     s.attempt_count > 0 ? fmt::format("attempt {}", s.attempt_count) : "");
            if (!s.last_error.empty()) {
                std::cout << theme::log(s.last_error.describe());
            }
        }
    }
    std::cout << "\n";
}

static void print_progress(const TransferService& svc) {
    for (Direction d : {Direction::Upload, Direction::Download}) {
        QueueSummary q = svc.summary(d);
        if (q.total == 0) continue;
        std::cout << theme::log(fmt::format("{}: {} jobs, {} active, {} / {} at {}/s",
                                            direction_name(d), q.total, q.claimed,
                                            format_bytes(q.bytes_done), format_bytes(q.bytes_total),
                                            format_bytes(static_cast<int64_t>(q.rate))));
    }
}

int main(int argc, char** argv) {
    try {
        std::string config_path;
        std::vector<fs::path> task_files;
        std::vector<std::pair<std::string, std::string>> downloads;
        std::vector<std::pair<std::string, std::string>> actions;   // (verb, job id)
        int priority = 0;
        bool condensed = false;
        bool status_only = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto need = [&](int n) {
                if (i + n >= argc) {
                    std::cout << theme::fail("Missing value for " + arg);
                    std::exit(1);
                }
            };
            if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else if (arg == "--version") {
                std::cout << theme::color::BROWN << theme::color::BOLD << "repoxfer-run"
                          << theme::color::RESET << theme::color::DIM
                          << " version 0.1.0" << theme::color::RESET << "\n";
                return 0;
            } else if (arg == "--init-config") {
                auto r = create_default_global_config();
                if (r.is_err()) {
                    std::cout << theme::fail(r.error);
                    return 1;
                }
                std::cout << theme::ok("Wrote " + get_global_config_path().string());
                return 0;
            } else if (arg == "--config") {
                need(1);
                config_path = argv[++i];
            } else if (arg == "--download") {
                need(2);
                downloads.emplace_back(argv[i + 1], argv[i + 2]);
                i += 2;
            } else if (arg == "--priority") {
                need(1);
                priority = safe_stoi(argv[++i], 0);
            } else if (arg == "--condensed") {
                condensed = true;
            } else if (arg == "--retry" || arg == "--abort" || arg == "--remove") {
                need(1);
                actions.emplace_back(arg.substr(2), argv[++i]);
            } else if (arg == "--status") {
                status_only = true;
            } else if (arg.rfind("--", 0) == 0) {
                std::cout << theme::fail("Unknown option: " + arg);
                print_usage();
                return 1;
            } else {
                task_files.emplace_back(arg);
            }
        }

        auto config = config_path.empty() ? Config::load_global() : Config::load_file(config_path);
        if (config.is_err()) {
            std::cout << theme::fail(config.error);
            return 1;
        }

        TransferService svc(config.value);
        auto restored = svc.restore([](const std::string& msg) {
            std::cout << theme::log(msg);
        });
        if (restored.is_err()) {
            std::cout << theme::fail(restored.error);
            return 1;
        }

        for (const auto& a : actions) {
            Result<void> r = a.first == "retry" ? svc.retry_job(a.second)
                           : a.first == "abort" ? svc.abort_job(a.second)
                           : svc.remove_job(a.second);
            if (r.is_err()) std::cout << theme::fail(r.error);
            else std::cout << theme::ok(fmt::format("{} {}", a.first, a.second));
        }

        std::vector<std::string> warnings;
        auto results = svc.submit_task_files(task_files, &warnings);
        for (const auto& w : warnings) std::cout << theme::fail(w);
        for (const auto& d : downloads) {
            results.push_back(svc.submit_download(d.first, d.second, priority, condensed));
        }
        for (const auto& r : results) {
            if (r.accepted()) std::cout << theme::ok("queued " + r.job_id);
            else std::cout << theme::info(fmt::format("{}: {} ({})", r.job_id,
                                                      enqueue_outcome_name(r.outcome), r.message));
        }

        if (status_only) {
            print_jobs(svc);
            return 0;
        }

        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        svc.start();
        int ticks = 0;
        while (svc.has_pending_work() && !g_interrupted) {
            platform::sleep_ms(200);
            if (++ticks % 25 == 0) print_progress(svc);
        }
        svc.stop();

        print_jobs(svc);
        if (g_interrupted) {
            std::cout << theme::info("Interrupted; unfinished jobs resume on the next run.");
            return 130;
        }

        for (Direction d : {Direction::Upload, Direction::Download}) {
            for (const auto& s : svc.list_jobs(d)) {
                if (s.state != JobState::Done) return 2;
            }
        }
        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
