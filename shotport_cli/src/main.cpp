//
// Created by the shotport authors on 18/09/25.
//

#include <iostream>
#include <filesystem>
#include <csignal>
#include <clocale>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <thread>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "../../libshotport/include/conversion_executor.hpp"
#include "../../libshotport/include/conversion_pipeline.hpp"
#include "../../libshotport/include/decoder_registry.hpp"
#include "../../libshotport/include/event_bus.hpp"
#include "../../libshotport/include/events.hpp"
#include "../../libshotport/include/exiftool_client.hpp"
#include "../../libshotport/include/logger.hpp"
#include "../../libshotport/include/output_naming.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/file_scanner.hpp"

// simple progress bar printer
inline void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : (done > 0 ? 1.0 : 0.0);
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }
    if (done == total) {
        percent = 100.0;
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else if (i == pos && done == total) std::cerr << "=";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace shotport;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};

// handle ctrl+c or termination signals; the executor is stopped from the watcher thread in main
extern "C" void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}


int main(int argc, char* argv[]) {

    CLI::App app{"shotport: convert Android screenshots into PNGs that iOS files as screenshots."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // set loggers
    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!fileSink->is_open()) {
            std::cerr << RED << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
            return 1;
        }
        Logger::add_sink(std::move(fileSink));
    }
    const LogLevel console_level = Logger::string_to_level(settings.log_level);
    if (!settings.quiet && console_level != LogLevel::None) {
        Logger::add_sink(std::make_unique<ConsoleLogSink>(console_level));
    }

    init_utf8_locale();

    // the tool is needed for every conversion: check it once, up front
    ExifToolClient tool(settings.exiftool);
    if (!settings.dry_run && !tool.is_available()) {
        std::cerr << RED << "Error: '" << settings.exiftool
                  << "' not found or not working. Install exiftool or pass --exiftool PATH."
                  << RESET << std::endl;
        return 1;
    }

    // single file without -o: convert next to itself
    const bool single_file = settings.output_path.empty() && settings.inputs.size() == 1 &&
                             fs::is_regular_file(settings.inputs.front());
    const fs::path output_dir = settings.output_path.empty()
                                    ? (single_file ? fs::path() : default_output_dir(settings.inputs))
                                    : settings.output_path;

    // collect input files
    const auto inputs = collect_input_files(settings.inputs, settings, output_dir);
    if (inputs.empty()) {
        Logger::log(LogLevel::Error, "No valid input files.", "main");
        std::cerr << RED << "No valid input files." << RESET << std::endl;
        return 1;
    }

    std::vector<ConversionJob> jobs;
    if (single_file) {
        jobs.push_back({inputs.front(), sibling_output_path(inputs.front())});
    } else {
        jobs = plan_jobs(inputs, output_dir);
    }

    DecoderRegistry registry;
    EventBus bus;
    const ConversionPipeline pipeline(registry, tool, settings.pipeline_options());

    // results collected for reporting; handlers are serialized by the bus
    std::vector<Result> results;

    // progress tracking
    const size_t total = jobs.size();
    size_t done = 0;
    const auto start_total = std::chrono::steady_clock::now();

    auto on_finish = [&] {
        const size_t current = ++done;
        const double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_total).count();
        if (!settings.quiet) {
            print_progress_bar(current, total, elapsed);
        }
    };

    bus.subscribe<FileConvertCompleteEvent>([&](const FileConvertCompleteEvent& e) {
        if (!settings.quiet) {
            std::cerr
                << (e.warnings.empty() ? GREEN : YELLOW)
                << "\n[DONE] " << e.path.filename().string() << " -> " << e.output.string()
                << (e.written ? "" : " [DRY-RUN]")
                << (e.warnings.empty() ? "" : " (" + std::to_string(e.warnings.size()) + " warnings)")
                << RESET << std::endl;
        }
        Result r;
        r.path = e.path;
        r.output = e.output;
        r.outcome = Outcome::Converted;
        r.written = e.written;
        r.size_before = e.source_size;
        r.size_after = e.output_size;
        r.carried_chunks = e.carried_chunks;
        r.warnings = e.warnings;
        r.seconds = static_cast<double>(e.duration.count()) / 1000.0;
        results.push_back(std::move(r));

        on_finish();
    });

    bus.subscribe<FileConvertWarningEvent>([&](const FileConvertWarningEvent& e) {
        if (!settings.quiet) {
            std::cerr << YELLOW << "\n[WARN] " << e.path.filename().string() << ": " << e.message
                      << RESET << std::endl;
        }
    });

    bus.subscribe<FileConvertErrorEvent>([&](const FileConvertErrorEvent& e) {
        const std::string kind = e.kind ? std::string(to_string(*e.kind)) : "internal";
        std::cerr << RED << "\n[FAIL] " << e.path.filename().string() << " (" << kind << "): "
                  << e.error_message
                  << (e.partial_output ? " [partial output: " + e.output.string() + "]" : "")
                  << RESET << std::endl;

        Result r;
        r.path = e.path;
        r.output = e.output;
        r.outcome = Outcome::Failed;
        r.error_kind = kind;
        r.error_msg = e.error_message;
        r.partial_output = e.partial_output;
        results.push_back(std::move(r));

        on_finish();
    });

    bus.subscribe<FileConvertSkippedEvent>([&](const FileConvertSkippedEvent& e) {
        Result r;
        r.path = e.path;
        r.outcome = Outcome::Skipped;
        r.error_msg = e.reason;
        results.push_back(std::move(r));

        on_finish();
    });

    // build executor
    ConversionExecutor executor(registry, pipeline, settings.dry_run, bus, settings.num_threads);

    // forward interrupts from the signal handler to the executor
    std::jthread watcher([&executor](const std::stop_token& st) {
        while (!st.stop_requested()) {
            if (interrupted.load()) {
                std::cerr << CYAN
                          << "\n[INTERRUPT] Stop detected. Waiting for running conversions to finish..."
                          << RESET << std::endl;
                executor.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    // run processing
    try {
        executor.process(jobs);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 1;
    }
    watcher.request_stop();
    watcher.join();

    const auto end_total = std::chrono::steady_clock::now();
    const double total_seconds = std::chrono::duration<double>(end_total - start_total).count();

    if (!settings.quiet) {
        std::cerr << std::endl;
        print_console_report(results, settings.num_threads, total_seconds);
    }

    // export CSV if requested
    if (!settings.report_path.empty()) {
        if (!export_csv_report(results, settings.report_path, total_seconds)) {
            Logger::log(LogLevel::Error, "Cannot write report: " + settings.report_path.string(), "main");
        }
    }

    if (interrupted.load()) {
        return 130; // standard exit code for SIGINT
    }
    const bool any_failed = std::ranges::any_of(results, [](const Result& r) {
        return r.outcome == Outcome::Failed;
    });
    return any_failed ? 1 : 0;
}
