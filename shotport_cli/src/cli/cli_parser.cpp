//
// Created by the shotport authors on 20/09/25.
//

#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <regex>
#include <thread>

namespace {
// rejects patterns std::regex cannot compile, before any file is scanned
struct RegexValidator : CLI::Validator {
    RegexValidator() {
        name_ = "REGEX";
        func_ = [](const std::string& str) {
            try {
                std::regex re(str);
            } catch (const std::regex_error& e) {
                return "Invalid regex '" + str + "': " + e.what();
            }
            return std::string(); // ok
        };
    }
};
} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Flags (booleans) ---
    app.add_flag("--no-recursive", settings.no_recursive,
                 "Do not descend into subfolders of input folders.");

    app.add_flag("--dry-run", settings.dry_run,
                 "List what would be converted without writing anything.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    app.add_flag("--no-date-fill", settings.no_date_fill,
                 "Do not add DateTimeOriginal/CreateDate/ModifyDate when the source lacks them.");

    app.add_flag("--no-timestamps", settings.no_timestamps,
                 "Do not copy the source modification time onto the output.");

    app.add_option("-o,--output", settings.output_path,
                   "Write converted files to DIR.\n"
                   "Default: '<stem>_ios.png' next to a single input file, "
                   "otherwise 'ios_output' inside the first input folder.");

    app.add_option("--exiftool", settings.exiftool,
                   "exiftool executable (name looked up in PATH, or full path).")
                   ->default_val("exiftool");

    app.add_option("--compression", settings.compression_level,
                   "zlib compression level of the pixel data.")
                   ->default_val(9)
                   ->check(CLI::Range(0, 9));

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last(); // if used multiple times, take the last one

    // calculate default thread count
    settings.num_threads = std::max(1U, std::thread::hardware_concurrency() / 2);
    app.add_option("--threads", settings.num_threads,
                   "Threads to use for parallel conversion.")
                   ->default_val(settings.num_threads)
                   ->check(CLI::PositiveNumber);

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->transform(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    app.add_option("--include", settings.include_patterns,
                   "Convert only files matching regex PATTERN. (Can be used multiple times).")
                   ->check(RegexValidator());

    app.add_option("--exclude", settings.exclude_patterns,
                   "Do not convert files matching regex PATTERN. (Can be used multiple times).")
                   ->check(RegexValidator());

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "One or more image files or directories")
        ->required()
        ->check(CLI::ExistingPath);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (!settings.output_path.empty() && std::filesystem::exists(settings.output_path) &&
            !std::filesystem::is_directory(settings.output_path)) {
            throw CLI::ValidationError("Output path ('-o') must be a directory.");
        }
    });
}
