//
// Created by the shotport authors on 20/09/25.
//

#ifndef SHOTPORT_CLI_PARSER_HPP
#define SHOTPORT_CLI_PARSER_HPP

#include <string>
#include <vector>
#include <filesystem>
#include "../../../libshotport/include/conversion_pipeline.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool no_recursive = false;
    bool dry_run = false;
    bool quiet = false;
    bool no_date_fill = false;
    bool no_timestamps = false;

    unsigned num_threads = 1;
    int compression_level = 9;
    std::string log_level = "ERROR";
    std::string exiftool = "exiftool";
    std::filesystem::path output_path;
    std::filesystem::path report_path;
    std::filesystem::path log_file;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;

    std::vector<std::filesystem::path> inputs;

    [[nodiscard]] bool recursive() const { return !no_recursive; }

    [[nodiscard]] shotport::PipelineOptions pipeline_options() const {
        shotport::PipelineOptions opts;
        opts.preserve_timestamp = !no_timestamps;
        opts.fill_capture_dates = !no_date_fill;
        opts.compression_level = compression_level;
        return opts;
    }
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //SHOTPORT_CLI_PARSER_HPP
