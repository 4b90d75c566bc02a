//
// Created by the shotport authors on 20/09/25.
//

#ifndef SHOTPORT_REPORT_GENERATOR_HPP
#define SHOTPORT_REPORT_GENERATOR_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

enum class Outcome {
    Converted,
    Failed,
    Skipped
};

struct Result {
    std::filesystem::path path;          // source file
    std::filesystem::path output;        // output file (planned or written)
    Outcome outcome{Outcome::Skipped};
    bool written{};                      // false in dry-run mode
    uintmax_t size_before{};             // source size in bytes
    uintmax_t size_after{};              // output size in bytes
    double seconds{};                    // conversion time
    std::size_t carried_chunks{};        // source chunks copied over
    std::vector<std::string> warnings;
    std::string error_kind;              // "decode", "metadata", ... ("internal" if unknown)
    std::string error_msg;               // failure or skip reason
    bool partial_output{};               // output left on disk with incomplete metadata
};

void print_console_report(const std::vector<Result>& results,
                          unsigned num_threads,
                          double total_seconds);

/**
 * @brief Writes one CSV line per result plus a totals section.
 * @return false if the file cannot be written.
 */
bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       double total_seconds);

unsigned get_terminal_width();

#endif //SHOTPORT_REPORT_GENERATOR_HPP
