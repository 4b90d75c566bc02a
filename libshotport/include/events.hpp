//
// Created by the shotport authors on 20/10/25.
//

#ifndef SHOTPORT_EVENTS_HPP
#define SHOTPORT_EVENTS_HPP

#include "errors.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace shotport {

/**
 * @brief Events published while a batch is converted.
 *
 * These lightweight structs are used with EventBus to notify subscribers
 * (CLI progress, report generator) about progress, errors, and results.
 * Every job ends with exactly one Complete, Error or Skipped event;
 * Warning events may precede a Complete event.
 */

/**
 * @brief Emitted when conversion of a file begins.
 */
struct FileConvertStartEvent {
    std::filesystem::path path;   ///< Source file
    std::filesystem::path output; ///< Planned output file
};

/**
 * @brief Emitted when a file was converted (or would be, in dry-run mode).
 */
struct FileConvertCompleteEvent {
    std::filesystem::path path;            ///< Source file
    std::filesystem::path output;          ///< Written output file
    std::uintmax_t source_size = 0;        ///< Source size in bytes
    std::uintmax_t output_size = 0;        ///< Output size in bytes (0 in dry-run)
    std::size_t carried_chunks = 0;        ///< Source PNG chunks copied to the output
    std::vector<std::string> warnings;     ///< Non-fatal issues
    bool written = false;                  ///< False in dry-run mode
    std::chrono::milliseconds duration{0}; ///< Conversion duration
};

/**
 * @brief Emitted for each non-fatal issue, before the Complete event.
 */
struct FileConvertWarningEvent {
    std::filesystem::path path; ///< Source file
    std::string message;        ///< Warning text
};

/**
 * @brief Emitted when conversion of a file fails.
 */
struct FileConvertErrorEvent {
    std::filesystem::path path;      ///< Source file
    std::filesystem::path output;    ///< Planned output file
    std::optional<ErrorKind> kind;   ///< Failure category, empty for unexpected errors
    std::string error_message;       ///< Error description
    bool partial_output = false;     ///< True if an output without complete metadata was left on disk
};

/**
 * @brief Emitted when a file is not converted at all.
 */
struct FileConvertSkippedEvent {
    std::filesystem::path path; ///< Source file
    std::string reason;         ///< Reason for skipping
};

} // namespace shotport

#endif // SHOTPORT_EVENTS_HPP
