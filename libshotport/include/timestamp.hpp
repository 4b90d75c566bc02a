//
// Created by the shotport authors on 08/11/25.
//

/**
 * @file timestamp.hpp
 * @brief Capture and restore of file modification times.
 */

#ifndef SHOTPORT_TIMESTAMP_HPP
#define SHOTPORT_TIMESTAMP_HPP

#include <filesystem>

namespace shotport {

    /**
     * @brief Reads the modification time of a source file.
     *
     * Called before the file content is read, so the value reflects the
     * source as the user left it.
     *
     * @throws DecodeError if the file does not exist or cannot be stat'ed.
     */
    [[nodiscard]] std::filesystem::file_time_type capture_mtime(const std::filesystem::path& source);

    /**
     * @brief Sets the modification time of an output file.
     *
     * Must be the last operation touching @p output: any later write would
     * bump the time again. The access time is left alone.
     *
     * @throws TimestampError if the time cannot be applied.
     */
    void restore_mtime(const std::filesystem::path& output, std::filesystem::file_time_type mtime);

} // namespace shotport

#endif // SHOTPORT_TIMESTAMP_HPP
