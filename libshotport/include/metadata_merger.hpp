//
// Created by the shotport authors on 07/11/25.
//

/**
 * @file metadata_merger.hpp
 * @brief Merges source metadata and the iOS screenshot tags into the output.
 */

#ifndef SHOTPORT_METADATA_MERGER_HPP
#define SHOTPORT_METADATA_MERGER_HPP

#include "metadata_tool.hpp"
#include <filesystem>

namespace shotport {

/**
 * @brief Drives an IMetadataTool through the three merge steps.
 *
 * @details
 * 1. copy every tag of the source onto the output;
 * 2. write ios_screenshot_overrides() with override semantics;
 * 3. optionally write capture_date_tags() in create-only mode, dated with
 *    the source's DateTimeOriginal, or with its mtime when it has none.
 *
 * The order is fixed: overrides always win over copied tags, and copied
 * tags always win over the capture-date fill. The engine borrows the tool.
 */
class MetadataMergeEngine {
public:
    explicit MetadataMergeEngine(const IMetadataTool& tool, bool fill_capture_dates = true);

    /**
     * @brief Runs the merge on an output file that already holds the image.
     * @param source Original input file (tag source).
     * @param output PNG written by the assembler, edited in place.
     * @param source_mtime Captured source mtime, used by the date fill
     * when the source carries no DateTimeOriginal.
     * @throws MetadataWriteError on any tool failure; @p output is left
     * with whatever the completed steps wrote.
     */
    void merge(const std::filesystem::path& source,
               const std::filesystem::path& output,
               std::filesystem::file_time_type source_mtime) const;

    [[nodiscard]] bool fills_capture_dates() const noexcept { return fill_capture_dates_; }

private:
    const IMetadataTool& tool_;
    bool fill_capture_dates_;
};

} // namespace shotport

#endif // SHOTPORT_METADATA_MERGER_HPP
