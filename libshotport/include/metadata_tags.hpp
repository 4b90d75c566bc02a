//
// Created by the shotport authors on 07/11/25.
//

/**
 * @file metadata_tags.hpp
 * @brief Tag name/value sets written by the metadata merge stage.
 */

#ifndef SHOTPORT_METADATA_TAGS_HPP
#define SHOTPORT_METADATA_TAGS_HPP

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shotport {

/**
 * @brief Ordered mapping from tag name to value.
 *
 * @details Names are exiftool tag names ("Orientation", "XResolution").
 * Values are the raw, untranslated form (numbers for enumerated tags).
 * Insertion order is kept so the tool receives the tags in a stable order;
 * setting an existing key replaces its value in place.
 */
class MetadataTagSet {
public:
    using Entry = std::pair<std::string, std::string>;

    MetadataTagSet() = default;
    MetadataTagSet(std::initializer_list<Entry> entries);

    /// Inserts or replaces a tag.
    void set(std::string name, std::string value);

    [[nodiscard]] std::optional<std::string> get(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] auto begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] auto end() const noexcept { return entries_.end(); }

    bool operator==(const MetadataTagSet&) const = default;

private:
    std::vector<Entry> entries_;
};

inline constexpr std::string_view kScreenshotDescription = "Screenshot";

/**
 * @brief Tags that make iOS treat the image as a screenshot.
 *
 * ImageDescription and UserComment "Screenshot", Orientation 1,
 * X/YResolution 144 and ResolutionUnit 2 (inches). Written with override
 * semantics after the source tags were copied.
 */
[[nodiscard]] MetadataTagSet ios_screenshot_overrides();

/**
 * @brief Capture-date tags carrying one EXIF date.
 *
 * DateTimeOriginal, CreateDate and ModifyDate all set to @p stamp plus
 * ColorSpace 1 (sRGB). Written in create-only mode.
 */
[[nodiscard]] MetadataTagSet capture_date_tags(const std::string& stamp);

/// Same, with the date taken from @p mtime in local time.
[[nodiscard]] MetadataTagSet capture_date_tags(std::filesystem::file_time_type mtime);

/**
 * @brief Formats a file time as an EXIF date, "YYYY:MM:DD HH:MM:SS", local time.
 * @throws std::runtime_error if the time cannot be converted.
 */
[[nodiscard]] std::string format_exif_datetime(std::filesystem::file_time_type mtime);

} // namespace shotport

#endif // SHOTPORT_METADATA_TAGS_HPP
