//
// Created by the shotport authors on 07/11/25.
//

/**
 * @file metadata_tool.hpp
 * @brief Narrow interface to the external metadata editor.
 */

#ifndef SHOTPORT_METADATA_TOOL_HPP
#define SHOTPORT_METADATA_TOOL_HPP

#include "metadata_tags.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace shotport {

/**
 * @brief How set_tags() treats tags that already exist in the target.
 */
enum class TagWriteMode {
    Override,   ///< Replace existing values
    CreateOnly  ///< Only add tags the target does not have yet
};

/**
 * @brief Interface for the tool that edits metadata in place.
 *
 * The production implementation is ExifToolClient; tests substitute a fake.
 * Implementations must be safe to call from several threads as long as each
 * call targets a different file.
 */
class IMetadataTool {
public:
    virtual ~IMetadataTool() = default;

    /// @return Human-readable name of the tool.
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /**
     * @brief Copies every tag of @p source onto @p target.
     *
     * A source without any tag is not an error.
     *
     * @throws MetadataWriteError if the tool is unavailable or fails.
     */
    virtual void copy_all_tags(const std::filesystem::path& source, const std::filesystem::path& target) const = 0;

    /**
     * @brief Reads one tag of @p source in its raw form.
     * @return The value, or std::nullopt if @p source does not carry the tag.
     * @throws MetadataWriteError if the tool is unavailable or fails.
     */
    [[nodiscard]] virtual std::optional<std::string> read_tag(const std::filesystem::path& source,
                                                              std::string_view tag) const = 0;

    /**
     * @brief Writes @p tags into @p target.
     * @throws MetadataWriteError if the tool is unavailable or fails.
     */
    virtual void set_tags(const std::filesystem::path& target, const MetadataTagSet& tags, TagWriteMode mode) const = 0;
};

} // namespace shotport

#endif // SHOTPORT_METADATA_TOOL_HPP
