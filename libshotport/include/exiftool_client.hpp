//
// Created by the shotport authors on 07/11/25.
//

/**
 * @file exiftool_client.hpp
 * @brief IMetadataTool implementation that drives the exiftool program.
 */

#ifndef SHOTPORT_EXIFTOOL_CLIENT_HPP
#define SHOTPORT_EXIFTOOL_CLIENT_HPP

#include "metadata_tool.hpp"
#include "process_runner.hpp"
#include <optional>
#include <string>
#include <vector>

namespace shotport {

    /**
     * @brief Runs exiftool once per operation.
     *
     * @details The client keeps only the executable name, so one instance
     * can be shared by every worker. Each call edits the target in place
     * with -overwrite_original. Values are always passed in their raw
     * numeric form (TAG#=VALUE) so no print conversion is involved.
     */
    class ExifToolClient final : public IMetadataTool {
    public:
        explicit ExifToolClient(std::string executable = "exiftool");

        [[nodiscard]] std::string_view get_name() const noexcept override { return "exiftool"; }

        void copy_all_tags(const std::filesystem::path& source, const std::filesystem::path& target) const override;

        [[nodiscard]] std::optional<std::string> read_tag(const std::filesystem::path& source,
                                                          std::string_view tag) const override;

        void set_tags(const std::filesystem::path& target, const MetadataTagSet& tags, TagWriteMode mode) const override;

        /**
         * @brief Runs "exiftool -ver".
         * @return The version string (e.g. "12.76").
         * @throws MetadataWriteError if the program cannot be run.
         */
        [[nodiscard]] std::string version() const;

        /// @return true if version() succeeds.
        [[nodiscard]] bool is_available() const noexcept;

        [[nodiscard]] const std::string& executable() const noexcept { return executable_; }

        /// Command line used by copy_all_tags().
        [[nodiscard]] std::vector<std::string> copy_command(const std::filesystem::path& source,
                                                            const std::filesystem::path& target) const;

        /// Command line used by read_tag().
        [[nodiscard]] std::vector<std::string> read_command(const std::filesystem::path& source,
                                                            std::string_view tag) const;

        /// Command line used by set_tags().
        [[nodiscard]] std::vector<std::string> set_command(const std::filesystem::path& target,
                                                           const MetadataTagSet& tags,
                                                           TagWriteMode mode) const;

        /**
         * @brief Tells whether an exiftool run did what was asked.
         *
         * A zero exit status is success. A non-zero status is still accepted
         * when exiftool only reports that there was nothing to write
         * ("No writable tags", "unchanged") and printed no "Error:" line.
         */
        [[nodiscard]] static bool run_succeeded(const ProcessResult& result);

        /**
         * @brief Extracts the value printed by a read_command() run.
         *
         * The first line that is neither blank nor a "Warning:" line is the
         * value. No such line means the tag is absent.
         *
         * @throws MetadataWriteError if exiftool printed an "Error:" line.
         */
        [[nodiscard]] static std::optional<std::string> parse_tag_value(const ProcessResult& result);

    private:
        void run_checked(const std::vector<std::string>& argv, std::string_view operation) const;

        std::string executable_;
    };

} // namespace shotport

#endif // SHOTPORT_EXIFTOOL_CLIENT_HPP
