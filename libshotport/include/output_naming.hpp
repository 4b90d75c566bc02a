//
// Created by the shotport authors on 10/11/25.
//

/**
 * @file output_naming.hpp
 * @brief Output file names and collision handling for a batch run.
 */

#ifndef SHOTPORT_OUTPUT_NAMING_HPP
#define SHOTPORT_OUTPUT_NAMING_HPP

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

namespace shotport {

    /**
     * @brief One file to convert and where its result goes.
     */
    struct ConversionJob {
        std::filesystem::path source;
        std::filesystem::path output;
    };

    /**
     * @brief File name of the converted image.
     *
     * A ".png" source (any case) keeps its name; anything else keeps its
     * stem and gets ".png".
     */
    [[nodiscard]] std::filesystem::path output_filename(const std::filesystem::path& source);

    /**
     * @brief Output path used when a single file is converted without an
     * output directory: "<stem>_ios.png" next to the source.
     */
    [[nodiscard]] std::filesystem::path sibling_output_path(const std::filesystem::path& source);

    /**
     * @brief Hands out unique output paths inside one directory.
     *
     * @details The first file to claim a name gets it unchanged; later
     * claims get "_1", "_2", ... before the extension. Names are compared
     * case-insensitively so the result is also unique on case-insensitive
     * filesystems. Only names handed out by this allocator are considered,
     * existing files in the directory are overwritten. Not thread-safe:
     * allocate every name before dispatching work.
     */
    class OutputNameAllocator {
    public:
        explicit OutputNameAllocator(std::filesystem::path output_dir);

        /// Allocates the output path for @p source.
        [[nodiscard]] std::filesystem::path allocate(const std::filesystem::path& source);

        [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }

    private:
        bool claim(const std::string& name);

        std::filesystem::path dir_;
        std::unordered_set<std::string> taken_;
    };

    /**
     * @brief Builds the job list of a batch run, in input order.
     */
    [[nodiscard]] std::vector<ConversionJob> plan_jobs(const std::vector<std::filesystem::path>& sources,
                                                       const std::filesystem::path& output_dir);

} // namespace shotport

#endif // SHOTPORT_OUTPUT_NAMING_HPP
