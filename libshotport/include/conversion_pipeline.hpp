//
// Created by the shotport authors on 09/11/25.
//

/**
 * @file conversion_pipeline.hpp
 * @brief The per-file conversion: normalize, assemble, write, merge metadata,
 * restore the timestamp.
 */

#ifndef SHOTPORT_CONVERSION_PIPELINE_HPP
#define SHOTPORT_CONVERSION_PIPELINE_HPP

#include "decoder_registry.hpp"
#include "format_normalizer.hpp"
#include "metadata_merger.hpp"
#include "metadata_tool.hpp"
#include "png_assembler.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace shotport {

/**
 * @brief Switches and tunables of a ConversionPipeline.
 */
struct PipelineOptions {
    bool preserve_timestamp = true;  ///< Copy the source mtime onto the output
    bool fill_capture_dates = true;  ///< Add DateTimeOriginal & co. when the source lacks them
    bool restore_layout = true;      ///< Re-sort chunks after the metadata tool ran
    int compression_level = 9;       ///< zlib level for IDAT
};

/**
 * @brief What happened to one file.
 */
struct ConversionReport {
    std::filesystem::path source;
    std::filesystem::path output;
    std::string_view decoder;           ///< Decoder that read the source
    std::vector<std::string> warnings;  ///< Non-fatal issues (decoder, assembler, timestamp)
    std::size_t carried_chunks = 0;     ///< Source chunks copied into the output
    std::uintmax_t source_size = 0;
    std::uintmax_t output_size = 0;
    bool timestamp_restored = false;
};

/**
 * @brief Converts one file into an iOS-compatible screenshot PNG.
 *
 * @details Stages run strictly in order on a single thread:
 * FormatNormalizer, PngAssembler, write, MetadataMergeEngine, chunk layout
 * restoration, restore_mtime(). A pipeline holds no per-file state, so
 * a single instance can convert many files from several threads. The
 * registry and tool are borrowed and must outlive the pipeline.
 */
class ConversionPipeline {
public:
    ConversionPipeline(const DecoderRegistry& registry,
                       const IMetadataTool& tool,
                       PipelineOptions options = {});

    /**
     * @brief Converts @p input into @p output.
     *
     * @throws DecodeError if the input cannot be decoded.
     * @throws AssemblyError if the decoded raster cannot be encoded.
     * @throws OutputWriteError if @p output refers to @p input or cannot
     * be written. Nothing is left on disk in that case.
     * @throws MetadataWriteError if the metadata tool fails. The output PNG
     * stays on disk with correct pixels; its chunk layout and metadata may
     * be incomplete since layout restoration does not run.
     *
     * A TimestampError is not thrown: it is logged and added to the
     * report's warnings.
     */
    [[nodiscard]] ConversionReport convert(const std::filesystem::path& input,
                                           const std::filesystem::path& output) const;

    [[nodiscard]] const PipelineOptions& options() const noexcept { return options_; }

private:
    void restore_layout(const std::filesystem::path& output) const;

    PipelineOptions options_;
    FormatNormalizer normalizer_;
    PngAssembler assembler_;
    MetadataMergeEngine merger_;
};

/**
 * @brief Tells whether two paths name the same file (existing or not).
 */
[[nodiscard]] bool same_file(const std::filesystem::path& a, const std::filesystem::path& b);

} // namespace shotport

#endif // SHOTPORT_CONVERSION_PIPELINE_HPP
