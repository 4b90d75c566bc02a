//
// Created by the shotport authors on 09/11/25.
//

#include "../../include/conversion_pipeline.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/timestamp.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace shotport {

    bool same_file(const fs::path& a, const fs::path& b) {
        std::error_code ec;
        if (fs::exists(a, ec) && fs::exists(b, ec)) {
            const bool eq = fs::equivalent(a, b, ec);
            if (!ec) return eq;
        }
        const auto ca = fs::weakly_canonical(a, ec);
        if (ec) return a.lexically_normal() == b.lexically_normal();
        const auto cb = fs::weakly_canonical(b, ec);
        if (ec) return a.lexically_normal() == b.lexically_normal();
        return ca == cb;
    }

    ConversionPipeline::ConversionPipeline(const DecoderRegistry& registry,
                                           const IMetadataTool& tool,
                                           const PipelineOptions options)
        : options_(options),
          normalizer_(registry),
          assembler_(AssemblerOptions{options.compression_level}),
          merger_(tool, options.fill_capture_dates) {}

    void ConversionPipeline::restore_layout(const fs::path& output) const {
        try {
            const auto edited = read_file_bytes(output);
            const auto sorted = restore_chunk_layout(edited);
            if (sorted != edited) {
                replace_file_bytes(output, sorted);
                Logger::log(LogLevel::Debug, "chunk layout restored on " + output.string(), "pipeline");
            }
        } catch (const std::exception& e) {
            throw MetadataWriteError("Cannot restore chunk layout of " + output.string() + ": " + e.what());
        }
    }

    ConversionReport ConversionPipeline::convert(const fs::path& input, const fs::path& output) const {
        if (same_file(input, output)) {
            throw OutputWriteError("Output path equals input path: " + input.string());
        }

        ConversionReport report;
        report.source = input;
        report.output = output;

        // 1. normalize
        NormalizedSource src = normalizer_.normalize(input);
        report.decoder = src.decoder;
        report.carried_chunks = src.decoded.chunks.carried().size();
        report.warnings = std::move(src.decoded.warnings);

        // 2. assemble
        AssembledPng png = assembler_.assemble(src.decoded.image, src.decoded.chunks);
        report.warnings.insert(report.warnings.end(), png.warnings.begin(), png.warnings.end());

        // the pixel buffer is no longer needed
        src.decoded.image.pixels.clear();
        src.decoded.image.pixels.shrink_to_fit();

        // 3. write
        try {
            write_file_bytes(output, png.bytes);
        } catch (const std::exception& e) {
            std::error_code ec;
            fs::remove(output, ec);
            throw OutputWriteError(e.what());
        }

        // 4. metadata
        merger_.merge(input, output, src.mtime);
        if (options_.restore_layout) {
            restore_layout(output);
        }

        // 5. timestamp, last write to the output
        if (options_.preserve_timestamp) {
            try {
                restore_mtime(output, src.mtime);
                report.timestamp_restored = true;
            } catch (const TimestampError& e) {
                report.warnings.emplace_back(e.what());
            }
        }

        std::error_code ec;
        const auto in_size = fs::file_size(input, ec);
        report.source_size = ec ? 0 : in_size;
        const auto out_size = fs::file_size(output, ec);
        report.output_size = ec ? 0 : out_size;

        for (const auto& w : report.warnings) {
            Logger::log(LogLevel::Warning, input.filename().string() + ": " + w, "pipeline");
        }
        return report;
    }

} // namespace shotport
