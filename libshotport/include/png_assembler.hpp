//
// Created by the shotport authors on 06/11/25.
//

/**
 * @file png_assembler.hpp
 * @brief Builds the iOS-compatible PNG byte stream from a canonical raster.
 */

#ifndef SHOTPORT_PNG_ASSEMBLER_HPP
#define SHOTPORT_PNG_ASSEMBLER_HPP

#include "exif_block.hpp"
#include "png_chunk.hpp"
#include "raster_image.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace shotport {

/// 144 DPI expressed in pixels per meter, rounded to nearest (5669).
inline constexpr std::uint32_t kDefaultPixelsPerMeter =
    static_cast<std::uint32_t>(kScreenshotDpi / 0.0254 + 0.5);

/// sRGB rendering intent written when the source had no sRGB chunk (perceptual).
inline constexpr unsigned char kDefaultRenderingIntent = 0;

/**
 * @brief Tunables of the PNG encoder.
 */
struct AssemblerOptions {
    int compression_level = 9; ///< zlib level for IDAT, 0..9
};

/**
 * @brief Output of PngAssembler::assemble().
 */
struct AssembledPng {
    std::vector<unsigned char> bytes;
    std::vector<std::string> warnings; ///< Preserved chunks that had to be replaced
};

/**
 * @brief Emits PNG streams with the fixed chunk order
 * IHDR, sRGB, carried chunks, eXIf, pHYs, sBIT, IDAT, IEND.
 *
 * @details IHDR and IDAT always come from the raster. sRGB, eXIf, pHYs and
 * sBIT reuse the source chunk bytes when the AncillaryChunkSet preserved
 * one, and fall back to default_chunk_payload() otherwise. A preserved sBIT
 * whose length does not match the output channel count is replaced by the
 * default and reported in AssembledPng::warnings.
 *
 * The assembler holds only options and is safe to share between threads.
 */
class PngAssembler {
public:
    explicit PngAssembler(AssemblerOptions options = {});

    /**
     * @brief Builds the complete PNG stream.
     * @param image Canonical raster to encode losslessly.
     * @param chunks Chunks extracted from the source (empty for JPEG sources).
     * @throws AssemblyError if the raster is empty, oversized, has an
     * unsupported layout or bit depth, a pixel buffer of the wrong size, or
     * if libpng fails to encode it.
     */
    [[nodiscard]] AssembledPng assemble(const RasterImage& image, const AncillaryChunkSet& chunks) const;

    [[nodiscard]] const AssemblerOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] std::vector<PngChunk> encode_idat(const RasterImage& image) const;

    AssemblerOptions options_;
};

/**
 * @brief Default payload of an injected chunk for a given raster.
 * @param type One of kInjectedChunkTypes.
 * @param image The raster being encoded (sBIT depends on its layout).
 * @throws std::invalid_argument for any other chunk type.
 */
[[nodiscard]] std::vector<unsigned char> default_chunk_payload(std::string_view type, const RasterImage& image);

/**
 * @brief Builds the 13-byte IHDR payload for a raster.
 */
[[nodiscard]] std::vector<unsigned char> make_ihdr_payload(const RasterImage& image);

/**
 * @brief Re-serializes an existing PNG into the canonical chunk order.
 *
 * Used after an external tool has edited the file. Chunks that are not
 * IHDR, sRGB, eXIf, pHYs, sBIT, IDAT or IEND are placed between sRGB and
 * eXIf in the order they appear. Only the first chunk of each of IHDR,
 * sRGB, eXIf, pHYs and sBIT is kept. Payloads are never changed and
 * missing chunks are not synthesized.
 *
 * @param png Complete PNG stream.
 * @return The reordered stream (identical bytes if already canonical).
 * @throws std::runtime_error if the stream cannot be parsed.
 */
[[nodiscard]] std::vector<unsigned char> restore_chunk_layout(std::span<const unsigned char> png);

} // namespace shotport

#endif // SHOTPORT_PNG_ASSEMBLER_HPP
