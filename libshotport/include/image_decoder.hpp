//
// Created by the shotport authors on 19/10/25.
//

#ifndef SHOTPORT_IMAGE_DECODER_HPP
#define SHOTPORT_IMAGE_DECODER_HPP

#include "png_chunk.hpp"
#include "raster_image.hpp"
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * @namespace shotport
 * @brief The main namespace of the shotport library.
 *
 * @details Contains the conversion pipeline (decoders, PNG assembler,
 * metadata merge, timestamp preservation), the batch executor and the
 * utilities they share.
 */
namespace shotport {

/**
 * @brief Result of decoding one source image.
 */
struct DecodedImage {
    RasterImage image;                  ///< Canonical RGB(A) pixels
    AncillaryChunkSet chunks;           ///< Source PNG chunks to carry over (empty for JPEG)
    std::vector<std::string> warnings;  ///< Non-fatal oddities found while decoding
};

/**
 * @brief Interface for an input format decoder.
 *
 * Each implementation targets one raster format. It describes the formats
 * it handles (MIME types, extensions, magic bytes) and decodes an in-memory
 * file into the canonical RasterImage.
 *
 * Implementations are stateless: the DecoderRegistry owns one instance of
 * each and shares it between worker threads.
 */
class IImageDecoder {
public:
    virtual ~IImageDecoder() = default;

    // --- self-description ---

    /// @return Human-readable name of the decoder (e.g. "PngDecoder").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return List of supported MIME types (e.g. "image/png").
    [[nodiscard]] virtual std::span<const std::string_view>
    get_supported_mime_types() const noexcept = 0;

    /// @return List of supported file extensions, lowercase with the dot (e.g. ".png").
    [[nodiscard]] virtual std::span<const std::string_view>
    get_supported_extensions() const noexcept = 0;

    /**
     * @brief Checks the magic bytes of a file.
     * @param header The first bytes of the file (may be shorter than needed).
     * @return true if the content looks like this decoder's format.
     */
    [[nodiscard]] virtual bool matches_signature(std::span<const unsigned char> header) const noexcept = 0;

    // --- operations ---

    /**
     * @brief Decodes a complete file held in memory.
     * @param bytes The file content.
     * @return The canonical raster plus the chunks to carry over.
     * @throws DecodeError if the data is not a valid image of this format.
     */
    [[nodiscard]] virtual DecodedImage decode(std::span<const unsigned char> bytes) const = 0;
};

} // namespace shotport

#endif // SHOTPORT_IMAGE_DECODER_HPP
