//
// Created by the shotport authors on 05/11/25.
//

/**
 * @file format_normalizer.hpp
 * @brief First stage of the pipeline: any supported input to a canonical raster.
 */

#ifndef SHOTPORT_FORMAT_NORMALIZER_HPP
#define SHOTPORT_FORMAT_NORMALIZER_HPP

#include "decoder_registry.hpp"
#include "image_decoder.hpp"
#include <filesystem>
#include <span>
#include <string_view>

namespace shotport {

/**
 * @brief Everything the later stages need to know about one source file.
 */
struct NormalizedSource {
    std::filesystem::path path;             ///< Source file as given
    std::filesystem::file_time_type mtime;  ///< Captured before the file was read
    std::string_view decoder;               ///< Name of the decoder that handled the file
    DecodedImage decoded;                   ///< Raster, carried chunks and decoder warnings
};

/**
 * @brief Decodes a JPEG or PNG file into a NormalizedSource.
 *
 * @details The decoder is chosen from the file content first (magic bytes),
 * then from the libmagic MIME type, then from the extension. The normalizer
 * only borrows the registry; it must outlive the normalizer.
 */
class FormatNormalizer {
public:
    explicit FormatNormalizer(const DecoderRegistry& registry) : registry_(registry) {}

    /**
     * @brief Captures the mtime, reads and decodes @p source.
     * @throws DecodeError if the file is missing, unreadable, empty, of an
     * unsupported type or corrupt.
     */
    [[nodiscard]] NormalizedSource normalize(const std::filesystem::path& source) const;

    /**
     * @brief Picks the decoder for a file.
     * @param source Path, used for the MIME and extension fallbacks.
     * @param content File content, used for signature sniffing.
     * @return Non-owning pointer, or nullptr if no decoder applies.
     */
    [[nodiscard]] const IImageDecoder* select_decoder(const std::filesystem::path& source,
                                                      std::span<const unsigned char> content) const;

private:
    const DecoderRegistry& registry_;
};

} // namespace shotport

#endif // SHOTPORT_FORMAT_NORMALIZER_HPP
