//
// Created by the shotport authors on 19/10/25.
//

/**
 * @file png_decoder.hpp
 * @brief Defines the IImageDecoder implementation for PNG files using libpng.
 */

#ifndef SHOTPORT_PNG_DECODER_HPP
#define SHOTPORT_PNG_DECODER_HPP

#include "image_decoder.hpp"
#include <array>
#include <span>
#include <string_view>

namespace shotport {

    /**
     * @brief Implements IImageDecoder for PNG files using libpng.
     *
     * @details Decodes to 8- or 16-bit RGB/RGBA: palettes are expanded,
     * gray is widened to RGB and tRNS becomes an alpha channel, so the
     * canonical raster is bit-exact with the source samples. The chunk
     * stream is then walked to collect the ancillary chunks the output
     * must carry over.
     */
    class PngDecoder final : public IImageDecoder {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PngDecoder";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/png", "image/apng" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".png" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] bool matches_signature(std::span<const unsigned char> header) const noexcept override;

        // --- operations ---

        /**
         * @brief Decodes a PNG held in memory.
         *
         * Chunks are classified with classify_chunk(): structural and
         * pixel-bound chunks are dropped, injected types go to the
         * preserved slots and everything else is carried in source order.
         * Ancillary chunks with a bad CRC are dropped with a warning, and
         * bKGD is kept only in its 6-byte RGB form.
         *
         * @param bytes Complete PNG file.
         * @throws DecodeError if libpng rejects the stream.
         */
        [[nodiscard]] DecodedImage decode(std::span<const unsigned char> bytes) const override;
    };

} // namespace shotport

#endif // SHOTPORT_PNG_DECODER_HPP
