//
// Created by the shotport authors on 19/10/25.
//

/**
 * @file jpeg_decoder.hpp
 * @brief Defines the IImageDecoder implementation for JPEG files.
 */

#ifndef SHOTPORT_JPEG_DECODER_HPP
#define SHOTPORT_JPEG_DECODER_HPP

#include "image_decoder.hpp"
#include <array>
#include <span>
#include <string_view>

namespace shotport {

    /**
     * @brief Implements IImageDecoder for JPEG files using libjpeg.
     *
     * @details Performs a full decode to 8-bit RGB; grayscale and YCbCr
     * sources are converted by libjpeg. CMYK sources are rejected. JPEG
     * has no PNG chunks, so the carry-over set is always empty: its EXIF
     * travels to the output through the metadata tool instead.
     */
    class JpegDecoder final : public IImageDecoder {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JpegDecoder";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/jpeg", "image/pjpeg" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 3> kExts = { ".jpg", ".jpeg", ".jpe" };
            return {kExts.data(), kExts.size()};
        }

        /// JPEG streams start with the SOI marker followed by another marker.
        [[nodiscard]] bool matches_signature(std::span<const unsigned char> header) const noexcept override;

        // --- operations ---

        /**
         * @brief Decodes a JPEG held in memory.
         * @param bytes Complete JPEG file.
         * @throws DecodeError if libjpeg rejects the stream or its color space.
         */
        [[nodiscard]] DecodedImage decode(std::span<const unsigned char> bytes) const override;
    };

} // namespace shotport

#endif // SHOTPORT_JPEG_DECODER_HPP
