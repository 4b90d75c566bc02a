//
// Created by the shotport authors on 03/11/25.
//

#ifndef SHOTPORT_RASTER_IMAGE_HPP
#define SHOTPORT_RASTER_IMAGE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace shotport {

/**
 * @brief Channel layout of a canonical pixel buffer.
 */
enum class PixelLayout {
    Rgb, ///< 3 samples per pixel
    Rgba ///< 4 samples per pixel, straight alpha
};

/**
 * @brief Canonical decoded image, shared by every decoder and the assembler.
 *
 * Rows are stored top to bottom without padding. 16-bit samples are stored
 * big-endian, which is the PNG byte order, so the buffer can be handed to
 * libpng unchanged.
 */
struct RasterImage {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    PixelLayout layout = PixelLayout::Rgb;
    std::uint8_t bit_depth = 8;             ///< 8 or 16
    std::vector<unsigned char> pixels;

    [[nodiscard]] unsigned channels() const noexcept {
        return layout == PixelLayout::Rgba ? 4u : 3u;
    }

    [[nodiscard]] std::size_t row_bytes() const noexcept {
        return static_cast<std::size_t>(width) * channels() * (bit_depth / 8u);
    }

    [[nodiscard]] bool has_alpha() const noexcept { return layout == PixelLayout::Rgba; }
};

} // namespace shotport

#endif // SHOTPORT_RASTER_IMAGE_HPP
