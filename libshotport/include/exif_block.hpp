//
// Created by the shotport authors on 05/11/25.
//

#ifndef SHOTPORT_EXIF_BLOCK_HPP
#define SHOTPORT_EXIF_BLOCK_HPP

#include <cstdint>
#include <span>
#include <vector>

namespace shotport {

/// Screenshot resolution written into EXIF and pHYs.
inline constexpr std::uint32_t kScreenshotDpi = 144;

/**
 * @brief Builds the EXIF payload of a freshly injected eXIf chunk.
 *
 * The block is a big-endian TIFF structure with a single IFD0 carrying
 * Orientation = 1, XResolution = YResolution = 144/1 and
 * ResolutionUnit = 2 (inches). It has no "Exif\0\0" prefix, as eXIf
 * requires.
 */
[[nodiscard]] std::vector<unsigned char> build_default_exif();

/**
 * @brief Checks that a buffer starts with a TIFF header ("II*\0" or "MM\0*").
 */
[[nodiscard]] bool has_tiff_header(std::span<const unsigned char> data) noexcept;

} // namespace shotport

#endif // SHOTPORT_EXIF_BLOCK_HPP
