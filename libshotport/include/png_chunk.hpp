//
// Created by the shotport authors on 04/11/25.
//

/**
 * @file png_chunk.hpp
 * @brief PNG chunk stream model: parsing, serialization and classification.
 */

#ifndef SHOTPORT_PNG_CHUNK_HPP
#define SHOTPORT_PNG_CHUNK_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace shotport {

/// The 8-byte signature that opens every PNG stream.
inline constexpr std::array<unsigned char, 8> kPngSignature = {137, 'P', 'N', 'G', 13, 10, 26, 10};

/**
 * @brief One chunk of a PNG stream, without its length and CRC fields.
 */
struct PngChunk {
    std::array<char, 4> type{};
    std::vector<unsigned char> data;
    bool crc_ok = true; ///< False if the CRC read from the source did not match

    PngChunk() = default;
    PngChunk(std::string_view type_name, std::vector<unsigned char> payload);

    [[nodiscard]] std::string_view type_name() const noexcept {
        return {type.data(), type.size()};
    }

    [[nodiscard]] bool is(const std::string_view name) const noexcept {
        return type_name() == name;
    }

    /// Ancillary chunks have bit 5 of the first type byte set (lowercase letter).
    [[nodiscard]] bool is_ancillary() const noexcept {
        return (static_cast<unsigned char>(type[0]) & 0x20u) != 0;
    }

    bool operator==(const PngChunk& other) const {
        return type == other.type && data == other.data;
    }
};

/**
 * @brief How the converter treats a chunk type found in a source PNG.
 */
enum class ChunkRole {
    Structural, ///< IHDR, IDAT, IEND: always regenerated
    Injected,   ///< sRGB, eXIf, pHYs, sBIT: regenerated unless the source had one
    PixelBound, ///< Bound to the source pixel encoding; folded into the raster or dropped
    Carried     ///< Copied to the output verbatim, in source order
};

/**
 * @brief Classifies a chunk type.
 * @param type Four-character chunk type.
 */
[[nodiscard]] ChunkRole classify_chunk(std::string_view type) noexcept;

/// Chunk types injected by the assembler, in output order.
inline constexpr std::array<std::string_view, 4> kInjectedChunkTypes = {"sRGB", "eXIf", "pHYs", "sBIT"};

/**
 * @brief Computes the CRC-32 of a chunk (over type and data) using zlib.
 */
[[nodiscard]] std::uint32_t chunk_crc(std::string_view type, std::span<const unsigned char> data);

/**
 * @brief Checks whether a buffer starts with the PNG signature.
 */
[[nodiscard]] bool has_png_signature(std::span<const unsigned char> bytes) noexcept;

/**
 * @brief Splits a PNG byte stream into chunks.
 *
 * Parsing stops after IEND. Chunks with a CRC mismatch are returned with
 * crc_ok = false; deciding what to do with them is up to the caller.
 *
 * @param bytes Complete PNG stream, signature included.
 * @return The chunks in stream order.
 * @throws std::runtime_error if the signature is missing, a chunk is
 * truncated, a length exceeds 2^31-1 or IEND is missing.
 */
[[nodiscard]] std::vector<PngChunk> parse_png_chunks(std::span<const unsigned char> bytes);

/**
 * @brief Appends one chunk (length, type, data, CRC) to a byte stream.
 */
void append_png_chunk(std::vector<unsigned char>& out, const PngChunk& chunk);

/**
 * @brief Serializes a chunk list into a PNG stream, signature included.
 *
 * CRCs are always recomputed.
 */
[[nodiscard]] std::vector<unsigned char> serialize_png(std::span<const PngChunk> chunks);

/**
 * @brief Ancillary chunks extracted from a source PNG.
 *
 * @details Keeps two things apart:
 * - the carried chunks, in source order, which the assembler copies between
 *   sRGB and eXIf;
 * - for each injected type (sRGB, eXIf, pHYs, sBIT), the first chunk of that
 *   type found in the source, reused verbatim instead of the default.
 *
 * Structural and pixel-bound chunks are rejected by add(). A carried chunk
 * is never of a structural or injected type.
 */
class AncillaryChunkSet {
public:
    /**
     * @brief Offers a source chunk to the set.
     * @param chunk Chunk taken from the source stream.
     * @return true if the chunk was retained (carried or preserved), false if
     * it was dropped (structural, pixel-bound or a duplicate injected type).
     */
    bool add(PngChunk chunk);

    /// Chunks copied verbatim between sRGB and eXIf, in source order.
    [[nodiscard]] const std::vector<PngChunk>& carried() const noexcept { return carried_; }

    /**
     * @brief Looks up the preserved source chunk of an injected type.
     * @param type One of kInjectedChunkTypes.
     * @return The source chunk, or nullptr if the source had none.
     */
    [[nodiscard]] const PngChunk* preserved(std::string_view type) const noexcept;

    [[nodiscard]] bool empty() const noexcept;

    /// Number of retained chunks (carried plus preserved).
    [[nodiscard]] std::size_t size() const noexcept;

private:
    [[nodiscard]] static std::optional<std::size_t> injected_slot(std::string_view type) noexcept;

    std::vector<PngChunk> carried_;
    std::array<std::optional<PngChunk>, kInjectedChunkTypes.size()> preserved_{};
};

} // namespace shotport

#endif // SHOTPORT_PNG_CHUNK_HPP
