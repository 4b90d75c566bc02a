//
// Created by the shotport authors on 04/11/25.
//

#include "../../include/png_chunk.hpp"
#include <png.h>
#include <zlib.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace shotport {

    PngChunk::PngChunk(const std::string_view type_name, std::vector<unsigned char> payload)
        : data(std::move(payload)) {
        if (type_name.size() != type.size()) {
            throw std::invalid_argument("PNG chunk type must be 4 characters: " + std::string(type_name));
        }
        std::copy(type_name.begin(), type_name.end(), type.begin());
    }

    ChunkRole classify_chunk(const std::string_view type) noexcept {
        if (type == "IHDR" || type == "IDAT" || type == "IEND") {
            return ChunkRole::Structural;
        }
        if (std::find(kInjectedChunkTypes.begin(), kInjectedChunkTypes.end(), type) != kInjectedChunkTypes.end()) {
            return ChunkRole::Injected;
        }
        // palette and transparency are expanded by the decoder, histogram refers to
        // the palette, and APNG frames are encoded with the source IHDR
        if (type == "PLTE" || type == "tRNS" || type == "hIST" ||
            type == "acTL" || type == "fcTL" || type == "fdAT") {
            return ChunkRole::PixelBound;
        }
        return ChunkRole::Carried;
    }

    std::uint32_t chunk_crc(const std::string_view type, const std::span<const unsigned char> data) {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(type.data()), static_cast<uInt>(type.size()));
        if (!data.empty()) {
            crc = crc32(crc, data.data(), static_cast<uInt>(data.size()));
        }
        return static_cast<std::uint32_t>(crc);
    }

    bool has_png_signature(const std::span<const unsigned char> bytes) noexcept {
        return bytes.size() >= kPngSignature.size() &&
               std::equal(kPngSignature.begin(), kPngSignature.end(), bytes.begin());
    }

    std::vector<PngChunk> parse_png_chunks(const std::span<const unsigned char> bytes) {
        if (!has_png_signature(bytes)) {
            throw std::runtime_error("Not a PNG stream (bad signature)");
        }

        std::vector<PngChunk> chunks;
        std::size_t offset = kPngSignature.size();
        bool seen_iend = false;

        while (!seen_iend && offset + 12 <= bytes.size()) {
            const unsigned char* p = bytes.data() + offset;
            const png_uint_32 length = png_get_uint_32(p);
            if (length > PNG_UINT_31_MAX) {
                throw std::runtime_error("PNG chunk length out of range at offset " + std::to_string(offset));
            }
            if (bytes.size() - offset - 12 < length) {
                throw std::runtime_error("Truncated PNG chunk at offset " + std::to_string(offset));
            }

            PngChunk chunk;
            std::copy(p + 4, p + 8, chunk.type.begin());
            if (!std::all_of(chunk.type.begin(), chunk.type.end(),
                             [](const char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; })) {
                throw std::runtime_error("Invalid PNG chunk type at offset " + std::to_string(offset));
            }
            chunk.data.assign(p + 8, p + 8 + length);

            const png_uint_32 stored_crc = png_get_uint_32(p + 8 + length);
            chunk.crc_ok = stored_crc == chunk_crc(chunk.type_name(), chunk.data);

            seen_iend = chunk.is("IEND");
            chunks.push_back(std::move(chunk));
            offset += 12 + static_cast<std::size_t>(length);
        }

        if (!seen_iend) {
            throw std::runtime_error("PNG stream has no IEND chunk");
        }
        return chunks;
    }

    void append_png_chunk(std::vector<unsigned char>& out, const PngChunk& chunk) {
        if (chunk.data.size() > PNG_UINT_31_MAX) {
            throw std::length_error("PNG chunk too large: " + std::string(chunk.type_name()));
        }
        const std::size_t start = out.size();
        out.resize(start + 12 + chunk.data.size());
        unsigned char* p = out.data() + start;

        png_save_uint_32(p, static_cast<png_uint_32>(chunk.data.size()));
        std::copy(chunk.type.begin(), chunk.type.end(), p + 4);
        std::copy(chunk.data.begin(), chunk.data.end(), p + 8);
        png_save_uint_32(p + 8 + chunk.data.size(), chunk_crc(chunk.type_name(), chunk.data));
    }

    std::vector<unsigned char> serialize_png(const std::span<const PngChunk> chunks) {
        std::size_t total = kPngSignature.size();
        for (const auto& c : chunks) total += 12 + c.data.size();

        std::vector<unsigned char> out;
        out.reserve(total);
        out.insert(out.end(), kPngSignature.begin(), kPngSignature.end());
        for (const auto& c : chunks) {
            append_png_chunk(out, c);
        }
        return out;
    }

    std::optional<std::size_t> AncillaryChunkSet::injected_slot(const std::string_view type) noexcept {
        for (std::size_t i = 0; i < kInjectedChunkTypes.size(); ++i) {
            if (kInjectedChunkTypes[i] == type) return i;
        }
        return std::nullopt;
    }

    bool AncillaryChunkSet::add(PngChunk chunk) {
        switch (classify_chunk(chunk.type_name())) {
            case ChunkRole::Structural:
            case ChunkRole::PixelBound:
                return false;
            case ChunkRole::Injected: {
                auto& slot = preserved_[*injected_slot(chunk.type_name())];
                if (slot) return false; // keep the first occurrence only
                slot = std::move(chunk);
                return true;
            }
            case ChunkRole::Carried:
                carried_.push_back(std::move(chunk));
                return true;
        }
        return false;
    }

    const PngChunk* AncillaryChunkSet::preserved(const std::string_view type) const noexcept {
        const auto slot = injected_slot(type);
        if (!slot || !preserved_[*slot]) return nullptr;
        return &*preserved_[*slot];
    }

    bool AncillaryChunkSet::empty() const noexcept {
        return size() == 0;
    }

    std::size_t AncillaryChunkSet::size() const noexcept {
        return carried_.size() + static_cast<std::size_t>(
            std::count_if(preserved_.begin(), preserved_.end(), [](const auto& s) { return s.has_value(); }));
    }

} // namespace shotport
