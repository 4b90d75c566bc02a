//
// Created by the shotport authors on 05/11/25.
//

#include "../../include/exif_block.hpp"
#include <cstddef>

namespace shotport {

    namespace {

        // TIFF field types
        constexpr std::uint16_t kTypeShort = 3;
        constexpr std::uint16_t kTypeRational = 5;

        // IFD0 tags, ascending as TIFF requires
        constexpr std::uint16_t kTagOrientation = 0x0112;
        constexpr std::uint16_t kTagXResolution = 0x011A;
        constexpr std::uint16_t kTagYResolution = 0x011B;
        constexpr std::uint16_t kTagResolutionUnit = 0x0128;

        constexpr std::uint16_t kOrientationNormal = 1;
        constexpr std::uint16_t kResolutionUnitInch = 2;

        void put_u16be(std::vector<unsigned char>& out, const std::uint16_t v) {
            out.push_back(static_cast<unsigned char>((v >> 8) & 0xFF));
            out.push_back(static_cast<unsigned char>(v & 0xFF));
        }

        void put_u32be(std::vector<unsigned char>& out, const std::uint32_t v) {
            out.push_back(static_cast<unsigned char>((v >> 24) & 0xFF));
            out.push_back(static_cast<unsigned char>((v >> 16) & 0xFF));
            out.push_back(static_cast<unsigned char>((v >> 8) & 0xFF));
            out.push_back(static_cast<unsigned char>(v & 0xFF));
        }

        // SHORT values are left-justified in the 4-byte value field
        void put_short_entry(std::vector<unsigned char>& out, const std::uint16_t tag, const std::uint16_t value) {
            put_u16be(out, tag);
            put_u16be(out, kTypeShort);
            put_u32be(out, 1);
            put_u16be(out, value);
            put_u16be(out, 0);
        }

        void put_rational_entry(std::vector<unsigned char>& out, const std::uint16_t tag, const std::uint32_t offset) {
            put_u16be(out, tag);
            put_u16be(out, kTypeRational);
            put_u32be(out, 1);
            put_u32be(out, offset);
        }

    } // namespace

    std::vector<unsigned char> build_default_exif() {
        constexpr std::uint16_t entry_count = 4;
        constexpr std::uint32_t ifd_offset = 8;
        constexpr std::uint32_t ifd_size = 2 + entry_count * 12 + 4;
        constexpr std::uint32_t x_res_offset = ifd_offset + ifd_size;
        constexpr std::uint32_t y_res_offset = x_res_offset + 8;

        std::vector<unsigned char> out;
        out.reserve(y_res_offset + 8);

        // header: big-endian, magic 42, offset of IFD0
        out.insert(out.end(), {'M', 'M', 0x00, 0x2A});
        put_u32be(out, ifd_offset);

        put_u16be(out, entry_count);
        put_short_entry(out, kTagOrientation, kOrientationNormal);
        put_rational_entry(out, kTagXResolution, x_res_offset);
        put_rational_entry(out, kTagYResolution, y_res_offset);
        put_short_entry(out, kTagResolutionUnit, kResolutionUnitInch);
        put_u32be(out, 0); // no IFD1

        put_u32be(out, kScreenshotDpi);
        put_u32be(out, 1);
        put_u32be(out, kScreenshotDpi);
        put_u32be(out, 1);

        return out;
    }

    bool has_tiff_header(const std::span<const unsigned char> data) noexcept {
        if (data.size() < 8) return false;
        const bool little = data[0] == 'I' && data[1] == 'I' && data[2] == 0x2A && data[3] == 0x00;
        const bool big = data[0] == 'M' && data[1] == 'M' && data[2] == 0x00 && data[3] == 0x2A;
        return little || big;
    }

} // namespace shotport
