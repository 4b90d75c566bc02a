#include "../libshotport/include/exif_block.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

namespace shotport {
namespace {

    static uint16_t read_u16be(const std::vector<unsigned char>& b, size_t off)
    {
        return static_cast<uint16_t>((b[off] << 8) | b[off + 1]);
    }

    static uint32_t read_u32be(const std::vector<unsigned char>& b, size_t off)
    {
        return (static_cast<uint32_t>(b[off]) << 24) | (static_cast<uint32_t>(b[off + 1]) << 16)
               | (static_cast<uint32_t>(b[off + 2]) << 8) | static_cast<uint32_t>(b[off + 3]);
    }

    TEST(DefaultExif, IsBigEndianTiffWithFourEntries)
    {
        const auto exif = build_default_exif();
        ASSERT_EQ(exif.size(), 78u);
        EXPECT_TRUE(has_tiff_header(exif));
        EXPECT_EQ(exif[0], 'M');
        EXPECT_EQ(read_u32be(exif, 4), 8u);
        EXPECT_EQ(read_u16be(exif, 8), 4u);
        // no IFD1
        EXPECT_EQ(read_u32be(exif, 10 + 4 * 12), 0u);
    }

    TEST(DefaultExif, HoldsScreenshotValues)
    {
        const auto exif = build_default_exif();

        // entry 0: Orientation SHORT 1
        EXPECT_EQ(read_u16be(exif, 10), 0x0112u);
        EXPECT_EQ(read_u16be(exif, 12), 3u);
        EXPECT_EQ(read_u16be(exif, 18), 1u);

        // entries 1 and 2: X/YResolution RATIONAL pointing at 144/1
        for (size_t e = 1; e <= 2; ++e) {
            const size_t base = 10 + e * 12;
            EXPECT_EQ(read_u16be(exif, base + 2), 5u);
            const uint32_t off = read_u32be(exif, base + 8);
            ASSERT_LE(off + 8, exif.size());
            EXPECT_EQ(read_u32be(exif, off), kScreenshotDpi);
            EXPECT_EQ(read_u32be(exif, off + 4), 1u);
        }
        EXPECT_EQ(read_u16be(exif, 22), 0x011Au);
        EXPECT_EQ(read_u16be(exif, 34), 0x011Bu);

        // entry 3: ResolutionUnit SHORT 2 (inches)
        EXPECT_EQ(read_u16be(exif, 46), 0x0128u);
        EXPECT_EQ(read_u16be(exif, 54), 2u);
    }

    TEST(TiffHeader, AcceptsBothByteOrders)
    {
        const std::vector<unsigned char> ii { 'I', 'I', 0x2A, 0, 8, 0, 0, 0 };
        const std::vector<unsigned char> mm { 'M', 'M', 0, 0x2A, 0, 0, 0, 8 };
        const std::vector<unsigned char> exif_prefix { 'E', 'x', 'i', 'f', 0, 0, 'M', 'M' };
        const std::vector<unsigned char> short_buf { 'M', 'M', 0, 0x2A };
        EXPECT_TRUE(has_tiff_header(ii));
        EXPECT_TRUE(has_tiff_header(mm));
        EXPECT_FALSE(has_tiff_header(exif_prefix));
        EXPECT_FALSE(has_tiff_header(short_buf));
    }

} // namespace
} // namespace shotport
