#include "../libshotport/include/png_chunk.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace shotport {
namespace {

    using test::PngBuilder;
    using test::text_chunk;

    TEST(PngChunk, RejectsTypeNamesOfWrongLength)
    {
        EXPECT_THROW(PngChunk("tEX", {}), std::invalid_argument);
        EXPECT_THROW(PngChunk("tEXtt", {}), std::invalid_argument);
        EXPECT_NO_THROW(PngChunk("tEXt", {}));
    }

    TEST(PngChunk, AncillaryBitFollowsFirstLetterCase)
    {
        EXPECT_TRUE(PngChunk("tEXt", {}).is_ancillary());
        EXPECT_TRUE(PngChunk("prVt", {}).is_ancillary());
        EXPECT_FALSE(PngChunk("IDAT", {}).is_ancillary());
        EXPECT_FALSE(PngChunk("PLTE", {}).is_ancillary());
    }

    TEST(ClassifyChunk, CoversEveryRole)
    {
        EXPECT_EQ(classify_chunk("IHDR"), ChunkRole::Structural);
        EXPECT_EQ(classify_chunk("IDAT"), ChunkRole::Structural);
        EXPECT_EQ(classify_chunk("IEND"), ChunkRole::Structural);
        for (const auto t : kInjectedChunkTypes) {
            EXPECT_EQ(classify_chunk(t), ChunkRole::Injected) << t;
        }
        for (const auto t : { "PLTE", "tRNS", "hIST", "acTL", "fcTL", "fdAT" }) {
            EXPECT_EQ(classify_chunk(t), ChunkRole::PixelBound) << t;
        }
        for (const auto t : { "tEXt", "zTXt", "iTXt", "tIME", "iCCP", "gAMA", "cHRM", "bKGD", "prVt" }) {
            EXPECT_EQ(classify_chunk(t), ChunkRole::Carried) << t;
        }
    }

    TEST(ChunkCrc, MatchesIendConstant)
    {
        // every PNG ends with this CRC
        EXPECT_EQ(chunk_crc("IEND", {}), 0xAE426082u);
    }

    TEST(ParsePngChunks, ReturnsChunksInStreamOrder)
    {
        PngBuilder b;
        b.samples = test::pattern(b.row_bytes() * b.height);
        b.before_idat.push_back(text_chunk("Author", "Alice"));
        b.after_idat.emplace_back("tIME", std::vector<unsigned char>{ 0x07, 0xE9, 1, 2, 3, 4, 5 });

        const auto chunks = parse_png_chunks(b.build());
        ASSERT_EQ(chunks.size(), 5u);
        EXPECT_TRUE(chunks[0].is("IHDR"));
        EXPECT_TRUE(chunks[1].is("tEXt"));
        EXPECT_TRUE(chunks[2].is("IDAT"));
        EXPECT_TRUE(chunks[3].is("tIME"));
        EXPECT_TRUE(chunks[4].is("IEND"));
        for (const auto& c : chunks) {
            EXPECT_TRUE(c.crc_ok) << c.type_name();
        }
    }

    TEST(ParsePngChunks, FlagsCrcMismatch)
    {
        PngBuilder b;
        b.samples = test::pattern(b.row_bytes() * b.height);
        b.before_idat.push_back(text_chunk("Author", "Alice"));
        auto png = b.build();

        // IHDR chunk is 25 bytes after the signature; flip a byte of the tEXt payload
        const std::size_t text_data = 8 + 25 + 8;
        png[text_data] ^= 0x01;

        const auto chunks = parse_png_chunks(png);
        ASSERT_TRUE(chunks[1].is("tEXt"));
        EXPECT_FALSE(chunks[1].crc_ok);
        EXPECT_TRUE(chunks[0].crc_ok);
    }

    TEST(ParsePngChunks, StopsAtIend)
    {
        PngBuilder b;
        b.samples = test::pattern(b.row_bytes() * b.height);
        auto png = b.build();
        png.insert(png.end(), { 1, 2, 3, 4, 5 });
        EXPECT_EQ(parse_png_chunks(png).back().type_name(), "IEND");
    }

    TEST(ParsePngChunks, RejectsMalformedStreams)
    {
        PngBuilder b;
        b.samples = test::pattern(b.row_bytes() * b.height);
        const auto good = b.build();

        std::vector<unsigned char> no_sig(good.begin() + 1, good.end());
        EXPECT_THROW((void)parse_png_chunks(no_sig), std::runtime_error);

        std::vector<unsigned char> truncated(good.begin(), good.end() - 20);
        EXPECT_THROW((void)parse_png_chunks(truncated), std::runtime_error);

        std::vector<unsigned char> no_iend(good.begin(), good.end() - 12);
        EXPECT_THROW((void)parse_png_chunks(no_iend), std::runtime_error);

        auto bad_type = good;
        bad_type[8 + 4] = '1';
        EXPECT_THROW((void)parse_png_chunks(bad_type), std::runtime_error);

        auto huge = good;
        huge[8] = 0x80;
        EXPECT_THROW((void)parse_png_chunks(huge), std::runtime_error);
    }

    TEST(SerializePng, RecomputesCrc)
    {
        PngChunk c = text_chunk("k", "v");
        c.crc_ok = false;
        const std::vector<PngChunk> chunks{ c, PngChunk("IEND", {}) };
        const auto parsed = parse_png_chunks(serialize_png(chunks));
        ASSERT_EQ(parsed.size(), 2u);
        EXPECT_TRUE(parsed[0].crc_ok);
        EXPECT_EQ(parsed[0], c);
    }

    TEST(AncillaryChunkSet, KeepsCarriedOrderAndFirstInjected)
    {
        AncillaryChunkSet set;
        EXPECT_TRUE(set.empty());

        EXPECT_FALSE(set.add(PngChunk("IHDR", std::vector<unsigned char>(13))));
        EXPECT_TRUE(set.add(test::text_chunk("A", "1")));
        EXPECT_TRUE(set.add(PngChunk("sRGB", { 2 })));
        EXPECT_FALSE(set.add(PngChunk("PLTE", { 0, 0, 0 })));
        EXPECT_TRUE(set.add(PngChunk("gAMA", { 0, 0, 0xB1, 0x8F })));
        EXPECT_FALSE(set.add(PngChunk("sRGB", { 3 })));
        EXPECT_FALSE(set.add(PngChunk("IDAT", { 1 })));
        EXPECT_TRUE(set.add(test::text_chunk("B", "2")));

        ASSERT_EQ(set.carried().size(), 3u);
        EXPECT_TRUE(set.carried()[0].is("tEXt"));
        EXPECT_TRUE(set.carried()[1].is("gAMA"));
        EXPECT_TRUE(set.carried()[2].is("tEXt"));

        const PngChunk* srgb = set.preserved("sRGB");
        ASSERT_NE(srgb, nullptr);
        EXPECT_EQ(srgb->data, std::vector<unsigned char>{ 2 });
        EXPECT_EQ(set.preserved("pHYs"), nullptr);
        EXPECT_EQ(set.preserved("tEXt"), nullptr);

        EXPECT_EQ(set.size(), 4u);
        EXPECT_FALSE(set.empty());
    }

    TEST(AncillaryChunkSet, NeverCarriesRegeneratedTypes)
    {
        AncillaryChunkSet set;
        for (const auto t : { "IHDR", "IDAT", "IEND", "sRGB", "eXIf", "pHYs", "sBIT", "sRGB", "pHYs" }) {
            (void)set.add(PngChunk(t, { 0 }));
        }
        EXPECT_TRUE(set.carried().empty());
        EXPECT_EQ(set.size(), 4u);
    }

} // namespace
} // namespace shotport
