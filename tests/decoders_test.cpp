#include "../libshotport/include/decoder_registry.hpp"
#include "../libshotport/include/errors.hpp"
#include "../libshotport/include/format_normalizer.hpp"
#include "../libshotport/include/jpeg_decoder.hpp"
#include "../libshotport/include/mime_detector.hpp"
#include "../libshotport/include/png_decoder.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

namespace shotport {
namespace {

    using test::PngBuilder;
    using test::text_chunk;

    PngBuilder rgb_builder(uint32_t w = 4, uint32_t h = 3)
    {
        PngBuilder b;
        b.width  = w;
        b.height = h;
        b.samples = test::pattern(b.row_bytes() * h);
        return b;
    }

    bool has_warning(const DecodedImage& d, const std::string& needle)
    {
        for (const auto& w : d.warnings) {
            if (w.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    TEST(PngDecoder, KeepsTextAndPreservesSrgb)
    {
        PngBuilder b = rgb_builder();
        b.before_idat.emplace_back("sRGB", std::vector<unsigned char> { 1 });
        b.before_idat.push_back(text_chunk("Author", "Alice"));

        const DecodedImage d = PngDecoder().decode(b.build());
        EXPECT_EQ(d.image.layout, PixelLayout::Rgb);
        EXPECT_EQ(d.image.bit_depth, 8u);
        EXPECT_EQ(d.image.pixels, b.samples);

        ASSERT_EQ(d.chunks.carried().size(), 1u);
        EXPECT_EQ(d.chunks.carried()[0], text_chunk("Author", "Alice"));
        ASSERT_NE(d.chunks.preserved("sRGB"), nullptr);
        EXPECT_EQ(d.chunks.preserved("sRGB")->data, std::vector<unsigned char> { 1 });
        EXPECT_TRUE(d.warnings.empty());
    }

    TEST(PngDecoder, CarriesChunksFoundAfterIdat)
    {
        PngBuilder b = rgb_builder();
        b.before_idat.push_back(text_chunk("A", "1"));
        b.after_idat.push_back(text_chunk("B", "2"));

        const DecodedImage d = PngDecoder().decode(b.build());
        ASSERT_EQ(d.chunks.carried().size(), 2u);
        EXPECT_EQ(d.chunks.carried()[0], text_chunk("A", "1"));
        EXPECT_EQ(d.chunks.carried()[1], text_chunk("B", "2"));
    }

    TEST(PngDecoder, ExpandsPaletteAndTransparency)
    {
        PngBuilder b;
        b.width      = 2;
        b.height     = 1;
        b.color_type = PNG_COLOR_TYPE_PALETTE;
        b.samples    = { 0, 1 };
        b.before_idat.emplace_back("PLTE", std::vector<unsigned char> { 10, 20, 30, 40, 50, 60 });
        b.before_idat.emplace_back("tRNS", std::vector<unsigned char> { 128 });

        const DecodedImage d = PngDecoder().decode(b.build());
        EXPECT_EQ(d.image.layout, PixelLayout::Rgba);
        EXPECT_EQ(d.image.pixels, (std::vector<unsigned char> { 10, 20, 30, 128, 40, 50, 60, 255 }));
        EXPECT_TRUE(d.chunks.carried().empty());
    }

    TEST(PngDecoder, WidensGrayToRgb)
    {
        PngBuilder b;
        b.width      = 3;
        b.height     = 1;
        b.color_type = PNG_COLOR_TYPE_GRAY;
        b.samples    = { 0, 100, 255 };

        const DecodedImage d = PngDecoder().decode(b.build());
        EXPECT_EQ(d.image.layout, PixelLayout::Rgb);
        EXPECT_EQ(d.image.pixels, (std::vector<unsigned char> { 0, 0, 0, 100, 100, 100, 255, 255, 255 }));
    }

    TEST(PngDecoder, Keeps16BitSamples)
    {
        PngBuilder b  = rgb_builder(2, 2);
        b.bit_depth   = 16;
        b.color_type  = PNG_COLOR_TYPE_RGB_ALPHA;
        b.samples     = test::pattern(b.row_bytes() * b.height);

        const DecodedImage d = PngDecoder().decode(b.build());
        EXPECT_EQ(d.image.bit_depth, 16u);
        EXPECT_EQ(d.image.layout, PixelLayout::Rgba);
        EXPECT_EQ(d.image.pixels, b.samples);
    }

    TEST(PngDecoder, DropsAncillaryChunkWithBadCrc)
    {
        PngBuilder b = rgb_builder();
        b.before_idat.push_back(text_chunk("Author", "Alice"));
        auto png = b.build();
        png[8 + 25 + 8] ^= 0x20; // inside the tEXt payload

        const DecodedImage d = PngDecoder().decode(png);
        EXPECT_TRUE(d.chunks.carried().empty());
        EXPECT_TRUE(has_warning(d, "bad CRC"));
    }

    TEST(PngDecoder, DropsNonRgbBackground)
    {
        PngBuilder b;
        b.width      = 2;
        b.height     = 2;
        b.color_type = PNG_COLOR_TYPE_GRAY;
        b.samples    = { 1, 2, 3, 4 };
        b.before_idat.emplace_back("bKGD", std::vector<unsigned char> { 0, 7 });

        const DecodedImage d = PngDecoder().decode(b.build());
        EXPECT_TRUE(d.chunks.carried().empty());
        EXPECT_TRUE(has_warning(d, "bKGD"));
    }

    TEST(PngDecoder, RejectsBrokenStreams)
    {
        const PngDecoder decoder;
        const std::vector<unsigned char> not_png { 'G', 'I', 'F', '8', '9', 'a' };
        EXPECT_THROW((void)decoder.decode(not_png), DecodeError);

        auto png = rgb_builder(32, 32).build();
        png.resize(png.size() / 2);
        EXPECT_THROW((void)decoder.decode(png), DecodeError);
    }

    TEST(JpegDecoder, DecodesRgbTo8BitRgb)
    {
        const auto jpg = test::encode_jpeg(20, 10);
        const DecodedImage d = JpegDecoder().decode(jpg);
        EXPECT_EQ(d.image.width, 20u);
        EXPECT_EQ(d.image.height, 10u);
        EXPECT_EQ(d.image.layout, PixelLayout::Rgb);
        EXPECT_EQ(d.image.bit_depth, 8u);
        EXPECT_EQ(d.image.pixels.size(), 20u * 10u * 3u);
        EXPECT_TRUE(d.chunks.empty());
    }

    TEST(JpegDecoder, ConvertsGrayscaleToRgb)
    {
        const auto jpg = test::encode_jpeg(8, 8, 1);
        const DecodedImage d = JpegDecoder().decode(jpg);
        ASSERT_EQ(d.image.pixels.size(), 8u * 8u * 3u);
        for (size_t i = 0; i < d.image.pixels.size(); i += 3) {
            EXPECT_EQ(d.image.pixels[i], d.image.pixels[i + 1]);
            EXPECT_EQ(d.image.pixels[i], d.image.pixels[i + 2]);
        }
    }

    TEST(JpegDecoder, RejectsCorruptData)
    {
        const JpegDecoder decoder;
        const std::vector<unsigned char> bad_marker { 0xFF, 0xD8, 0xFF, 0x01, 0, 0, 0, 0, 0, 0 };
        EXPECT_THROW((void)decoder.decode(bad_marker), DecodeError);

        const std::vector<unsigned char> not_jpeg { 0x89, 'P', 'N', 'G' };
        EXPECT_THROW((void)decoder.decode(not_jpeg), DecodeError);
    }

    TEST(DecoderRegistry, FindsDecodersByEveryKey)
    {
        const DecoderRegistry registry;
        const auto png = rgb_builder().build();
        const auto jpg = test::encode_jpeg(4, 4);

        ASSERT_NE(registry.find_by_signature(png), nullptr);
        EXPECT_EQ(registry.find_by_signature(png)->get_name(), "PngDecoder");
        ASSERT_NE(registry.find_by_signature(jpg), nullptr);
        EXPECT_EQ(registry.find_by_signature(jpg)->get_name(), "JpegDecoder");

        EXPECT_EQ(registry.find_by_mime("image/jpeg")->get_name(), "JpegDecoder");
        EXPECT_EQ(registry.find_by_mime("image/png")->get_name(), "PngDecoder");
        EXPECT_EQ(registry.find_by_mime("image/gif"), nullptr);

        EXPECT_EQ(registry.find_by_extension(".JPG")->get_name(), "JpegDecoder");
        EXPECT_EQ(registry.find_by_extension(".jpeg")->get_name(), "JpegDecoder");
        EXPECT_EQ(registry.find_by_extension(".Png")->get_name(), "PngDecoder");
        EXPECT_EQ(registry.find_by_extension("png"), nullptr);
        EXPECT_EQ(registry.find_by_extension(".webp"), nullptr);
    }

    TEST(MimeDetector, RecognizesImagesOnDiskAndInMemory)
    {
        test::TempDir dir;
        const auto png = rgb_builder().build();
        const auto path = dir / "shot.bin";
        test::write_bytes(path, png);

        EXPECT_EQ(MimeDetector::detect(path), "image/png");
        EXPECT_EQ(MimeDetector::detect(png, path), "image/png");
        EXPECT_EQ(MimeDetector::detect(test::encode_jpeg(4, 4), "x.bin"), "image/jpeg");
        EXPECT_EQ(MimeDetector::detect(dir / "missing.png"), "");
    }

    TEST(FormatNormalizer, SniffsContentRatherThanExtension)
    {
        test::TempDir dir;
        const auto path = dir / "actually_png.jpg";
        test::write_bytes(path, rgb_builder().build());

        const DecoderRegistry registry;
        const NormalizedSource src = FormatNormalizer(registry).normalize(path);
        EXPECT_EQ(src.decoder, "PngDecoder");
        EXPECT_EQ(src.path, path);
        EXPECT_EQ(src.mtime, std::filesystem::last_write_time(path));
    }

    TEST(FormatNormalizer, DecodesJpegWithEmptyChunkSet)
    {
        test::TempDir dir;
        const auto path = dir / "shot.jpg";
        test::write_bytes(path, test::encode_jpeg(6, 4));

        const DecoderRegistry registry;
        const NormalizedSource src = FormatNormalizer(registry).normalize(path);
        EXPECT_EQ(src.decoder, "JpegDecoder");
        EXPECT_EQ(src.decoded.image.width, 6u);
        EXPECT_TRUE(src.decoded.chunks.empty());
    }

    TEST(FormatNormalizer, ReportsDecodeErrors)
    {
        test::TempDir dir;
        const DecoderRegistry registry;
        const FormatNormalizer normalizer(registry);

        EXPECT_THROW((void)normalizer.normalize(dir / "missing.png"), DecodeError);

        const auto empty = dir / "empty.png";
        test::write_bytes(empty, {});
        EXPECT_THROW((void)normalizer.normalize(empty), DecodeError);

        const auto text = dir / "notes.txt";
        const std::string body = "just some text\n";
        test::write_bytes(text, std::vector<unsigned char>(body.begin(), body.end()));
        EXPECT_THROW((void)normalizer.normalize(text), DecodeError);

        const auto fake_png = dir / "fake.png";
        test::write_bytes(fake_png, std::vector<unsigned char>(body.begin(), body.end()));
        EXPECT_THROW((void)normalizer.normalize(fake_png), DecodeError);
    }

} // namespace
} // namespace shotport
