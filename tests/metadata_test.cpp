#include "../libshotport/include/errors.hpp"
#include "../libshotport/include/exiftool_client.hpp"
#include "../libshotport/include/metadata_merger.hpp"
#include "../libshotport/include/metadata_tags.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace shotport {
namespace {

    using Argv = std::vector<std::string>;

    TEST(MetadataTagSet, KeepsInsertionOrderAndReplacesInPlace)
    {
        MetadataTagSet tags { { "A", "1" }, { "B", "2" } };
        tags.set("C", "3");
        tags.set("A", "9");

        ASSERT_EQ(tags.size(), 3u);
        std::vector<std::string> names;
        for (const auto& [name, value] : tags) {
            names.push_back(name);
        }
        EXPECT_EQ(names, (Argv { "A", "B", "C" }));
        EXPECT_EQ(tags.get("A"), "9");
        EXPECT_FALSE(tags.get("Z").has_value());
        EXPECT_TRUE(tags.contains("B"));
        EXPECT_FALSE(tags.contains("b"));
    }

    TEST(MetadataTags, ScreenshotOverrides)
    {
        const MetadataTagSet tags = ios_screenshot_overrides();
        EXPECT_EQ(tags.get("ImageDescription"), std::string(kScreenshotDescription));
        EXPECT_EQ(tags.get("UserComment"), std::string(kScreenshotDescription));
        EXPECT_EQ(tags.get("Orientation"), "1");
        EXPECT_EQ(tags.get("XResolution"), "144");
        EXPECT_EQ(tags.get("YResolution"), "144");
        EXPECT_EQ(tags.get("ResolutionUnit"), "2");
    }

    TEST(MetadataTags, CaptureDatesUseExifFormat)
    {
        const auto mtime = std::filesystem::file_time_type::clock::now() - std::chrono::hours(30);
        const MetadataTagSet tags = capture_date_tags(mtime);

        const std::regex exif_date(R"(\d{4}:\d{2}:\d{2} \d{2}:\d{2}:\d{2})");
        for (const char* name : { "DateTimeOriginal", "CreateDate", "ModifyDate" }) {
            ASSERT_TRUE(tags.contains(name)) << name;
            EXPECT_TRUE(std::regex_match(*tags.get(name), exif_date)) << *tags.get(name);
            EXPECT_EQ(tags.get(name), format_exif_datetime(mtime));
        }
        EXPECT_EQ(tags.get("ColorSpace"), "1");
    }

    TEST(MetadataTags, CaptureDatesCarryGivenStamp)
    {
        const MetadataTagSet tags = capture_date_tags(std::string("2023:01:01 10:00:00"));
        EXPECT_EQ(tags, (MetadataTagSet { { "DateTimeOriginal", "2023:01:01 10:00:00" },
                                          { "CreateDate", "2023:01:01 10:00:00" },
                                          { "ModifyDate", "2023:01:01 10:00:00" },
                                          { "ColorSpace", "1" } }));
    }

    TEST(MetadataMergeEngine, CopiesThenOverridesThenFills)
    {
        test::TempDir dir;
        test::FakeMetadataTool tool;
        tool.touch_file = false;

        const auto mtime = std::filesystem::file_time_type::clock::now();
        MetadataMergeEngine(tool).merge(dir / "in.jpg", dir / "out.png", mtime);

        const auto calls = tool.calls();
        ASSERT_EQ(calls.size(), 3u);
        EXPECT_EQ(calls[0].operation, "copy");
        EXPECT_EQ(calls[0].source, dir / "in.jpg");
        EXPECT_EQ(calls[0].target, dir / "out.png");
        EXPECT_EQ(calls[1].operation, "set");
        EXPECT_EQ(calls[1].tags, ios_screenshot_overrides());
        EXPECT_EQ(calls[2].operation, "fill");
        EXPECT_EQ(calls[2].tags, capture_date_tags(mtime));
    }

    TEST(MetadataMergeEngine, FillPrefersSourceDateTimeOriginal)
    {
        test::TempDir dir;
        test::FakeMetadataTool tool;
        tool.touch_file = false;
        tool.source_tags.set("DateTimeOriginal", "2023:01:01 10:00:00");

        const auto mtime = std::filesystem::file_time_type::clock::now();
        MetadataMergeEngine(tool).merge(dir / "in.jpg", dir / "out.png", mtime);

        const auto calls = tool.calls();
        ASSERT_EQ(calls.size(), 3u);
        EXPECT_EQ(calls[2].operation, "fill");
        for (const char* name : { "DateTimeOriginal", "CreateDate", "ModifyDate" }) {
            EXPECT_EQ(calls[2].tags.get(name), "2023:01:01 10:00:00") << name;
        }
        EXPECT_NE(calls[2].tags.get("ModifyDate"), format_exif_datetime(mtime));
    }

    TEST(MetadataMergeEngine, SkipsDateFillWhenDisabled)
    {
        test::TempDir dir;
        test::FakeMetadataTool tool;
        tool.touch_file = false;

        const MetadataMergeEngine engine(tool, false);
        EXPECT_FALSE(engine.fills_capture_dates());
        engine.merge(dir / "in.png", dir / "out.png", std::filesystem::file_time_type::clock::now());

        const auto calls = tool.calls();
        ASSERT_EQ(calls.size(), 2u);
        EXPECT_EQ(calls[1].operation, "set");
    }

    TEST(MetadataMergeEngine, StopsAtFirstFailure)
    {
        test::TempDir dir;
        test::FakeMetadataTool tool;
        tool.fail_copy = true;

        try {
            MetadataMergeEngine(tool).merge(dir / "in.png", dir / "out.png",
                                            std::filesystem::file_time_type::clock::now());
            FAIL() << "expected MetadataWriteError";
        } catch (const MetadataWriteError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::MetadataWrite);
        }
        EXPECT_EQ(tool.calls().size(), 1u);
    }

    TEST(ExifToolClient, BuildsCopyCommand)
    {
        const ExifToolClient client("/opt/exiftool");
        EXPECT_EQ(client.copy_command("a/in.jpg", "b/out.png"),
                  (Argv { "/opt/exiftool", "-overwrite_original", "-tagsFromFile", "a/in.jpg", "-all:all", "-unsafe",
                          "b/out.png" }));
    }

    TEST(ExifToolClient, BuildsSetCommands)
    {
        const ExifToolClient client;
        const MetadataTagSet tags { { "Orientation", "1" }, { "UserComment", "Screenshot" } };

        EXPECT_EQ(client.set_command("out.png", tags, TagWriteMode::Override),
                  (Argv { "exiftool", "-overwrite_original", "-Orientation#=1", "-UserComment#=Screenshot", "out.png" }));
        EXPECT_EQ(client.set_command("out.png", tags, TagWriteMode::CreateOnly),
                  (Argv { "exiftool", "-overwrite_original", "-wm", "cg", "-Orientation#=1", "-UserComment#=Screenshot",
                          "out.png" }));
    }

    TEST(ExifToolClient, BuildsReadCommand)
    {
        const ExifToolClient client;
        EXPECT_EQ(client.read_command("a/in.jpg", "DateTimeOriginal"),
                  (Argv { "exiftool", "-s3", "-DateTimeOriginal#", "a/in.jpg" }));
    }

    TEST(ExifToolClient, ParsesTagValues)
    {
        EXPECT_EQ(ExifToolClient::parse_tag_value({ 0, "2023:01:01 10:00:00\n" }), "2023:01:01 10:00:00");
        EXPECT_EQ(ExifToolClient::parse_tag_value({ 0, "Warning: [minor] Bad MakerNotes\n2023:01:01 10:00:00\n" }),
                  "2023:01:01 10:00:00");
        EXPECT_FALSE(ExifToolClient::parse_tag_value({ 0, "" }).has_value());
        EXPECT_FALSE(ExifToolClient::parse_tag_value({ 1, "\n" }).has_value());
        EXPECT_THROW((void)ExifToolClient::parse_tag_value({ 1, "Error: File not found - in.jpg\n" }),
                     MetadataWriteError);
    }

    TEST(ExifToolClient, JudgesRunResults)
    {
        EXPECT_TRUE(ExifToolClient::run_succeeded({ 0, "    1 image files updated\n" }));
        EXPECT_TRUE(ExifToolClient::run_succeeded({ 1, "Warning: No writable tags set from in.png\n    0 image files updated\n    1 image files unchanged\n" }));
        EXPECT_FALSE(ExifToolClient::run_succeeded({ 1, "Error: File format error - out.png\n    1 image files unchanged\n" }));
        EXPECT_FALSE(ExifToolClient::run_succeeded({ 2, "" }));
    }

    TEST(ExifToolClient, ReportsMissingExecutable)
    {
        test::TempDir dir;
        const ExifToolClient client((dir / "no-such-exiftool").string());

        EXPECT_FALSE(client.is_available());
        EXPECT_THROW((void)client.version(), MetadataWriteError);
        EXPECT_THROW(client.copy_all_tags(dir / "a.png", dir / "b.png"), MetadataWriteError);
        EXPECT_THROW((void)client.read_tag(dir / "a.png", "DateTimeOriginal"), MetadataWriteError);
        EXPECT_NO_THROW(client.set_tags(dir / "b.png", MetadataTagSet {}, TagWriteMode::Override));
    }

} // namespace
} // namespace shotport
