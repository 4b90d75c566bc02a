#include "../libshotport/include/conversion_executor.hpp"
#include "../libshotport/include/conversion_pipeline.hpp"
#include "../libshotport/include/decoder_registry.hpp"
#include "../libshotport/include/event_bus.hpp"
#include "../libshotport/include/events.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace shotport {
namespace {

    /// Collects the final event of every job, keyed by source file name.
    struct Outcomes {
        std::map<std::string, std::string> by_file;
        std::map<std::string, FileConvertErrorEvent> errors;
        int warnings = 0;

        explicit Outcomes(EventBus& bus)
        {
            bus.subscribe<FileConvertCompleteEvent>([this](const FileConvertCompleteEvent& e) {
                by_file[e.path.filename().string()] = e.written ? "converted" : "planned";
            });
            bus.subscribe<FileConvertErrorEvent>([this](const FileConvertErrorEvent& e) {
                by_file[e.path.filename().string()] = "failed";
                errors[e.path.filename().string()] = e;
            });
            bus.subscribe<FileConvertSkippedEvent>([this](const FileConvertSkippedEvent& e) {
                by_file[e.path.filename().string()] = "skipped: " + e.reason;
            });
            bus.subscribe<FileConvertWarningEvent>([this](const FileConvertWarningEvent&) { ++warnings; });
        }
    };

    class ConversionExecutorTest : public ::testing::Test {
    protected:
        void SetUp() override
        {
            test::PngBuilder b;
            b.samples = test::pattern(b.row_bytes() * b.height);
            write("good.png", b.build());
            write("photo.jpg", test::encode_jpeg(8, 8));
            write("broken.png", { 0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n', 0, 0, 0 });
            const std::string text = "plain text, not an image\n";
            write("notes.txt", std::vector<unsigned char>(text.begin(), text.end()));
        }

        void write(const std::string& name, const std::vector<unsigned char>& bytes)
        {
            test::write_bytes(dir_ / name, bytes);
            sources_.push_back(dir_ / name);
        }

        test::TempDir dir_;
        std::vector<fs::path> sources_;
        DecoderRegistry registry_;
        test::FakeMetadataTool tool_;
        EventBus bus_;
    };

    TEST_F(ConversionExecutorTest, FailuresDoNotStopTheBatch)
    {
        Outcomes outcomes(bus_);
        const ConversionPipeline pipeline(registry_, tool_);
        ConversionExecutor executor(registry_, pipeline, false, bus_, 2);

        const auto out_dir = dir_ / "out" / "nested";
        executor.process(plan_jobs(sources_, out_dir));

        EXPECT_EQ(outcomes.by_file.size(), 4u);
        EXPECT_EQ(outcomes.by_file["good.png"], "converted");
        EXPECT_EQ(outcomes.by_file["photo.jpg"], "converted");
        EXPECT_EQ(outcomes.by_file["broken.png"], "failed");
        EXPECT_EQ(outcomes.by_file["notes.txt"], "skipped: Unsupported format");

        const auto& err = outcomes.errors["broken.png"];
        ASSERT_TRUE(err.kind.has_value());
        EXPECT_EQ(*err.kind, ErrorKind::Decode);
        EXPECT_FALSE(err.partial_output);

        EXPECT_TRUE(fs::exists(out_dir / "good.png"));
        EXPECT_TRUE(fs::exists(out_dir / "photo.png"));
        EXPECT_FALSE(fs::exists(out_dir / "broken.png"));
        EXPECT_FALSE(executor.is_stopped());
    }

    TEST_F(ConversionExecutorTest, MarksMetadataFailuresAsPartial)
    {
        Outcomes outcomes(bus_);
        tool_.fail_copy = true;
        const ConversionPipeline pipeline(registry_, tool_);
        ConversionExecutor executor(registry_, pipeline, false, bus_, 1);

        executor.process(plan_jobs({ dir_ / "good.png" }, dir_ / "out"));

        const auto& err = outcomes.errors["good.png"];
        ASSERT_TRUE(err.kind.has_value());
        EXPECT_EQ(*err.kind, ErrorKind::MetadataWrite);
        EXPECT_TRUE(err.partial_output);
        EXPECT_TRUE(fs::exists(dir_ / "out" / "good.png"));
    }

    TEST_F(ConversionExecutorTest, DryRunWritesNothing)
    {
        Outcomes outcomes(bus_);
        const ConversionPipeline pipeline(registry_, tool_);
        ConversionExecutor executor(registry_, pipeline, true, bus_, 2);

        const auto out_dir = dir_ / "dry";
        executor.process(plan_jobs(sources_, out_dir));

        EXPECT_EQ(outcomes.by_file["good.png"], "planned");
        EXPECT_EQ(outcomes.by_file["photo.jpg"], "planned");
        EXPECT_EQ(outcomes.by_file["notes.txt"], "skipped: Unsupported format");
        EXPECT_FALSE(fs::exists(out_dir));
        EXPECT_TRUE(tool_.calls().empty());
    }

    TEST_F(ConversionExecutorTest, StoppedExecutorSkipsEverything)
    {
        Outcomes outcomes(bus_);
        const ConversionPipeline pipeline(registry_, tool_);
        ConversionExecutor executor(registry_, pipeline, false, bus_, 2);

        executor.request_stop();
        EXPECT_TRUE(executor.is_stopped());
        executor.process(plan_jobs(sources_, dir_ / "out"));

        ASSERT_EQ(outcomes.by_file.size(), 4u);
        for (const auto& [file, outcome] : outcomes.by_file) {
            EXPECT_EQ(outcome, "skipped: Interrupted") << file;
        }
        EXPECT_TRUE(tool_.calls().empty());
    }

} // namespace
} // namespace shotport
