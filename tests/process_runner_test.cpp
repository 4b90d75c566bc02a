#include "../libshotport/include/process_runner.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace shotport {
namespace {

    TEST(ProcessRunner, CapturesOutputAndExitStatus)
    {
        const ProcessResult r = run_process({ "sh", "-c", "echo hi; echo err >&2; exit 3" });
        EXPECT_EQ(r.exit_code, 3);
        EXPECT_NE(r.output.find("hi\n"), std::string::npos);
        EXPECT_NE(r.output.find("err\n"), std::string::npos);
    }

    TEST(ProcessRunner, PassesArgumentsVerbatim)
    {
        const ProcessResult r = run_process({ "sh", "-c", "printf '%s|' \"$@\"", "sh", "a b", "-Orientation#=1" });
        EXPECT_EQ(r.exit_code, 0);
        EXPECT_EQ(r.output, "a b|-Orientation#=1|");
    }

    TEST(ProcessRunner, ReportsKillingSignal)
    {
        const ProcessResult r = run_process({ "sh", "-c", "kill -TERM $$" });
        EXPECT_EQ(r.exit_code, 128 + 15);
    }

    TEST(ProcessRunner, RejectsBadCommands)
    {
        EXPECT_THROW((void)run_process({}), std::invalid_argument);

        try {
            const ProcessResult r = run_process({ "shotport-no-such-program-xyz" });
            // spawn implementations that report exec failure through the child
            EXPECT_EQ(r.exit_code, 127);
        } catch (const std::system_error&) {
            SUCCEED();
        }
    }

} // namespace
} // namespace shotport
