#include "test_base.hpp"
#include "core/processing_outcome.hpp"
#include "tools/external_tools.hpp"
#include "tools/tool_runner.hpp"

class ToolRunnerTest : public TestBase
{
};

TEST_F(ToolRunnerTest, CapturesOutputAndExitCode)
{
    ToolResult result = ToolRunner::run({"sh", "-c", "echo hello; echo oops >&2; exit 3"});
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.succeeded());
    EXPECT_NE(result.output.find("hello"), std::string::npos);
    EXPECT_NE(result.output.find("oops"), std::string::npos);
}

TEST_F(ToolRunnerTest, ArgumentsAreNotShellExpanded)
{
    ToolResult result = ToolRunner::run({"echo", "$HOME; rm -rf /", "`id`"});
    EXPECT_TRUE(result.succeeded());
    EXPECT_NE(result.output.find("$HOME; rm -rf /"), std::string::npos);
    EXPECT_NE(result.output.find("`id`"), std::string::npos);
}

TEST_F(ToolRunnerTest, RunsInWorkingDirectory)
{
    writeFile("marker.txt", "x");
    ToolResult result = ToolRunner::run({"ls"}, nullptr, std::chrono::milliseconds(0), test_dir_);
    EXPECT_TRUE(result.succeeded());
    EXPECT_NE(result.output.find("marker.txt"), std::string::npos);
}

TEST_F(ToolRunnerTest, MissingProgramFailsWith127)
{
    ToolResult result = ToolRunner::run({"definitely-not-a-real-tool-xyz"});
    EXPECT_EQ(result.exit_code, 127);
}

TEST_F(ToolRunnerTest, EmptyCommandThrows)
{
    EXPECT_THROW(ToolRunner::run({}), ToolError);
}

TEST_F(ToolRunnerTest, TimeoutStopsProcess)
{
    auto started = std::chrono::steady_clock::now();
    ToolResult result = ToolRunner::run({"sleep", "30"}, nullptr, std::chrono::milliseconds(200));
    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.succeeded());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST_F(ToolRunnerTest, CancellationStopsProcessGroup)
{
    CancellationToken token;
    std::thread canceller([&token]()
                          {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.cancel(); });

    auto started = std::chrono::steady_clock::now();
    // The shell's child sleep must die with the group
    ToolResult result = ToolRunner::run({"sh", "-c", "sleep 30 & wait"}, &token);
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST_F(ToolRunnerTest, TailKeepsEnd)
{
    EXPECT_EQ(ToolRunner::tail("abcdef", 3), "def");
    EXPECT_EQ(ToolRunner::tail("ab", 3), "ab");
}

TEST_F(ToolRunnerTest, MissingToolIsReportedAsUnavailable)
{
    auto &tools = ExternalTools::getInstance();
    std::string saved = tools.path(ExternalTools::REMBG);
    tools.setPath(ExternalTools::REMBG, "");

    try
    {
        tools.require(ExternalTools::REMBG);
        FAIL() << "expected ProcessingError";
    }
    catch (const ProcessingError &e)
    {
        EXPECT_EQ(e.kind(), FailureKind::ToolUnavailable);
    }
    EXPECT_FALSE(tools.availability()[ExternalTools::REMBG].get<bool>());

    tools.setPath(ExternalTools::REMBG, saved);
}

TEST_F(ToolRunnerTest, FindExecutableSearchesPath)
{
    EXPECT_FALSE(ExternalTools::findExecutable("sh").empty());
    EXPECT_TRUE(ExternalTools::findExecutable("definitely-not-a-real-tool-xyz").empty());
}
