#include <gtest/gtest.h>

#include "ProcessComparisonRunner.h"
#include "SampleOutcome.h"

#include <chrono>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>
#include <sys/types.h>

namespace {

CommandSpec shell(std::string script)
{
    CommandSpec spec;
    spec.program = "/bin/sh";
    spec.arguments = { "-c", std::move(script) };
    spec.inputEnvVar = "CODEC_COVERAGE_TEST_INPUT";
    return spec;
}

bool contains(std::string const& haystack, std::string const& needle)
{
    return haystack.find(needle) != std::string::npos;
}

// a zombie waiting for its reaper counts as gone
bool processGone(pid_t pid)
{
    if (::kill(pid, 0) != 0)
        return true;
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    std::getline(stat, line);
    auto const close = line.rfind(')');
    return close != std::string::npos && close + 2 < line.size() && line[close + 2] == 'Z';
}

} // namespace

TEST(ProcessComparisonRunner, PassesLocatorAndCapturesBothStreams)
{
    ProcessComparisonRunner runner(shell(R"(echo "input=$CODEC_COVERAGE_TEST_INPUT"; echo oops >&2; exit 3)"));

    auto const r = runner.run("https://samples.example.org/aac/a.aac", 10);
    EXPECT_EQ(r.exitStatus, 3);
    EXPECT_FALSE(r.timedOut);
    EXPECT_TRUE(contains(r.output, "input=https://samples.example.org/aac/a.aac\n"));
    EXPECT_TRUE(contains(r.output, "\noops"));
}

TEST(ProcessComparisonRunner, MetricsSurviveNonZeroExit)
{
    ProcessComparisonRunner runner(shell(
        "echo '对比样本=1, Tao=10, FFmpeg=10, max_err=0, psnr=infdB, 精度=100.00%'; exit 101"));

    auto const r = runner.run("x", 10);
    EXPECT_EQ(r.exitStatus, 101);

    auto const outcome = evaluateComparison(r, std::vector<std::string> {});
    ASSERT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.metrics->precision, "100.00");
}

TEST(ProcessComparisonRunner, TimeoutIsKilledAndMarked)
{
    ProcessComparisonRunner runner(shell("echo started; exec sleep 30"));

    auto const r = runner.run("slow.aac", 1);
    EXPECT_TRUE(r.timedOut);
    EXPECT_EQ(r.exitStatus, ProcessComparisonRunner::kTimeoutExit);
    EXPECT_TRUE(contains(r.output, "单样本测试超时: 1s"));

    std::vector<std::string> const keywords = { "单样本测试超时" };
    auto const outcome = evaluateComparison(r, keywords);
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_EQ(outcome.failureReason, "单样本测试超时: 1s");
}

TEST(ProcessComparisonRunner, TimeoutKillsWhatTheCommandSpawned)
{
    ProcessComparisonRunner runner(shell(R"(sleep 30 & echo "child=$!"; wait)"));

    auto const r = runner.run("slow.aac", 1);
    ASSERT_TRUE(r.timedOut);

    auto const at = r.output.find("child=");
    ASSERT_NE(at, std::string::npos) << r.output;
    auto const child = static_cast<pid_t>(std::stol(r.output.substr(at + 6)));
    ASSERT_GT(child, 0);

    auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (!processGone(child) && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_TRUE(processGone(child)) << "pid " << child;
}

TEST(ProcessComparisonRunner, MissingProgramIsSpawnFailure)
{
    CommandSpec spec;
    spec.program = "/nonexistent/codec-compare";
    spec.inputEnvVar = "CODEC_COVERAGE_TEST_INPUT";
    ProcessComparisonRunner runner(spec);

    auto const r = runner.run("a.aac", 5);
    EXPECT_EQ(r.exitStatus, ProcessComparisonRunner::kSpawnFailedExit);
    EXPECT_FALSE(r.timedOut);
    EXPECT_TRUE(contains(r.output, "启动对比命令失败"));
}

TEST(ProcessComparisonRunner, SignalDeathIsCrash)
{
    ProcessComparisonRunner runner(shell("kill -KILL $$"));

    auto const r = runner.run("a.aac", 10);
    EXPECT_EQ(r.exitStatus, ProcessComparisonRunner::kCrashExit);
    EXPECT_TRUE(contains(r.output, "对比进程异常退出"));
}
