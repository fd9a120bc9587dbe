#include <gtest/gtest.h>
#include "util/exec.hpp"

#include <chrono>
#include <csignal>
#include <string>

using namespace pw::util::exec;
using namespace std::chrono_literals;

class ProcessRunnerTest : public ::testing::Test {
protected:
    ProcessRunner runner;
};

TEST_F(ProcessRunnerTest, ReturnsTrimmedStdout) {
    EXPECT_EQ(runner.run({"sh", "-c", "echo '  hi  '"}, 5s), "hi");
}

TEST_F(ProcessRunnerTest, NonZeroExitCarriesStatusAndStderr) {
    try {
        (void)runner.run({"sh", "-c", "echo boom >&2; exit 4"}, 5s);
        FAIL() << "expected CollectionError";
    } catch (const CollectionError& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("exit status 4"), std::string::npos) << what;
        EXPECT_NE(what.find("boom"), std::string::npos) << what;
    }
}

TEST_F(ProcessRunnerTest, LongCommandIsExcerptedInError) {
    const std::string longScript = "exit 1; " + std::string(200, '#');
    try {
        (void)runner.run({"sh", "-c", longScript}, 5s);
        FAIL() << "expected CollectionError";
    } catch (const CollectionError& e) {
        EXPECT_EQ(e.command().size(), COMMAND_EXCERPT_LEN);
        EXPECT_EQ(e.command(), excerpt(Argv{"sh", "-c", longScript}));
    }
}

TEST_F(ProcessRunnerTest, MissingProgramFails) {
    EXPECT_THROW((void)runner.run({"pathwatch-no-such-program"}, 5s), CollectionError);
}

TEST_F(ProcessRunnerTest, DeadlineKillsChild) {
    const auto started = std::chrono::steady_clock::now();
    try {
        (void)runner.run({"sleep", "10"}, 1s);
        FAIL() << "expected CollectionError";
    } catch (const CollectionError& e) {
        EXPECT_NE(std::string(e.what()).find("timed out after 1s"), std::string::npos) << e.what();
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST_F(ProcessRunnerTest, PipelineConnectsStages) {
    const auto r = runner.runPipeline({{"printf", "a\\nb\\nc\\n"}, {"wc", "-l"}}, 5s);

    EXPECT_TRUE(r.ok());
    ASSERT_EQ(r.stages.size(), 2u);
    EXPECT_EQ(trim(r.stdout_text), "3");
    EXPECT_GT(r.elapsed_sec, 0.0);
}

TEST_F(ProcessRunnerTest, PipelineKeepsPerStageStderr) {
    const auto r = runner.runPipeline({{"sh", "-c", "echo first >&2; echo data"},
                                       {"sh", "-c", "cat > /dev/null; echo second >&2"}}, 5s);

    ASSERT_EQ(r.stages.size(), 2u);
    EXPECT_EQ(trim(r.stages[0].stderr_text), "first");
    EXPECT_EQ(trim(r.stages[1].stderr_text), "second");
}

TEST_F(ProcessRunnerTest, PipelineNamesFailingStage) {
    try {
        (void)runner.runPipeline({{"echo", "x"}, {"sh", "-c", "cat > /dev/null; exit 3"}, {"cat"}}, 5s);
        FAIL() << "expected CollectionError";
    } catch (const CollectionError& e) {
        EXPECT_NE(std::string(e.what()).find("pipeline stage 1 failed (exit 3)"), std::string::npos) << e.what();
    }
}

TEST_F(ProcessRunnerTest, PipelineBlamesRealFailureOverBrokenPipe) {
    // yes dies of SIGPIPE once the reader quits; the reader's own exit is what gets reported
    try {
        (void)runner.runPipeline({{"yes"}, {"sh", "-c", "exit 5"}}, 5s);
        FAIL() << "expected CollectionError";
    } catch (const CollectionError& e) {
        EXPECT_NE(std::string(e.what()).find("pipeline stage 1 failed (exit 5)"), std::string::npos) << e.what();
    }
}

TEST_F(ProcessRunnerTest, BrokenPipeAloneFailsPipeline) {
    // A writer cut off by an early-exiting reader means the transfer did not complete
    try {
        (void)runner.runPipeline({{"yes"}, {"head", "-c", "100000"}, {"wc", "-c"}}, 5s);
        FAIL() << "expected CollectionError";
    } catch (const CollectionError& e) {
        EXPECT_NE(std::string(e.what()).find("pipeline stage 0 failed (signal " + std::to_string(SIGPIPE) + ")"), std::string::npos) << e.what();
    }
}

TEST_F(ProcessRunnerTest, PipelineDeadlineKillsEveryStage) {
    const auto started = std::chrono::steady_clock::now();
    try {
        (void)runner.runPipeline({{"sleep", "10"}, {"cat"}}, 1s);
        FAIL() << "expected CollectionError";
    } catch (const CollectionError& e) {
        EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos) << e.what();
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST_F(ProcessRunnerTest, EmptyPipelineIsRejected) {
    EXPECT_THROW((void)runner.runPipeline({}, 1s), std::invalid_argument);
}

TEST_F(ProcessRunnerTest, ToolAvailability) {
    EXPECT_TRUE(runner.toolAvailable("sh"));
    EXPECT_FALSE(runner.toolAvailable("pathwatch-no-such-program"));
}

TEST(PipelineResultTest, FailedStageSkipsSigpipeVictims) {
    PipelineResult r;
    r.stages.resize(3);
    r.stages[0].term_signal = SIGPIPE;
    r.stages[1].term_signal = SIGPIPE;
    r.stages[2].exit_code = 255;

    ASSERT_TRUE(r.failedStage().has_value());
    EXPECT_EQ(*r.failedStage(), 2u);
    EXPECT_FALSE(r.ok());
}

TEST(PipelineResultTest, SigpipeVictimReportedWhenAlone) {
    PipelineResult r;
    r.stages.resize(3);
    r.stages[1].term_signal = SIGPIPE;

    ASSERT_TRUE(r.failedStage().has_value());
    EXPECT_EQ(*r.failedStage(), 1u);
}

TEST(PipelineResultTest, CleanRunHasNoFailedStage) {
    PipelineResult r;
    r.stages.resize(2);
    EXPECT_FALSE(r.failedStage().has_value());
    EXPECT_TRUE(r.ok());

    r.timed_out = true;
    EXPECT_FALSE(r.ok());
}

TEST(ShellQuoteTest, QuotesOnlyWhenNeeded) {
    EXPECT_EQ(shellQuote("/data/pathwatch_test_0.bin"), "/data/pathwatch_test_0.bin");
    EXPECT_EQ(shellQuote("a b"), "'a b'");
    EXPECT_EQ(shellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(shellQuote(""), "''");
    EXPECT_EQ(joinQuoted({"cat", "> /dev/null"}), "cat '> /dev/null'");
}

TEST(SshArgvTest, BuildsBatchModeCommand) {
    const Remote remote{"nas01", "bench", "/etc/pathwatch/id_ed25519", 7s};

    const auto argv = sshArgv(remote, "cat > /dev/null", {"Compression=no"});

    const Argv expected{
        "ssh", "-T",
        "-o", "BatchMode=yes",
        "-o", "ConnectTimeout=7",
        "-o", "StrictHostKeyChecking=accept-new",
        "-o", "Compression=no",
        "-i", "/etc/pathwatch/id_ed25519",
        "bench@nas01",
        "cat > /dev/null"
    };
    EXPECT_EQ(argv, expected);
}

TEST(SshArgvTest, OmitsUserAndKeyWhenUnset) {
    const auto argv = sshArgv(Remote{"nas01"}, "true");

    EXPECT_EQ(argv.size(), 10u);
    EXPECT_EQ(argv[8], "nas01");
    EXPECT_EQ(argv.back(), "true");
}

TEST(SshArgvTest, WrapForRemoteQuotesArguments) {
    const Argv argv{"sh", "-c", "echo 3 > /proc/sys/vm/drop_caches"};

    EXPECT_EQ(wrapForRemote(argv, std::nullopt), argv);
    EXPECT_EQ(wrapForRemote(argv, Remote{"localhost"}), argv);
    EXPECT_EQ(wrapForRemote(argv, Remote{"127.0.0.1"}), argv);

    const auto wrapped = wrapForRemote(argv, Remote{"nas01", "bench"});
    ASSERT_FALSE(wrapped.empty());
    EXPECT_EQ(wrapped.front(), "ssh");
    EXPECT_EQ(wrapped[wrapped.size() - 2], "bench@nas01");
    EXPECT_EQ(wrapped.back(), "sh -c 'echo 3 > /proc/sys/vm/drop_caches'");
}
