#include <gtest/gtest.h>
#include "bench/PhasedBenchmark.hpp"
#include "bench/TestFileSet.hpp"
#include "FakeRunner.hpp"

#include <filesystem>

using namespace pw::bench;
using namespace pw::types;
using pw::test::FakeRunner;
using pw::test::transferResult;

class PhasedBenchmarkTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeRunner> runner = std::make_shared<FakeRunner>();
    pw::config::NetworkPerfConfig cfg;
    pw::util::exec::Remote dest{"nas01", "bench", "", std::chrono::seconds(5)};

    void SetUp() override {
        cfg.num_files = 1;
        cfg.file_size_mb = 1;
        cfg.hot_runs = 3;
        cfg.hot_run_pause = std::chrono::seconds(0);
        cfg.work_dir = std::filesystem::temp_directory_path();

        runner->installTool("pv");
        runner->alwaysRun("sh", "");
        runner->onRun("nstat", "TcpRetransSegs 100 0.0\n");
        runner->onRun("nstat", "TcpRetransSegs 142 0.0\n");
    }
};

TEST_F(PhasedBenchmarkTest, RunsThreePhasesAndAveragesHotRuns) {
    runner->onPipeline(transferResult(1'000'000, 0.2));   // cold: 40 Mbps
    runner->onPipeline(transferResult(1'000'000, 0.1));   // hot 1: 80 Mbps
    runner->onPipeline(transferResult(1'000'001, 0.05));  // hot 2
    runner->onPipeline(transferResult(1'000'003, 0.025)); // hot 3
    runner->onPipeline(transferResult(1'000'000, 0.4));   // write: 20 Mbps

    const auto r = PhasedBenchmark(runner, cfg).run(dest);

    EXPECT_FALSE(r.error.has_value());
    ASSERT_TRUE(r.cold.has_value());
    ASSERT_TRUE(r.hot.has_value());
    ASSERT_TRUE(r.write.has_value());

    EXPECT_NEAR(r.cold->rate_mbps, 40.0, 1e-9);
    EXPECT_NEAR(r.write->rate_mbps, 20.0, 1e-9);

    ASSERT_EQ(r.hot_runs.size(), 3u);
    const double expected = (r.hot_runs[0].rate_mbps + r.hot_runs[1].rate_mbps + r.hot_runs[2].rate_mbps) / 3.0;
    EXPECT_DOUBLE_EQ(r.hot->rate_mbps, expected);
    EXPECT_EQ(r.hot->bytes_transferred, 1'000'001u);

    EXPECT_EQ(r.tcp_retrans_total, 42u);
    EXPECT_EQ(r.hot->tcp_retrans, 42u);
}

TEST_F(PhasedBenchmarkTest, WritePhaseUsesPersistingSink) {
    for (int i = 0; i < 5; ++i) runner->onPipeline(transferResult(1'048'576, 0.1));

    (void)PhasedBenchmark(runner, cfg).run(dest);

    ASSERT_EQ(runner->pipelineCalls.size(), 5u);
    EXPECT_EQ(runner->pipelineCalls.front().back().back(), DISCARD_SINK);
    EXPECT_EQ(runner->pipelineCalls.back().back().back(), WRITE_SINK);
    EXPECT_EQ(runner->pipelineCalls.front()[1], (pw::util::exec::Argv{"pv", "-f", "-n", "-b"}));
}

TEST_F(PhasedBenchmarkTest, FlushesBothEndsBeforeColdAndWritePhases) {
    for (int i = 0; i < 5; ++i) runner->onPipeline(transferResult(1'048'576, 0.1));

    (void)PhasedBenchmark(runner, cfg).run(dest);

    ASSERT_EQ(runner->remoteRunCalls.size(), 2u);
    for (const auto& argv : runner->remoteRunCalls) EXPECT_EQ(argv.front(), "sh");

    std::vector<size_t> remoteFlushes, pipelines;
    for (size_t i = 0; i < runner->events.size(); ++i) {
        if (runner->events[i] == "sh@nas01") remoteFlushes.push_back(i);
        if (runner->events[i] == "pipeline") pipelines.push_back(i);
    }
    ASSERT_EQ(remoteFlushes.size(), 2u);
    ASSERT_EQ(pipelines.size(), 5u);
    EXPECT_LT(remoteFlushes[0], pipelines[0]);
    EXPECT_GT(remoteFlushes[1], pipelines[3]);
    EXPECT_LT(remoteFlushes[1], pipelines[4]);
}

TEST_F(PhasedBenchmarkTest, FailedPhasesLeaveEmptySlots) {
    runner->failPipeline();                               // cold
    runner->onPipeline(transferResult(1'000'000, 0.1));
    runner->failPipeline();                               // hot 2
    runner->onPipeline(transferResult(1'000'000, 0.1));
    runner->failPipeline();                               // write

    const auto r = PhasedBenchmark(runner, cfg).run(dest);

    EXPECT_FALSE(r.cold.has_value());
    EXPECT_FALSE(r.write.has_value());
    ASSERT_TRUE(r.hot.has_value());
    EXPECT_EQ(r.hot_runs.size(), 2u);
    EXPECT_NEAR(r.hot->rate_mbps, 80.0, 1e-9);
}

TEST_F(PhasedBenchmarkTest, MissingPvSkipsProtocol) {
    const auto noPv = std::make_shared<FakeRunner>();

    const auto r = PhasedBenchmark(noPv, cfg).run(dest);

    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(*r.error, "pv not installed");
    EXPECT_FALSE(r.cold || r.hot || r.write);
    EXPECT_TRUE(noPv->pipelineCalls.empty());
}

TEST(PhasedBenchmarkStatic, AverageOfNothingIsEmpty) {
    EXPECT_FALSE(PhasedBenchmark::averageRuns({}).has_value());
}

TEST(PhasedBenchmarkStatic, PvBytesTakesLastCount) {
    EXPECT_EQ(PhasedBenchmark::parsePvBytes("0\n524288\n1048576\n"), 1048576u);
    EXPECT_FALSE(PhasedBenchmark::parsePvBytes("pv: broken pipe\n").has_value());
}

TEST(TestFileSetTest, CreatesAndRemovesFiles) {
    std::filesystem::path dir;
    {
        const TestFileSet set(std::filesystem::temp_directory_path(), 2, 1);
        dir = set.directory();
        ASSERT_EQ(set.files().size(), 2u);
        EXPECT_EQ(set.totalBytes(), 2u * 1024 * 1024);
        for (const auto& f : set.files()) EXPECT_EQ(std::filesystem::file_size(f), 1024u * 1024);
    }
    EXPECT_FALSE(std::filesystem::exists(dir));
}
