#include <gtest/gtest.h>
#include "collectors/NetworkPathCollector.hpp"
#include "FakeRunner.hpp"

using namespace pw::collectors;
using namespace pw::types;
using pw::test::FakeRunner;

namespace {

const char* PING_FAST = "10 packets transmitted, 10 received, 0% packet loss, time 9012ms\n"
                        "rtt min/avg/max/mdev = 0.200/0.300/0.400/0.050 ms\n";

const char* IPERF_FAST = R"({"end": {"sum_sent": {"seconds": 10.0, "bytes": 1175000000, "bits_per_second": 940000000.0}}})";

pw::config::PathConfig path(const std::string& source, const std::string& dest, const PathType type = PathType::Direct) {
    pw::config::PathConfig p;
    p.source = source;
    p.dest = dest;
    p.path_type = type;
    return p;
}

}

class NetworkPathCollectorTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeRunner> runner = std::make_shared<FakeRunner>();
    pw::config::NetworkPerfConfig cfg;

    void SetUp() override {
        runner->installTool("iperf3");
        runner->alwaysRun("nstat", "TcpRetransSegs 0\n");
    }
};

TEST_F(NetworkPathCollectorTest, QuickModeFillsHotSlot) {
    cfg.paths = {path("hpc01", "nas01")};
    runner->onRun("ping", PING_FAST);
    runner->onRun("iperf3", IPERF_FAST);

    const auto records = NetworkPathCollector(runner, cfg).collect();

    ASSERT_EQ(records.size(), 1u);
    const auto& r = records[0];
    EXPECT_EQ(r.source_host, "hpc01");
    EXPECT_EQ(r.dest_host, "nas01");
    EXPECT_EQ(r.path_type, PathType::Direct);
    ASSERT_TRUE(r.ping.has_value());
    EXPECT_DOUBLE_EQ(r.ping->avg_ms, 0.3);
    ASSERT_TRUE(r.hot.has_value());
    EXPECT_DOUBLE_EQ(r.hot->rate_mbps, 940.0);
    EXPECT_FALSE(r.cold.has_value());
    EXPECT_FALSE(r.write.has_value());
    EXPECT_EQ(r.status, PathStatus::Healthy);
}

TEST_F(NetworkPathCollectorTest, SkipsEntriesWithoutDestination) {
    cfg.paths = {path("hpc01", ""), path("hpc01", "nas01")};
    runner->onRun("ping", PING_FAST);
    runner->onRun("iperf3", IPERF_FAST);

    const auto records = NetworkPathCollector(runner, cfg).collect();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].dest_host, "nas01");
}

TEST_F(NetworkPathCollectorTest, FailingPathBecomesErrorRecord) {
    cfg.paths = {path("hpc01", "nas01", PathType::Nfs), path("hpc01", "nas02")};
    runner->crashRun("ping");
    runner->onRun("ping", PING_FAST);
    runner->onRun("iperf3", IPERF_FAST);

    const auto records = NetworkPathCollector(runner, cfg).collect();

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].dest_host, "nas01");
    EXPECT_EQ(records[0].path_type, PathType::Nfs);
    EXPECT_EQ(records[0].status, PathStatus::Error);
    EXPECT_FALSE(records[0].ping.has_value());
    EXPECT_FALSE(records[0].hot.has_value());
    EXPECT_NE(records[0].timestamp, 0);

    EXPECT_EQ(records[1].dest_host, "nas02");
    EXPECT_EQ(records[1].status, PathStatus::Healthy);
}

TEST_F(NetworkPathCollectorTest, UnreachableDestinationIsError) {
    cfg.paths = {path("hpc01", "nas01")};
    runner->failRun("ping");
    runner->failRun("iperf3");

    const auto records = NetworkPathCollector(runner, cfg).collect();

    ASSERT_EQ(records.size(), 1u);
    ASSERT_TRUE(records[0].ping.has_value());
    EXPECT_DOUBLE_EQ(records[0].ping->loss_pct, 100.0);
    EXPECT_FALSE(records[0].hot.has_value());
    EXPECT_EQ(records[0].status, PathStatus::Error);
}

TEST_F(NetworkPathCollectorTest, FullModeWithoutPvFallsBackToQuick) {
    cfg.full_test = true;
    cfg.paths = {path("hpc01", "nas01")};
    runner->onRun("ping", PING_FAST);
    runner->onRun("iperf3", IPERF_FAST);

    const auto records = NetworkPathCollector(runner, cfg).collect();

    ASSERT_EQ(records.size(), 1u);
    ASSERT_TRUE(records[0].hot.has_value());
    EXPECT_DOUBLE_EQ(records[0].hot->rate_mbps, 940.0);
    EXPECT_FALSE(records[0].cold.has_value());
}

TEST_F(NetworkPathCollectorTest, ParallelCollectionKeepsConfigurationOrder) {
    cfg.max_parallel_paths = 3;
    cfg.paths = {path("hpc01", "nas01"), path("hpc01", "nas02"), path("hpc01", "nas03")};
    runner->alwaysRun("ping", PING_FAST);
    runner->alwaysRun("iperf3", IPERF_FAST);

    const auto records = NetworkPathCollector(runner, cfg).collect();

    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].dest_host, "nas01");
    EXPECT_EQ(records[1].dest_host, "nas02");
    EXPECT_EQ(records[2].dest_host, "nas03");
    for (const auto& r : records) EXPECT_EQ(r.status, PathStatus::Healthy);
}
