#include <gtest/gtest.h>
#include "probe/RetransmitCounter.hpp"
#include "FakeRunner.hpp"

#include <filesystem>
#include <fstream>

using namespace pw::probe;

namespace {

const char* SNMP = "Ip: Forwarding DefaultTTL InReceives\n"
                   "Ip: 1 64 123456\n"
                   "Tcp: RtoAlgorithm RtoMin RtoMax MaxConn ActiveOpens PassiveOpens AttemptFails EstabResets CurrEstab InSegs OutSegs RetransSegs InErrs OutRsts\n"
                   "Tcp: 1 200 120000 -1 500 300 2 10 12 90000 85000 4321 0 77\n"
                   "Udp: InDatagrams NoPorts\n"
                   "Udp: 10 0\n";

}

TEST(RetransmitCounterTest, ParsesNstat) {
    const auto v = RetransmitCounter::parseNstat("#kernel\nTcpRetransSegs                  1587               0.0\n");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, 1587u);
    EXPECT_FALSE(RetransmitCounter::parseNstat("#kernel\n").has_value());
}

TEST(RetransmitCounterTest, ParsesSnmpByColumn) {
    const auto v = RetransmitCounter::parseSnmp(SNMP);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, 4321u);
}

TEST(RetransmitCounterTest, DeltaNeverNegative) {
    EXPECT_EQ(RetransmitCounter::delta(100, 142), 42u);
    EXPECT_EQ(RetransmitCounter::delta(142, 100), 0u);
}

TEST(RetransmitCounterTest, FallsBackToSnmpFile) {
    const auto path = std::filesystem::temp_directory_path() / "pathwatch_test_snmp";
    {
        std::ofstream out(path);
        out << SNMP;
    }

    const auto runner = std::make_shared<pw::test::FakeRunner>();
    runner->failRun("nstat");

    EXPECT_EQ(RetransmitCounter(runner, path).read(), 4321u);
    std::filesystem::remove(path);
}

TEST(RetransmitCounterTest, ZeroWhenNothingReadable) {
    const auto runner = std::make_shared<pw::test::FakeRunner>();
    runner->failRun("nstat");
    EXPECT_EQ(RetransmitCounter(runner, "/nonexistent/pathwatch/snmp").read(), 0u);
}
