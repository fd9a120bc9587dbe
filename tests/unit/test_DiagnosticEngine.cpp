#include <gtest/gtest.h>
#include "diag/DiagnosticEngine.hpp"
#include "diag/Recommendations.hpp"

#include <algorithm>
#include <set>

using namespace pw::diag;
using namespace pw::types;

namespace {

constexpr std::time_t MONDAY_10 = 1'704'103'200;  // 2024-01-01 10:00 UTC
constexpr std::time_t DAY = 86400;

NetworkPerfSample sample(const std::time_t ts, const double loss, const double avg, const double mbps,
                         const uint64_t retrans = 0) {
    NetworkPerfSample s;
    s.timestamp = ts;
    s.source_host = "hpc01";
    s.dest_host = "nas01";
    s.path_type = PathType::Direct;
    s.status = PathStatus::Healthy;
    s.ping_loss_pct = loss;
    s.ping_avg_ms = avg;
    s.ping_mdev_ms = 0.5;
    s.throughput_mbps = mbps;
    s.tcp_retrans = retrans;
    return s;
}

pw::config::DiagnosticsConfig utcConfig() {
    pw::config::DiagnosticsConfig cfg;
    cfg.time_patterns.utc = true;
    return cfg;
}

bool hasCause(const NetworkDiagnostic& d, const CauseKind kind, const Confidence confidence) {
    return std::any_of(d.causes.begin(), d.causes.end(),
                       [&](const Cause& c) { return c.kind == kind && c.confidence == confidence; });
}

}

TEST(DiagnosticEngineTest, SevereCurrentStateYieldsHighCauses) {
    const auto current = sample(MONDAY_10, 7.0, 120.0, 900.0, 150);
    const auto d = DiagnosticEngine(utcConfig()).diagnose("hpc01", "nas01", current, {current});

    EXPECT_TRUE(hasCause(d, CauseKind::HighPacketLoss, Confidence::High));
    EXPECT_TRUE(hasCause(d, CauseKind::HighLatency, Confidence::High));
    EXPECT_TRUE(hasCause(d, CauseKind::ExcessiveRetransmits, Confidence::High));
    EXPECT_FALSE(hasCause(d, CauseKind::NoIssues, Confidence::Low));

    ASSERT_FALSE(d.recommendations.empty());
    const std::set<std::string> unique(d.recommendations.begin(), d.recommendations.end());
    EXPECT_EQ(unique.size(), d.recommendations.size());
    EXPECT_EQ(d.current_status, "healthy");
    ASSERT_TRUE(d.last_seen.has_value());
    EXPECT_EQ(*d.last_seen, MONDAY_10);
}

TEST(DiagnosticEngineTest, NoCurrentStateIsNoData) {
    const auto d = DiagnosticEngine().diagnose("hpc01", "nas01", std::nullopt, {});

    ASSERT_EQ(d.causes.size(), 1u);
    EXPECT_EQ(d.causes[0].kind, CauseKind::NoData);
    EXPECT_EQ(d.causes[0].cause, "No network data available");
    EXPECT_EQ(d.causes[0].confidence, Confidence::High);
    EXPECT_EQ(d.recommendations, std::vector<std::string>{NO_ACTION_RECOMMENDATION});
    EXPECT_EQ(d.source_host, "hpc01");
    EXPECT_FALSE(d.hasData());
}

TEST(DiagnosticEngineTest, HealthyPathHasNoIssues) {
    const auto current = sample(MONDAY_10, 0.0, 0.4, 940.0);
    const auto d = DiagnosticEngine(utcConfig()).diagnose("", "", current, {current});

    ASSERT_EQ(d.causes.size(), 1u);
    EXPECT_EQ(d.causes[0].kind, CauseKind::NoIssues);
    EXPECT_EQ(d.causes[0].confidence, Confidence::Low);
    EXPECT_EQ(d.recommendations, std::vector<std::string>{NO_ACTION_RECOMMENDATION});
}

TEST(DiagnosticEngineTest, ErrorRecordIsNotReportedHealthy) {
    const NetworkPerfSample current(NetworkPerfRecord::errorRecord("hpc01", "nas01", PathType::Direct, MONDAY_10));
    const auto d = DiagnosticEngine(utcConfig()).diagnose("hpc01", "nas01", current, {current});

    EXPECT_EQ(d.current_status, "error");
    EXPECT_TRUE(d.hasData());
    ASSERT_FALSE(d.causes.empty());
    EXPECT_EQ(d.causes[0].kind, CauseKind::CollectionFailed);
    EXPECT_EQ(d.causes[0].confidence, Confidence::High);
    EXPECT_FALSE(hasCause(d, CauseKind::NoIssues, Confidence::Low));

    EXPECT_EQ(d.recommendations, recommendationsFor(CauseKind::CollectionFailed));
    EXPECT_EQ(std::find(d.recommendations.begin(), d.recommendations.end(), NO_ACTION_RECOMMENDATION),
              d.recommendations.end());
}

TEST(DiagnosticEngineTest, UnreachableHostStillReportsLoss) {
    auto current = sample(MONDAY_10, 100.0, 0.0, 0.0);
    current.status = PathStatus::Error;
    const auto d = DiagnosticEngine(utcConfig()).diagnose("hpc01", "nas01", current, {current});

    EXPECT_TRUE(hasCause(d, CauseKind::HighPacketLoss, Confidence::High));
    EXPECT_FALSE(hasCause(d, CauseKind::CollectionFailed, Confidence::High));
}

TEST(DiagnosticEngineTest, MediumTiers) {
    const auto current = sample(MONDAY_10, 2.0, 60.0, 40.0, 20);
    const auto d = DiagnosticEngine(utcConfig()).diagnose("", "", current, {current});

    EXPECT_TRUE(hasCause(d, CauseKind::ElevatedPacketLoss, Confidence::Medium));
    EXPECT_TRUE(hasCause(d, CauseKind::ElevatedLatency, Confidence::Medium));
    EXPECT_TRUE(hasCause(d, CauseKind::ElevatedRetransmits, Confidence::Medium));
    EXPECT_TRUE(hasCause(d, CauseKind::LowThroughput, Confidence::Medium));
}

TEST(DiagnosticEngineTest, BusinessHoursCongestion) {
    std::vector<NetworkPerfSample> history;
    for (int week = 0; week < 2; ++week) {
        const std::time_t base = MONDAY_10 + week * 7 * DAY;
        for (int day = 0; day < 5; ++day) history.push_back(sample(base + day * DAY, 0.0, 0.4, 100.0));
        history.push_back(sample(base + 5 * DAY, 0.0, 0.4, 200.0));  // Saturday
        history.push_back(sample(base + 6 * DAY, 0.0, 0.4, 200.0));  // Sunday
    }

    const auto d = DiagnosticEngine(utcConfig()).diagnose("", "", history.back(), history);

    ASSERT_TRUE(d.time_patterns.business_hours_avg.has_value());
    EXPECT_DOUBLE_EQ(*d.time_patterns.business_hours_avg, 100.0);
    EXPECT_DOUBLE_EQ(*d.time_patterns.off_hours_avg, 200.0);
    EXPECT_TRUE(hasCause(d, CauseKind::BusinessHoursCongestion, Confidence::High));
    EXPECT_NE(std::find(d.recommendations.begin(), d.recommendations.end(),
                        "Schedule large transfers for off-hours"), d.recommendations.end());
}

TEST(DiagnosticEngineTest, DecliningThroughputTrend) {
    std::vector<NetworkPerfSample> history;
    for (int i = 0; i < 6; ++i) history.push_back(sample(MONDAY_10 + i * 3600, 0.0, 0.4, 1000.0 - i * 120.0));

    const auto d = DiagnosticEngine(utcConfig()).diagnose("", "", history.back(), history);

    EXPECT_EQ(d.trends.at("throughput").trend, TrendDirection::Decreasing);
    EXPECT_TRUE(hasCause(d, CauseKind::DecliningThroughput, Confidence::High));
    EXPECT_EQ(d.history.samples_count, 6u);
    EXPECT_DOUBLE_EQ(*d.history.max_throughput, 1000.0);
    EXPECT_DOUBLE_EQ(*d.history.min_throughput, 400.0);
}

TEST(DiagnosticEngineTest, SameInputSameOutput) {
    std::vector<NetworkPerfSample> history;
    for (int i = 0; i < 10; ++i) history.push_back(sample(MONDAY_10 + i * 7200, i % 3, 20.0 + i, 500.0 - i * 10, i * 5));

    const DiagnosticEngine engine(utcConfig());
    const auto a = engine.diagnose("", "", history.back(), history);
    const auto b = engine.diagnose("", "", history.back(), history);

    EXPECT_EQ(a.causes, b.causes);
    EXPECT_EQ(a.recommendations, b.recommendations);
}
