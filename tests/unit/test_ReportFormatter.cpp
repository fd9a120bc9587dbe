#include <gtest/gtest.h>
#include "diag/DiagnosticEngine.hpp"
#include "diag/ReportFormatter.hpp"

#include <nlohmann/json.hpp>

using namespace pw::diag;
using namespace pw::types;

namespace {

NetworkDiagnostic troubledPath() {
    NetworkPerfSample s;
    s.timestamp = 1'704'103'200;
    s.source_host = "hpc01";
    s.dest_host = "nas01";
    s.path_type = PathType::Nfs;
    s.status = PathStatus::Error;
    s.ping_loss_pct = 7.0;
    s.ping_avg_ms = 120.0;
    s.ping_mdev_ms = 25.0;
    s.throughput_mbps = 42.0;
    s.throughput_estimated = true;
    s.tcp_retrans = 150;
    return DiagnosticEngine().diagnose("", "", s, {s});
}

size_t countOf(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) ++n;
    return n;
}

}

TEST(ReportFormatterTest, PlainReportHasEverySection) {
    const auto text = ReportFormatter(false).format(troubledPath());

    EXPECT_NE(text.find("hpc01 → nas01"), std::string::npos);
    EXPECT_NE(text.find("Path type: nfs"), std::string::npos);
    EXPECT_NE(text.find("Status: error"), std::string::npos);
    EXPECT_NE(text.find("Current Metrics"), std::string::npos);
    EXPECT_NE(text.find("42.0 Mbps (estimated)"), std::string::npos);
    EXPECT_NE(text.find("Potential Causes"), std::string::npos);
    EXPECT_NE(text.find("[HIGH] High Packet Loss"), std::string::npos);
    EXPECT_NE(text.find("Recommendations"), std::string::npos);
    EXPECT_EQ(text.find('\033'), std::string::npos);
}

TEST(ReportFormatterTest, RecommendationsAreCapped) {
    const auto diag = troubledPath();
    ASSERT_GT(diag.recommendations.size(), 3u);

    const auto text = ReportFormatter(false, 3).format(diag);
    EXPECT_EQ(countOf(text, "    → "), 3u);
}

TEST(ReportFormatterTest, ColorUsesAnsiEscapes) {
    const auto text = ReportFormatter(true).format(troubledPath());
    EXPECT_NE(text.find("\033[91m"), std::string::npos);
}

TEST(ReportFormatterTest, TrendsShowSlopeAndAlertLevel) {
    auto diag = troubledPath();
    TrendReport falling;
    falling.trend = TrendDirection::Decreasing;
    falling.first_derivative = -120.0;
    falling.alert_level = AlertLevel::Warning;
    diag.trends["throughput"] = falling;
    diag.trends["latency"] = TrendReport{};

    const auto text = ReportFormatter(false).format(diag);

    EXPECT_NE(text.find("Throughput   decreasing (-120.00 Mbps/h, warning)"), std::string::npos) << text;
    EXPECT_NE(text.find("Latency      unknown\n"), std::string::npos) << text;
}

TEST(ReportFormatterTest, JsonCarriesCausesAndNulls) {
    const auto j = nlohmann::json::parse(ReportFormatter::toJson(DiagnosticEngine().diagnose("hpc01", "nas01", std::nullopt, {})));

    EXPECT_EQ(j["current_status"], "no_data");
    EXPECT_TRUE(j["last_seen"].is_null());
    ASSERT_EQ(j["causes"].size(), 1u);
    EXPECT_EQ(j["causes"][0]["cause"], "No network data available");
    EXPECT_EQ(j["recommendations"][0], "Network appears healthy - no action required");
}
