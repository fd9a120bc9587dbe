#include <gtest/gtest.h>
#include "diag/Recommendations.hpp"

#include <algorithm>

using namespace pw::diag;
using namespace pw::types;

TEST(RecommendationsTest, SharedSetsAreDeduplicatedInOrder) {
    const std::vector<Cause> causes{
        {CauseKind::HighPacketLoss, "High Packet Loss", Confidence::High, ""},
        {CauseKind::ElevatedPacketLoss, "Elevated Packet Loss", Confidence::Medium, ""},
        {CauseKind::HighJitter, "High Jitter", Confidence::High, ""},
    };

    const auto recs = recommend(causes);
    const auto& loss = recommendationsFor(CauseKind::HighPacketLoss);
    const auto& jitter = recommendationsFor(CauseKind::HighJitter);

    ASSERT_EQ(recs.size(), loss.size() + jitter.size());
    EXPECT_EQ(recs.front(), loss.front());
    EXPECT_EQ(recs[loss.size()], jitter.front());
}

TEST(RecommendationsTest, InformationalCausesFallBack) {
    EXPECT_TRUE(recommendationsFor(CauseKind::NoIssues).empty());
    EXPECT_TRUE(recommendationsFor(CauseKind::NoData).empty());

    const auto recs = recommend({{CauseKind::NoIssues, "No obvious issues detected", Confidence::Low, ""}});
    EXPECT_EQ(recs, std::vector<std::string>{NO_ACTION_RECOMMENDATION});
    EXPECT_EQ(recommend({}), std::vector<std::string>{NO_ACTION_RECOMMENDATION});
}

TEST(RecommendationsTest, TrendsShareTheirSignalsAdvice) {
    EXPECT_EQ(recommendationsFor(CauseKind::DecliningThroughput), recommendationsFor(CauseKind::LowThroughput));
    EXPECT_EQ(recommendationsFor(CauseKind::IncreasingLatency), recommendationsFor(CauseKind::HighLatency));
    EXPECT_EQ(recommendationsFor(CauseKind::MildBusinessHoursImpact),
              recommendationsFor(CauseKind::BusinessHoursCongestion));
}

TEST(RecommendationsTest, FailedCollectionHasOwnAdvice) {
    const auto& failed = recommendationsFor(CauseKind::CollectionFailed);
    const auto& loss = recommendationsFor(CauseKind::HighPacketLoss);

    ASSERT_FALSE(failed.empty());
    for (const auto& r : failed) EXPECT_EQ(std::count(loss.begin(), loss.end(), r), 0);

    const auto recs = recommend({{CauseKind::CollectionFailed, "Measurement Failed", Confidence::High, ""}});
    EXPECT_EQ(recs, failed);
}
