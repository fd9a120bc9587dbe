#include "bench/CacheControl.hpp"
#include "FakeRunner.hpp"
#include <gtest/gtest.h>

using namespace pw::bench;
using pw::test::FakeRunner;
using pw::util::exec::Remote;

TEST(CacheControlTest, FlushRunsLocallyOrOverSsh) {
    const auto runner = std::make_shared<FakeRunner>();
    runner->alwaysRun("sh", "");
    const CacheControl cache(runner);

    EXPECT_TRUE(cache.flush());
    EXPECT_TRUE(cache.flush(Remote{"localhost"}));
    EXPECT_TRUE(cache.flush(Remote{"nas01", "bench"}));

    EXPECT_EQ(runner->runCount("sh"), 3u);
    ASSERT_EQ(runner->remoteRunCalls.size(), 1u);
    EXPECT_EQ(runner->events.back(), "sh@nas01");
}

TEST(CacheControlTest, FailuresAreReportedNotThrown) {
    const auto runner = std::make_shared<FakeRunner>();
    runner->alwaysFail("sh");
    const CacheControl cache(runner);

    EXPECT_FALSE(cache.flush(Remote{"nas01"}));
    EXPECT_FALSE(cache.pin({"/tmp/pathwatch_test_0.bin"}));
    EXPECT_TRUE(cache.pin({}));
}

TEST(CacheControlTest, PinPrefersVmtouch) {
    const auto runner = std::make_shared<FakeRunner>();
    runner->installTool("vmtouch");
    runner->alwaysRun("vmtouch", "");
    const CacheControl cache(runner);

    EXPECT_TRUE(cache.pin({"/tmp/a.bin", "/tmp/b.bin"}));
    ASSERT_EQ(runner->runCalls.size(), 1u);
    EXPECT_EQ(runner->runCalls.front(), (pw::util::exec::Argv{"vmtouch", "-t", "/tmp/a.bin", "/tmp/b.bin"}));
}
