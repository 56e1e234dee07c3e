#include <gtest/gtest.h>
#include "intel/intel_aggregator.h"
#include "monitoring/metrics.h"
#include "test_support.h"

using namespace std::chrono_literals;

TEST(IntelAggregatorTest, NoSourcesMeansDisabled) {
    IntelAggregator agg(1000ms);

    EXPECT_FALSE(agg.enabled());
    EXPECT_FALSE(agg.lookup("https://example.com/").known());
    EXPECT_TRUE(agg.status().empty());
}

TEST(IntelAggregatorTest, MergesAllAnswers) {
    IntelAggregator agg(1000ms);
    agg.addSource(std::make_shared<FakeIntelSource>("sb", safeBrowsingHit()));
    agg.addSource(std::make_shared<FakeIntelSource>("vt", virusTotalResult(false, 2)));

    ThreatIntelSignal s = agg.lookup("http://evil.example/");

    ASSERT_TRUE(s.flaggedBySafeBrowsing.has_value());
    EXPECT_TRUE(*s.flaggedBySafeBrowsing);
    ASSERT_TRUE(s.flaggedByVirusTotal.has_value());
    EXPECT_FALSE(*s.flaggedByVirusTotal);
    EXPECT_EQ(s.vendorHitCount, 2);
    EXPECT_TRUE(s.positive());
}

TEST(IntelAggregatorTest, SkipsDisabledSources) {
    auto off = std::make_shared<FakeIntelSource>("off", safeBrowsingHit(), 0ms, false);
    auto on = std::make_shared<FakeIntelSource>("on", virusTotalResult(false, 0));

    IntelAggregator agg(1000ms);
    agg.addSource(off);
    agg.addSource(on);

    EXPECT_TRUE(agg.enabled());
    ThreatIntelSignal s = agg.lookup("https://example.com/");

    EXPECT_EQ(off->calls.load(), 0);
    EXPECT_EQ(on->calls.load(), 1);
    EXPECT_FALSE(s.flaggedBySafeBrowsing.has_value());
    EXPECT_FALSE(s.positive());

    auto status = agg.status();
    ASSERT_EQ(status.size(), 2u);
    EXPECT_EQ(status[0].name, "off");
    EXPECT_FALSE(status[0].enabled);
    EXPECT_EQ(status[1].name, "on");
    EXPECT_TRUE(status[1].enabled);
}

TEST(IntelAggregatorTest, SlowSourceIsAbandonedAtDeadline) {
    IntelAggregator agg(100ms);
    agg.addSource(std::make_shared<FakeIntelSource>("slow", safeBrowsingHit(), 1500ms));
    agg.addSource(std::make_shared<FakeIntelSource>("fast", virusTotalResult(true, 4)));

    int64_t timeouts = Metrics::instance().get("intel_lookup_timeouts_total");
    auto start = std::chrono::steady_clock::now();
    ThreatIntelSignal s = agg.lookup("http://evil.example/");
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 1000ms);
    EXPECT_FALSE(s.flaggedBySafeBrowsing.has_value());
    ASSERT_TRUE(s.flaggedByVirusTotal.has_value());
    EXPECT_TRUE(*s.flaggedByVirusTotal);
    EXPECT_EQ(s.vendorHitCount, 4);
    EXPECT_EQ(Metrics::instance().get("intel_lookup_timeouts_total"), timeouts + 1);
}

TEST(IntelAggregatorTest, DestructorWaitsForAbandonedLookups) {
    auto slow = std::make_shared<FakeIntelSource>("slow", safeBrowsingHit(), 300ms);
    {
        IntelAggregator agg(50ms);
        agg.addSource(slow);

        EXPECT_FALSE(agg.lookup("http://evil.example/").known());
        EXPECT_EQ(slow->completed.load(), 0);
        EXPECT_EQ(agg.workerCount(), 1u);
    }
    EXPECT_EQ(slow->completed.load(), 1);
}

TEST(IntelAggregatorTest, FinishedLookupsAreReaped) {
    auto fast = std::make_shared<FakeIntelSource>("fast", virusTotalResult(false, 0));

    IntelAggregator agg(1000ms);
    agg.addSource(fast);

    for (int i = 0; i < 5; ++i)
        agg.lookup("https://example.com/");

    // Each lookup reaps the threads of earlier, completed ones
    EXPECT_LE(agg.workerCount(), 1u);
    EXPECT_EQ(fast->calls.load(), 5);
}

TEST(IntelAggregatorTest, ThrowingSourceIsUnknown) {
    auto broken = std::make_shared<FakeIntelSource>("broken", safeBrowsingHit());
    broken->throws = true;

    IntelAggregator agg(1000ms);
    agg.addSource(broken);
    agg.addSource(std::make_shared<FakeIntelSource>("vt", virusTotalResult(false, 0)));

    ThreatIntelSignal s = agg.lookup("https://example.com/");
    EXPECT_FALSE(s.flaggedBySafeBrowsing.has_value());
    EXPECT_TRUE(s.flaggedByVirusTotal.has_value());
}

TEST(IntelSignalTest, MergeKeepsAnyPositiveAnswer) {
    EXPECT_FALSE(mergeFlag(std::nullopt, std::nullopt).has_value());
    EXPECT_EQ(mergeFlag(false, std::nullopt), std::optional<bool>(false));
    EXPECT_EQ(mergeFlag(false, true), std::optional<bool>(true));
    EXPECT_EQ(mergeFlag(true, false), std::optional<bool>(true));
}
