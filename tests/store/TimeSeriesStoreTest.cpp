#include "mvr/store/TimeSeriesStore.hpp"
#include "mvr/util/TimeUtil.hpp"
#include "support/TempTree.hpp"
#include <gtest/gtest.h>

using namespace mvr::store;
using mvr::ingest::TickPoint;
using mvr::test::TempTree;
using mvr::util::kMsPerMinute;
using mvr::util::kMsPerSecond;

namespace {

constexpr std::int64_t kTenAm = 1704189600000LL;   // 2024-01-02 10:00:00 UTC

SeriesIndex indexOf(std::initializer_list<TickPoint> ticks) {
    SeriesIndex idx;
    for (const auto& t : ticks) idx.add(t);
    return idx;
}

} // namespace

// ===================== SeriesIndex =====================

TEST(SeriesIndexTest, WindowTracksMinAndMax) {
    auto idx = indexOf({
        {"A", kTenAm + 5'000, 1.0},
        {"B", kTenAm - 90'000, 2.0},
        {"A", kTenAm + 600'123, 3.0},
    });
    ASSERT_TRUE(idx.window.valid);
    EXPECT_EQ(idx.window.minMs, kTenAm - 90'000);
    EXPECT_EQ(idx.window.maxMs, kTenAm + 600'123);
    EXPECT_EQ(idx.symbolCount(), 2u);
}

TEST(SeriesIndexTest, LargerTimestampWinsWithinMinute) {
    auto idx = indexOf({
        {"A", kTenAm + 30'000, 2.0},
        {"A", kTenAm + 10'000, 1.0},   // older, arrives later
    });
    const auto& m = idx.prices.at("A").at(SeriesIndex::minuteOf(kTenAm));
    EXPECT_DOUBLE_EQ(m.price, 2.0);
    EXPECT_EQ(m.timestampMs, kTenAm + 30'000);
    EXPECT_EQ(idx.coverage.at("A").size(), 1u);
}

TEST(SeriesIndexTest, EqualTimestampTieIgnoresArrivalOrder) {
    const TickPoint low{"A", kTenAm + 30'000, 1.0};
    const TickPoint high{"A", kTenAm + 30'000, 2.0};

    auto lowFirst = indexOf({low, high});
    auto highFirst = indexOf({high, low});

    const auto key = SeriesIndex::minuteOf(kTenAm);
    EXPECT_DOUBLE_EQ(lowFirst.prices.at("A").at(key).price, 2.0);
    EXPECT_DOUBLE_EQ(highFirst.prices.at("A").at(key).price, 2.0);
}

TEST(SeriesIndexTest, MinuteKeyIsUnixSeconds) {
    EXPECT_EQ(SeriesIndex::minuteOf(kTenAm + 59'999), kTenAm / 1000);
}

// ===================== buildTimeframe =====================

TEST(TimeSeriesStoreTest, TimeframeQualityBitmap) {
    auto idx = indexOf({
        {"Y", kTenAm, 1.0},
        {"Y", kTenAm + 1 * kMsPerMinute + 5'000, 1.0},
        {"Y", kTenAm + 3 * kMsPerMinute, 1.0},
    });
    auto tf = TimeSeriesStore::buildTimeframe(idx, 0);
    EXPECT_EQ(tf.resolutionLabel, "1m");
    EXPECT_EQ(tf.start, "2024-01-02T10:00:00Z");
    EXPECT_EQ(tf.end, "2024-01-02T10:03:00Z");
    ASSERT_EQ(tf.frameQuality.size(), 1u);
    EXPECT_EQ(tf.frameQuality[0].quality, (std::vector<int>{1, 1, 0, 1}));
}

TEST(TimeSeriesStoreTest, TimeframeEmptyStore) {
    SeriesIndex idx;
    auto tf = TimeSeriesStore::buildTimeframe(idx, kTenAm);
    EXPECT_EQ(tf.start, "2024-01-02T10:00:00Z");
    EXPECT_EQ(tf.end, tf.start);
    EXPECT_EQ(tf.resolutionLabel, "1m");
    EXPECT_TRUE(tf.frameQuality.empty());
}

TEST(TimeSeriesStoreTest, TimeframeBandsAndOrdering) {
    auto idx = indexOf({
        {"B", kTenAm, 1.0},
        {"B", kTenAm + 200 * kMsPerMinute, 1.0},
        {"A", kTenAm + 7 * kMsPerMinute, 1.0},
        {"C", kTenAm + 12 * kMsPerMinute, 1.0},
    });
    auto tf = TimeSeriesStore::buildTimeframe(idx, 0);
    EXPECT_EQ(tf.resolutionLabel, "5m");
    ASSERT_EQ(tf.frameQuality.size(), 3u);
    // Most covered minutes first, then by name.
    EXPECT_EQ(tf.frameQuality[0].symbol, "B");
    EXPECT_EQ(tf.frameQuality[1].symbol, "A");
    EXPECT_EQ(tf.frameQuality[2].symbol, "C");
    EXPECT_EQ(tf.frameQuality[0].quality.size(), 41u);
    EXPECT_EQ(tf.frameQuality[1].quality[1], 1);   // minute 7 -> bucket 1
    EXPECT_EQ(tf.frameQuality[2].quality[2], 1);   // minute 12 -> bucket 2
    EXPECT_EQ(tf.frameQuality[0].quality[40], 1);
}

TEST(TimeSeriesStoreTest, TimeframeLongSpanUsesTwelveHours) {
    auto idx = indexOf({
        {"A", kTenAm, 1.0},
        {"A", kTenAm + 8LL * 24 * 60 * kMsPerMinute, 1.0},
    });
    auto tf = TimeSeriesStore::buildTimeframe(idx, 0);
    EXPECT_EQ(tf.resolutionLabel, "12h");
    EXPECT_EQ(tf.frameQuality[0].quality.size(), 17u);
}

// ===================== buildOverview =====================

TEST(TimeSeriesStoreTest, OverviewMinuteBuckets) {
    auto idx = indexOf({
        {"Y", kTenAm, 100.0},
        {"Y", kTenAm + 2 * kMsPerMinute, 101.5},
    });
    auto ov = TimeSeriesStore::buildOverview(idx, "Y", kTenAm, kTenAm + 2 * kMsPerMinute, 60);
    ASSERT_TRUE(ov.has_value());
    EXPECT_EQ(ov->resolutionLabel, "60s");
    ASSERT_EQ(ov->prices.size(), 3u);
    ASSERT_TRUE(ov->prices[0].has_value());
    EXPECT_DOUBLE_EQ(*ov->prices[0], 100.0);
    EXPECT_FALSE(ov->prices[1].has_value());
    ASSERT_TRUE(ov->prices[2].has_value());
    EXPECT_DOUBLE_EQ(*ov->prices[2], 101.5);
    EXPECT_EQ(ov->datetimes[0], "2024-01-02 10:00:00");
    EXPECT_EQ(ov->datetimes[2], "2024-01-02 10:02:00");
}

TEST(TimeSeriesStoreTest, OverviewWideBucketKeepsLatestInsideBucket) {
    auto idx = indexOf({
        {"Y", kTenAm + 1 * kMsPerMinute, 1.0},
        {"Y", kTenAm + 3 * kMsPerMinute, 3.0},
        {"Y", kTenAm + 5 * kMsPerMinute, 5.0},
    });
    auto ov = TimeSeriesStore::buildOverview(idx, "Y", kTenAm, kTenAm + 9 * kMsPerMinute, 300);
    ASSERT_TRUE(ov.has_value());
    ASSERT_EQ(ov->prices.size(), 2u);
    EXPECT_DOUBLE_EQ(*ov->prices[0], 3.0);   // minutes 0..4
    EXPECT_DOUBLE_EQ(*ov->prices[1], 5.0);   // minutes 5..9
}

TEST(TimeSeriesStoreTest, OverviewSubMinuteLooksUpBucketEnd) {
    auto idx = indexOf({
        {"Y", kTenAm + 10'000, 7.0},
        {"Y", kTenAm + kMsPerMinute, 8.0},
    });
    auto ov = TimeSeriesStore::buildOverview(idx, "Y", kTenAm, kTenAm + kMsPerMinute, 30);
    ASSERT_TRUE(ov.has_value());
    ASSERT_EQ(ov->prices.size(), 3u);
    EXPECT_DOUBLE_EQ(*ov->prices[0], 7.0);
    EXPECT_DOUBLE_EQ(*ov->prices[1], 7.0);
    EXPECT_DOUBLE_EQ(*ov->prices[2], 8.0);
    EXPECT_EQ(ov->resolutionLabel, "30s");
}

TEST(TimeSeriesStoreTest, OverviewDefaultsAndClamps) {
    auto idx = indexOf({{"Y", kTenAm, 1.0}});

    auto reversed = TimeSeriesStore::buildOverview(idx, "Y", kTenAm + 500, kTenAm - kMsPerMinute, 0);
    ASSERT_TRUE(reversed.has_value());
    EXPECT_EQ(reversed->resolutionLabel, "300s");
    ASSERT_EQ(reversed->prices.size(), 1u);
    EXPECT_EQ(reversed->datetimes[0], "2024-01-02 10:00:00");

    EXPECT_FALSE(TimeSeriesStore::buildOverview(idx, "NOPE", kTenAm, kTenAm, 60).has_value());
}

TEST(TimeSeriesStoreTest, OverviewOfEmptyRangeIsAllNull) {
    auto idx = indexOf({{"Y", kTenAm, 1.0}});
    auto ov = TimeSeriesStore::buildOverview(idx, "Y", kTenAm + 60 * kMsPerMinute,
                                             kTenAm + 62 * kMsPerMinute, 60);
    ASSERT_TRUE(ov.has_value());
    ASSERT_EQ(ov->prices.size(), 3u);
    for (const auto& p : ov->prices) EXPECT_FALSE(p.has_value());
}

// ===================== load / loadRange =====================

class StoreLoadTest : public ::testing::Test {
protected:
    void SetUp() override {
        tree.write("2024-01-02/AAA/10_00.csv", "time_msc,last\n1704189600000,100\n1704189630000,100.5\n");
        tree.write("2024-01-02/AAA/10_02.csv", "time_msc,last\n1704189720000,101.5\n");
        tree.write("2024-01-02/BBB/10_01.csv", "t,bid\n1704189660,50\n");
    }

    TempTree tree;
    TimeSeriesStore store;
};

TEST_F(StoreLoadTest, LoadBuildsIndex) {
    auto stats = store.load({tree.path()});
    EXPECT_EQ(stats.files, 3u);
    EXPECT_EQ(stats.rows, 4u);
    EXPECT_EQ(store.symbolCount(), 2u);
    EXPECT_EQ(store.listSymbols(), (std::vector<std::string>{"AAA", "BBB"}));

    const auto w = store.window();
    ASSERT_TRUE(w.valid);
    EXPECT_EQ(w.minMs, kTenAm);
    EXPECT_EQ(w.maxMs, kTenAm + 2 * kMsPerMinute);

    auto ov = store.buildPriceOverview("AAA", kTenAm, kTenAm + 2 * kMsPerMinute, 60);
    ASSERT_TRUE(ov.has_value());
    EXPECT_DOUBLE_EQ(*ov->prices[0], 100.5);
    EXPECT_FALSE(ov->prices[1].has_value());
    EXPECT_DOUBLE_EQ(*ov->prices[2], 101.5);
}

TEST_F(StoreLoadTest, ReloadIsIdempotent) {
    store.load({tree.path()});
    const auto tf1 = TimeSeriesStore::buildTimeframe(*store.snapshot(), 0);
    const auto ov1 = store.buildPriceOverview("AAA", kTenAm, kTenAm + 5 * kMsPerMinute, 60);

    store.load({tree.path()});
    const auto tf2 = TimeSeriesStore::buildTimeframe(*store.snapshot(), 0);
    const auto ov2 = store.buildPriceOverview("AAA", kTenAm, kTenAm + 5 * kMsPerMinute, 60);

    EXPECT_EQ(tf1.start, tf2.start);
    EXPECT_EQ(tf1.end, tf2.end);
    ASSERT_EQ(tf1.frameQuality.size(), tf2.frameQuality.size());
    for (std::size_t i = 0; i < tf1.frameQuality.size(); ++i) {
        EXPECT_EQ(tf1.frameQuality[i].symbol, tf2.frameQuality[i].symbol);
        EXPECT_EQ(tf1.frameQuality[i].quality, tf2.frameQuality[i].quality);
    }
    ASSERT_TRUE(ov1 && ov2);
    EXPECT_EQ(ov1->prices, ov2->prices);
    EXPECT_EQ(ov1->datetimes, ov2->datetimes);
}

TEST_F(StoreLoadTest, FailedLoadKeepsSnapshot) {
    store.load({tree.path()});
    const auto before = store.snapshot();

    const auto file = tree.write("not-a-dir.txt", "x");
    EXPECT_THROW(store.load({file.string()}), mvr::ingest::ScanError);

    EXPECT_EQ(store.snapshot(), before);
    EXPECT_EQ(store.symbolCount(), 2u);
}

TEST_F(StoreLoadTest, LoadRangeReplacesSnapshot) {
    store.load({tree.path()});
    ASSERT_EQ(store.symbolCount(), 2u);

    store.loadRange({tree.path()}, kTenAm + 2 * kMsPerMinute, kTenAm + 10 * kMsPerMinute);
    EXPECT_EQ(store.listSymbols(), (std::vector<std::string>{"AAA"}));
    const auto w = store.window();
    EXPECT_EQ(w.minMs, kTenAm + 2 * kMsPerMinute);
    EXPECT_FALSE(store.buildPriceOverview("BBB", kTenAm, kTenAm, 60).has_value());
}

TEST_F(StoreLoadTest, PublishedSnapshotIsNotMutated) {
    store.load({tree.path()});
    const auto old = store.snapshot();
    const auto oldCount = old->symbolCount();

    tree.write("2024-01-02/CCC/10_03.csv", "t,p\n1704189780,9\n");
    store.load({tree.path()});

    EXPECT_EQ(old->symbolCount(), oldCount);
    EXPECT_EQ(store.symbolCount(), 3u);
}
