#include "mvr/overview/OverviewBuilder.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <map>
#include <stdexcept>

using namespace mvr::overview;
using namespace mvr::store;

namespace {

// In-memory PriceSource; a symbol named "BOOM" throws on build.
class FakeSource : public PriceSource {
public:
    std::map<std::string, PriceOverview> data;
    std::vector<std::string> symbolsAfterReload;
    int loads = 0;
    bool failLoad = false;
    mutable std::int64_t lastStart = 0;
    mutable std::int64_t lastEnd = 0;
    mutable int lastResolution = 0;

    std::optional<PriceOverview> buildPriceOverview(const std::string& symbol,
                                                    std::int64_t startMs,
                                                    std::int64_t endMs,
                                                    int resolutionSeconds) const override {
        if (symbol == "BOOM") throw std::runtime_error("index corrupted");
        lastStart = startMs;
        lastEnd = endMs;
        lastResolution = resolutionSeconds;
        auto it = data.find(symbol);
        if (it == data.end()) return std::nullopt;
        return it->second;
    }

    std::vector<std::string> listSymbols() const override {
        return symbolsAfterReload;
    }

    mvr::ingest::ScanStats loadRange(const std::vector<std::string>&, std::int64_t, std::int64_t) override {
        if (failLoad) throw mvr::ingest::ScanError("cannot list root");
        ++loads;
        return {};
    }
};

PriceOverview overviewWith(double price) {
    PriceOverview p;
    p.resolutionLabel = "60s";
    p.prices = {price};
    p.datetimes = {"2024-01-02 10:00:00"};
    return p;
}

} // namespace

TEST(OverviewBuilderTest, ResolutionForTicks) {
    // 1 hour over 5000 ticks -> ceil(3600 / 4999) = 1
    EXPECT_EQ(OverviewBuilder::resolutionForTicks(0, 3'600'000, 5000), 1);
    // 1 day over 100 ticks -> ceil(86400 / 99) = 873
    EXPECT_EQ(OverviewBuilder::resolutionForTicks(0, 86'400'000, 100), 873);
    EXPECT_EQ(OverviewBuilder::resolutionForTicks(0, 600'000, 11), 60);
    EXPECT_EQ(OverviewBuilder::resolutionForTicks(0, 86'400'000, 0),
              OverviewBuilder::resolutionForTicks(0, 86'400'000, kDefaultTicks));
    EXPECT_EQ(OverviewBuilder::resolutionForTicks(0, 86'400'000, 1), kFallbackResolutionSeconds);
    EXPECT_EQ(OverviewBuilder::resolutionForTicks(1000, 1000, 50), kFallbackResolutionSeconds);
    EXPECT_EQ(OverviewBuilder::resolutionForTicks(5000, 1000, 50), kFallbackResolutionSeconds);
}

TEST(OverviewBuilderTest, ResolutionForVeryLongWindowDoesNotWrap) {
    // ~70 years over 2 ticks needs more seconds than an int holds.
    EXPECT_EQ(OverviewBuilder::resolutionForTicks(0, 2'208'988'800'000LL, 2),
              std::numeric_limits<int>::max());
    EXPECT_EQ(OverviewBuilder::resolutionForTicks(0, 2'208'988'800'000LL, 3), 1'104'494'400);
    EXPECT_EQ(OverviewBuilder::resolutionForTicks(std::numeric_limits<std::int64_t>::min(),
                                                  std::numeric_limits<std::int64_t>::max(), 2),
              std::numeric_limits<int>::max());
}

TEST(OverviewBuilderTest, BatchIsolatesEntries) {
    FakeSource src;
    src.data["AAA"] = overviewWith(1.0);
    src.data["CCC"] = overviewWith(3.0);
    OverviewBuilder b(src);

    auto items = b.buildBatch({"AAA", " UNKNOWN ", "", "BOOM", "CCC"}, 0, 60'000, 60);
    ASSERT_EQ(items.size(), 4u);

    EXPECT_EQ(items[0].symbol, "AAA");
    ASSERT_TRUE(items[0].data.has_value());
    EXPECT_TRUE(items[0].error.empty());

    EXPECT_EQ(items[1].symbol, "UNKNOWN");
    EXPECT_FALSE(items[1].data.has_value());
    EXPECT_TRUE(items[1].error.empty());

    EXPECT_EQ(items[2].symbol, "BOOM");
    EXPECT_FALSE(items[2].data.has_value());
    EXPECT_EQ(items[2].error, "could not build price overview");

    EXPECT_EQ(items[3].symbol, "CCC");
    ASSERT_TRUE(items[3].data.has_value());
    EXPECT_DOUBLE_EQ(*items[3].data->prices[0], 3.0);
}

TEST(OverviewBuilderTest, IncreaseResolutionReloadsAndResetsCache) {
    FakeSource src;
    src.data["AAA"] = overviewWith(1.0);
    src.symbolsAfterReload = {"AAA"};

    TimeframeCache cache(std::chrono::seconds(600));
    int builds = 0;
    cache.getOrBuild([&]{ ++builds; return TimeframePayload{}; });

    OverviewBuilder b(src, &cache);
    auto out = b.increaseResolution({"/data"}, 11, 0, 600'000, {});

    EXPECT_EQ(src.loads, 1);
    EXPECT_EQ(out.resolutionSeconds, 60);
    EXPECT_EQ(src.lastResolution, 60);
    ASSERT_EQ(out.items.size(), 1u);
    EXPECT_EQ(out.items[0].symbol, "AAA");

    cache.getOrBuild([&]{ ++builds; return TimeframePayload{}; });
    EXPECT_EQ(builds, 2);
}

TEST(OverviewBuilderTest, IncreaseResolutionUsesGivenSymbols) {
    FakeSource src;
    src.symbolsAfterReload = {"AAA", "BBB"};
    OverviewBuilder b(src);

    auto out = b.increaseResolution({"/data"}, 0, 0, 3'600'000, {"ZZZ"});
    ASSERT_EQ(out.items.size(), 1u);
    EXPECT_EQ(out.items[0].symbol, "ZZZ");
    EXPECT_EQ(out.resolutionSeconds, 1);
}

TEST(OverviewBuilderTest, IncreaseResolutionPropagatesReloadFailure) {
    FakeSource src;
    src.failLoad = true;
    OverviewBuilder b(src);
    EXPECT_THROW(b.increaseResolution({"/data"}, 10, 0, 60'000, {"AAA"}), mvr::ingest::ScanError);
}
