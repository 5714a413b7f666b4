#include "mvr/ws/JsonCodec.hpp"
#include <gtest/gtest.h>
#include <rapidjson/document.h>

using namespace mvr::ws;
using namespace rapidjson;

namespace {

Document parse(const std::string& s) {
    Document d;
    d.Parse(s.c_str());
    EXPECT_FALSE(d.HasParseError()) << s;
    return d;
}

} // namespace

TEST(JsonCodecTest, ParseFullRequest) {
    std::string rid;
    auto r = parseRequest(R"({
        "type":"price_overview_batch","request_id":"r-1","symbols":["AAA","BBB"],
        "start":"2024-01-02T10:00:00Z","end":1704193200,"resolution":60.0,
        "range_start":3,"range_end":8,"compute_mode":true,"ticks":500
    })", &rid);
    ASSERT_TRUE(r) << r.error().describe();
    EXPECT_EQ(rid, "r-1");
    EXPECT_EQ(r->type, "price_overview_batch");
    EXPECT_EQ(r->requestId, "r-1");
    EXPECT_EQ(r->symbols, (std::vector<std::string>{"AAA", "BBB"}));
    EXPECT_EQ(r->start, "2024-01-02T10:00:00Z");
    EXPECT_EQ(r->end, "1704193200");
    EXPECT_EQ(r->resolution, 60);
    EXPECT_EQ(r->rangeStart, 3);
    EXPECT_EQ(r->rangeEnd, 8);
    ASSERT_TRUE(r->computeMode.has_value());
    EXPECT_TRUE(*r->computeMode);
    EXPECT_EQ(r->ticks, 500);
    EXPECT_FALSE(r->state.has_value());
}

TEST(JsonCodecTest, AbsentAndNullFieldsKeepZeroValues) {
    auto r = parseRequest(R"({"type":"timeframe","symbol":null,"compute_mode":null})");
    ASSERT_TRUE(r);
    EXPECT_TRUE(r->requestId.empty());
    EXPECT_TRUE(r->symbol.empty());
    EXPECT_FALSE(r->computeMode.has_value());
    EXPECT_EQ(r->resolution, 0);
}

TEST(JsonCodecTest, MalformedInput) {
    EXPECT_EQ(parseRequest("not json").error().message, "malformed request");
    EXPECT_EQ(parseRequest("[1,2]").error().message, "malformed request");
    EXPECT_EQ(parseRequest("").error().message, "malformed request");
}

TEST(JsonCodecTest, WrongFieldTypeIsMalformedButKeepsRequestId) {
    std::string rid;
    auto r = parseRequest(R"({"type":"price_overview","request_id":"r9","resolution":"sixty"})", &rid);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().message, "malformed request");
    EXPECT_EQ(r.error().field, "resolution");
    EXPECT_EQ(rid, "r9");

    EXPECT_FALSE(parseRequest(R"({"type":"x","resolution":1.5})"));
    EXPECT_FALSE(parseRequest(R"({"type":"x","symbols":"AAA"})"));
    EXPECT_FALSE(parseRequest(R"({"type":"x","symbols":["AAA",1]})"));
    EXPECT_FALSE(parseRequest(R"({"type":"x","state":[]})"));
}

TEST(JsonCodecTest, ParseState) {
    auto r = parseRequest(R"({"type":"state_update","state":{
        "compute_mode":true,"range_start":1,"range_end":4,"markers":{"AAA":2,"BBB":5},
        "ticks_requested":5000,"last_symbol":"AAA","range_start_time":"a","range_end_time":"b",
        "resolution":"1m","custom_resolution_seconds":30,"updated_at":"ignored"}})");
    ASSERT_TRUE(r) << r.error().describe();
    ASSERT_TRUE(r->state.has_value());
    const auto& s = *r->state;
    EXPECT_TRUE(s.computeMode);
    EXPECT_EQ(s.rangeEnd, 4);
    EXPECT_EQ(s.markers.at("BBB"), 5);
    EXPECT_EQ(s.ticksRequested, 5000);
    EXPECT_EQ(s.lastSymbol, "AAA");
    EXPECT_EQ(s.resolution, "1m");
    EXPECT_EQ(s.customResolutionSeconds, 30);
    EXPECT_EQ(s.updatedAtMs, 0);
}

TEST(JsonCodecTest, DataResponseShape) {
    auto d = parse(dataResponse("state", "r1", nullptr));
    EXPECT_STREQ(d["type"].GetString(), "state");
    EXPECT_STREQ(d["request_id"].GetString(), "r1");
    EXPECT_TRUE(d["data"].IsNull());

    auto noId = parse(dataResponse("timeframe", "", [](JsonWriter& w){ writeStatusOk(w); }));
    EXPECT_FALSE(noId.HasMember("request_id"));
    EXPECT_STREQ(noId["data"]["status"].GetString(), "ok");
}

TEST(JsonCodecTest, ErrorResponseShape) {
    auto d = parse(errorResponse("r2", "missing symbol"));
    EXPECT_STREQ(d["type"].GetString(), "error");
    EXPECT_STREQ(d["request_id"].GetString(), "r2");
    EXPECT_STREQ(d["message"].GetString(), "missing symbol");
    EXPECT_FALSE(d.HasMember("data"));
}

TEST(JsonCodecTest, WriteOverviewWithNulls) {
    mvr::store::PriceOverview p;
    p.resolutionLabel = "60s";
    p.prices = {100.0, std::nullopt, 101.5};
    p.datetimes = {"a", "b", "c"};

    auto d = parse(dataResponse("price_overview", "", [&](JsonWriter& w){ writeOverview(w, p); }));
    const auto& data = d["data"];
    EXPECT_STREQ(data["resolution_label"].GetString(), "60s");
    ASSERT_EQ(data["prices"].Size(), 3u);
    EXPECT_DOUBLE_EQ(data["prices"][0].GetDouble(), 100.0);
    EXPECT_TRUE(data["prices"][1].IsNull());
    EXPECT_DOUBLE_EQ(data["prices"][2].GetDouble(), 101.5);
    EXPECT_STREQ(data["datetimes"][2].GetString(), "c");
}

TEST(JsonCodecTest, WriteItemsAddsErrorOnlyWhenSet) {
    std::vector<mvr::store::OverviewItem> items(2);
    items[0].symbol = "AAA";
    items[1].symbol = "BOOM";
    items[1].error = "could not build price overview";

    auto d = parse(dataResponse("price_overview_batch", "", [&](JsonWriter& w){ writeOverviewItems(w, items); }));
    const auto& arr = d["data"];
    ASSERT_EQ(arr.Size(), 2u);
    EXPECT_TRUE(arr[0]["data"].IsNull());
    EXPECT_FALSE(arr[0].HasMember("error"));
    EXPECT_STREQ(arr[1]["error"].GetString(), "could not build price overview");
}

TEST(JsonCodecTest, WriteStateAllFields) {
    mvr::session::SessionState s;
    s.markers["AAA"] = 1;
    s.updatedAtMs = 1704189600123LL;

    auto d = parse(dataResponse("state", "", [&](JsonWriter& w){ writeState(w, s); }));
    const auto& data = d["data"];
    for (const char* k : {"compute_mode", "range_start", "range_end", "markers", "ticks_requested",
                          "last_symbol", "range_start_time", "range_end_time", "resolution",
                          "custom_resolution_seconds", "updated_at"}) {
        EXPECT_TRUE(data.HasMember(k)) << k;
    }
    EXPECT_EQ(data["markers"]["AAA"].GetInt(), 1);
    EXPECT_STREQ(data["updated_at"].GetString(), "2024-01-02T10:00:00.123Z");
}

TEST(JsonCodecTest, WriteTimeframe) {
    mvr::store::TimeframePayload p;
    p.start = "s";
    p.end = "e";
    p.resolutionLabel = "1m";
    p.frameQuality.push_back({"Y", {1, 1, 0, 1}});

    auto d = parse(dataResponse("timeframe", "", [&](JsonWriter& w){ writeTimeframe(w, p); }));
    const auto& fq = d["data"]["frame_quality"];
    ASSERT_EQ(fq.Size(), 1u);
    EXPECT_STREQ(fq[0]["symbol"].GetString(), "Y");
    ASSERT_EQ(fq[0]["quality"].Size(), 4u);
    EXPECT_EQ(fq[0]["quality"][2].GetInt(), 0);
}
