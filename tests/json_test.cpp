#include <string>

#include <gtest/gtest.h>
#include <simdjson.h>
#include <tempo.hpp>

using namespace tempo;

class JsonTest : public ::testing::Test {};

// ==============================================================================
// Serialization
// ==============================================================================

TEST_F(JsonTest, PeriodToJson) {
    auto p = Period::parse("1 week 1.123 seconds");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(to_json(*p), "\"1w1.123s\"");
    EXPECT_EQ(to_json(Period::zero()), "\"0s\"");
}

TEST_F(JsonTest, InstantToJson) {
    EXPECT_EQ(to_json(sample_instant()), "\"2018-10-11T03:23:38+00:00\"");

    auto shifted = sample_instant().with_offset(std::chrono::minutes(-480));
    ASSERT_TRUE(shifted.has_value());
    EXPECT_EQ(to_json(*shifted), "\"2018-10-10T19:23:38-08:00\"");
}

TEST_F(JsonTest, EscapesControlCharacters) {
    std::string out;
    detail::append_json_string(out, "a\"b\\c\n\x01");
    EXPECT_EQ(out, "\"a\\\"b\\\\c\\n\\u0001\"");
}

// ==============================================================================
// Deserialization
// ==============================================================================

TEST_F(JsonTest, PeriodFromJson) {
    auto p = from_json<Period>(R"("2 years 18 Weeks 4 dy 12 hrs 0.000456 SEC")");
    ASSERT_TRUE(p.has_value()) << p.error().message();
    EXPECT_EQ(p->to_string(), "2y18w4d12h456us");

    auto round_trip = from_json<Period>(to_json(*p));
    ASSERT_TRUE(round_trip.has_value());
    EXPECT_EQ(*round_trip, *p);
}

TEST_F(JsonTest, InstantFromJsonKeepsOffset) {
    auto instant = from_json<Instant>(R"("2015-02-18 235960.234567 -05")");
    ASSERT_TRUE(instant.has_value()) << instant.error().message();
    EXPECT_EQ(instant->to_string(), "2015-02-18T23:59:60.234567-05:00");

    auto round_trip = from_json<Instant>(to_json(*instant));
    ASSERT_TRUE(round_trip.has_value());
    EXPECT_EQ(*round_trip, *instant);
    EXPECT_EQ(round_trip->offset(), instant->offset());
}

TEST_F(JsonTest, ParseErrorIsPassedThrough) {
    auto p = from_json<Period>(R"("1.23s456ns")");
    ASSERT_FALSE(p.has_value());
    EXPECT_EQ(p.error(), Period::parse("1.23s456ns").error());

    auto instant = from_json<Instant>(R"("boo")");
    ASSERT_FALSE(instant.has_value());
    EXPECT_EQ(instant.error().message(),
              "Failed to find RFC 3339 or ISO 8601 timestamp in \"boo\"");
}

TEST_F(JsonTest, RejectsNonStrings) {
    for (const char* json : {"42", "null", "[\"1s\"]", "{\"p\":\"1s\"}", "true"}) {
        SCOPED_TRACE(json);
        EXPECT_FALSE(from_json<Period>(json).has_value());
    }
}

TEST_F(JsonTest, RejectsMalformedJson) {
    EXPECT_FALSE(from_json<Period>("").has_value());
    EXPECT_FALSE(from_json<Period>("\"1s").has_value());
    EXPECT_FALSE(from_json<Period>("\"1s\" \"2s\"").has_value());
}

TEST_F(JsonTest, FieldsOfLargerDocument) {
    simdjson::ondemand::parser parser;
    simdjson::padded_string json(
        std::string(R"({"timeout": "1w1.23s", "deadline": "2018-10-11T03:23:38Z", "retries": 3})"));
    simdjson::ondemand::document doc;
    ASSERT_EQ(parser.iterate(json).get(doc), simdjson::SUCCESS);

    simdjson::ondemand::value timeout_value;
    ASSERT_EQ(doc["timeout"].get(timeout_value), simdjson::SUCCESS);
    auto period = from_json<Period>(timeout_value);
    ASSERT_TRUE(period.has_value());
    EXPECT_EQ(Timeout::from_period(*period), Timeout(1'230 + 1'000 * 604'800));

    simdjson::ondemand::value deadline_value;
    ASSERT_EQ(doc["deadline"].get(deadline_value), simdjson::SUCCESS);
    auto deadline = from_json<Instant>(deadline_value);
    ASSERT_TRUE(deadline.has_value());
    EXPECT_EQ(*deadline, sample_instant());

    simdjson::ondemand::value retries_value;
    ASSERT_EQ(doc["retries"].get(retries_value), simdjson::SUCCESS);
    auto not_a_period = from_json<Period>(retries_value);
    ASSERT_FALSE(not_a_period.has_value());
    EXPECT_NE(not_a_period.error().message().find("Expected a JSON string"), std::string::npos);
}
