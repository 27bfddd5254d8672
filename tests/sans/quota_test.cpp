#include "sans/quota.hpp"

#include <gtest/gtest.h>

namespace sans {
namespace {

using namespace std::chrono_literals;

TEST(QuotaTest, ParseSecondsAcceptsIntegersAndDecimals) {
    EXPECT_EQ(parse_seconds("3"), 3000ms);
    EXPECT_EQ(parse_seconds("0.5"), 500ms);
    EXPECT_EQ(parse_seconds(" 2 "), 2000ms);
    EXPECT_EQ(parse_seconds("0"), 0ms);
}

TEST(QuotaTest, ParseSecondsRejectsGarbage) {
    EXPECT_FALSE(parse_seconds("").has_value());
    EXPECT_FALSE(parse_seconds("soon").has_value());
    EXPECT_FALSE(parse_seconds("3s").has_value());
    EXPECT_FALSE(parse_seconds("-1").has_value());
    EXPECT_FALSE(parse_seconds("nan").has_value());
    EXPECT_FALSE(parse_seconds("inf").has_value());
}

TEST(QuotaTest, ParseSecondsRejectsDelaysBeyondCeiling) {
    EXPECT_EQ(parse_seconds("604800"), kMaxDelay);
    EXPECT_FALSE(parse_seconds("604801").has_value());
    EXPECT_FALSE(parse_seconds("9e12").has_value());
    EXPECT_FALSE(parse_seconds("1e300").has_value());
}

TEST(QuotaTest, ParseCount) {
    EXPECT_EQ(parse_count("49"), 49);
    EXPECT_EQ(parse_count(" 0"), 0);
    EXPECT_FALSE(parse_count("-3").has_value());
    EXPECT_FALSE(parse_count("4.5").has_value());
    EXPECT_FALSE(parse_count("").has_value());
}

TEST(QuotaTest, ExtractorReadsCompleteQuota) {
    auto extract = make_header_extractor();
    auto reading = extract(200, Headers{{"RateLimit-Remaining", "41"}, {"RateLimit-Reset", "17"}});

    EXPECT_TRUE(reading.complete());
    EXPECT_FALSE(reading.malformed());
    EXPECT_EQ(reading.remaining, 41);
    EXPECT_EQ(reading.reset_in, 17000ms);
    EXPECT_FALSE(reading.retry_after.has_value());
}

TEST(QuotaTest, ExtractorIgnoresHeaderCase) {
    auto extract = make_header_extractor();
    auto reading =
        extract(429, Headers{{"ratelimit-remaining", "0"}, {"RATELIMIT-RESET", "9"}, {"retry-after", "9"}});

    EXPECT_TRUE(reading.complete());
    EXPECT_EQ(reading.retry_after, 9000ms);
}

TEST(QuotaTest, ExtractorReportsMissingFieldsAsIncomplete) {
    auto extract = make_header_extractor();
    auto reading = extract(200, Headers{{"RateLimit-Remaining", "41"}});

    EXPECT_FALSE(reading.complete());
    EXPECT_FALSE(reading.malformed());
}

TEST(QuotaTest, ExtractorReportsUnparsableFields) {
    auto extract = make_header_extractor();
    auto reading = extract(200, Headers{{"RateLimit-Remaining", "41"}, {"RateLimit-Reset", "later"}});

    EXPECT_TRUE(reading.malformed());
    EXPECT_NE(reading.error.find("RateLimit-Reset"), std::string::npos);
}

TEST(QuotaTest, ExtractorReportsHugeDelaysAsMalformed) {
    auto extract = make_header_extractor();
    auto reading = extract(
        429, Headers{{"RateLimit-Remaining", "0"}, {"RateLimit-Reset", "9e12"}, {"Retry-After", "1e300"}}
    );

    EXPECT_TRUE(reading.malformed());
    EXPECT_FALSE(reading.reset_in.has_value());
    EXPECT_FALSE(reading.retry_after.has_value());
    EXPECT_NE(reading.error.find("RateLimit-Reset"), std::string::npos);
}

TEST(QuotaTest, ExtractorUsesConfiguredNames) {
    QuotaHeaders names{"X-Quota-Left", "X-Quota-Reset", "X-Wait"};
    auto extract = make_header_extractor(names);
    auto reading = extract(200, Headers{{"X-Quota-Left", "3"}, {"X-Quota-Reset", "1.5"}});

    EXPECT_TRUE(reading.complete());
    EXPECT_EQ(reading.remaining, 3);
    EXPECT_EQ(reading.reset_in, 1500ms);
}

}  // namespace
}  // namespace sans
