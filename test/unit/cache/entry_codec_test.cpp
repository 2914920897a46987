#include <gtest/gtest.h>

#include <limits>

#include "f1metrics/cache/entry_codec.h"
#include "f1metrics/cache/fingerprint.h"

namespace f1metrics {
namespace cache {
namespace {

using model::Metadata;
using model::MetricParams;
using model::MetricResult;
using model::MetricValue;

CacheEntry SampleEntry() {
    MetricParams params;
    params.constructor_id = 1;
    params.season = 2020;

    CacheEntry entry;
    entry.metric_name = "constructor_podium_rate";
    entry.parameters = params.ToParamMap();
    entry.fingerprint = Fingerprint(entry.metric_name, entry.parameters);
    entry.created_at_ms = 1700000000123;

    entry.result = MetricResult(entry.metric_name, MetricValue(66.7));
    entry.result.constructor_id = 1;
    entry.result.constructor_name = std::string("Mercedes");
    entry.result.season = 2020;
    entry.result.metadata = Metadata{
        {"total_races", MetricValue(3)},
        {"position_breakdown", MetricValue(Metadata{{"P1", MetricValue(1)}, {"P2", MetricValue(1)}})},
        {"seasons", MetricValue(MetricValue::List{MetricValue(2020), MetricValue(2021)})},
        {"note", MetricValue("two cars")},
        {"complete", MetricValue(true)},
        {"best", MetricValue()},
    };
    return entry;
}

TEST(EntryCodecTest, RoundTrip) {
    CacheEntry entry = SampleEntry();
    auto encoded = EncodeEntry(entry);
    ASSERT_TRUE(encoded.ok()) << encoded.error();

    auto decoded = DecodeEntry(encoded.value());
    ASSERT_TRUE(decoded.ok()) << decoded.error();
    const CacheEntry& back = decoded.value();

    EXPECT_EQ(back.fingerprint, entry.fingerprint);
    EXPECT_EQ(back.metric_name, entry.metric_name);
    EXPECT_EQ(back.parameters, entry.parameters);
    EXPECT_EQ(back.created_at_ms, entry.created_at_ms);
    EXPECT_EQ(back.result, entry.result);
}

TEST(EntryCodecTest, IntegralDoubleKeepsKind) {
    CacheEntry entry = SampleEntry();
    entry.result.value = MetricValue(44.0);

    auto decoded = DecodeEntry(EncodeEntry(entry).value());
    ASSERT_TRUE(decoded.ok());
    EXPECT_TRUE(decoded.value().result.value.isDouble());
    EXPECT_DOUBLE_EQ(decoded.value().result.value.getDouble(), 44.0);
}

TEST(EntryCodecTest, NullValueAndNoMetadata) {
    CacheEntry entry = SampleEntry();
    entry.result.value = MetricValue();
    entry.result.metadata.reset();
    entry.result.constructor_name.reset();

    auto decoded = DecodeEntry(EncodeEntry(entry).value());
    ASSERT_TRUE(decoded.ok());
    EXPECT_TRUE(decoded.value().result.value.isNull());
    EXPECT_FALSE(decoded.value().result.metadata.has_value());
    EXPECT_FALSE(decoded.value().result.constructor_name.has_value());
}

TEST(EntryCodecTest, RejectsNonFiniteValues) {
    CacheEntry entry = SampleEntry();
    entry.result.value = MetricValue(std::numeric_limits<double>::quiet_NaN());
    EXPECT_FALSE(EncodeEntry(entry).ok());

    entry = SampleEntry();
    entry.result.metadata = Metadata{{"ratio", MetricValue(std::numeric_limits<double>::infinity())}};
    EXPECT_FALSE(EncodeEntry(entry).ok());
}

TEST(EntryCodecTest, RejectsMalformedJson) {
    EXPECT_FALSE(DecodeEntry("").ok());
    EXPECT_FALSE(DecodeEntry("{\"fingerprint\":").ok());
    EXPECT_FALSE(DecodeEntry("[1,2,3]").ok());
}

TEST(EntryCodecTest, RejectsMissingFields) {
    EXPECT_FALSE(DecodeEntry("{\"metric_name\":\"m\",\"parameters\":{},\"result\":{},\"created_at\":1}").ok());
    EXPECT_FALSE(DecodeEntry("{\"fingerprint\":\"f\",\"metric_name\":\"m\",\"parameters\":{},"
                             "\"result\":{\"metric_name\":\"m\",\"value\":1}}").ok());
    EXPECT_FALSE(DecodeEntry("{\"fingerprint\":\"f\",\"metric_name\":\"m\",\"parameters\":{},"
                             "\"result\":{\"value\":1},\"created_at\":1}").ok());
}

TEST(EntryCodecTest, RejectsMistypedResultFields) {
    auto decoded = DecodeEntry("{\"fingerprint\":\"f\",\"metric_name\":\"m\",\"parameters\":{},"
                               "\"result\":{\"metric_name\":\"m\",\"value\":1,\"driver_id\":\"one\"},"
                               "\"created_at\":1}");
    EXPECT_FALSE(decoded.ok());
}

TEST(EntryCodecTest, EncodeResultForDisplay) {
    MetricResult result("dnf_rate", MetricValue(12.5));
    result.driver_id = 1;
    auto compact = EncodeResult(result);
    ASSERT_TRUE(compact.ok());
    EXPECT_NE(compact.value().find("\"metric_name\":\"dnf_rate\""), std::string::npos);
    EXPECT_NE(compact.value().find("\"driver_id\":1"), std::string::npos);
    EXPECT_NE(compact.value().find("\"season\":null"), std::string::npos);

    auto pretty = EncodeResult(result, true);
    ASSERT_TRUE(pretty.ok());
    EXPECT_NE(pretty.value().find('\n'), std::string::npos);
}

} // namespace
} // namespace cache
} // namespace f1metrics
