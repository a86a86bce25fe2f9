#include <stdint.h>
#include <limits>

#include <gtest/gtest.h>

#include "statsd_encoder.hpp"

using statsd::statsd_encoder;

namespace {
  const statsd::tags_t NO_TAGS;

  statsd::MetricPoint point(const std::string& name, statsd::metric_type::Value type,
      statsd::MetricValue value, double sample_rate = 1.0,
      const statsd::tags_t& tags = statsd::tags_t()) {
    return statsd::MetricPoint(name, type, value, sample_rate, tags);
  }

  size_t count_substr(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
      ++count;
    }
    return count;
  }
}

TEST(StatsdEncoderTests, normalize_prefix) {
  EXPECT_EQ("", statsd_encoder::normalize_prefix(""));
  EXPECT_EQ("app.", statsd_encoder::normalize_prefix("app"));
  EXPECT_EQ("app.web.", statsd_encoder::normalize_prefix("app.web"));
}

TEST(StatsdEncoderTests, type_codes) {
  EXPECT_STREQ("c", statsd_encoder::type_code(statsd::metric_type::COUNTER));
  EXPECT_STREQ("g", statsd_encoder::type_code(statsd::metric_type::GAUGE));
  EXPECT_STREQ("ms", statsd_encoder::type_code(statsd::metric_type::TIMER));
  EXPECT_STREQ("h", statsd_encoder::type_code(statsd::metric_type::HISTOGRAM));
}

TEST(StatsdEncoderTests, to_fixed_half_even) {
  EXPECT_EQ("0", statsd_encoder::to_fixed(0.5, 0));
  EXPECT_EQ("2", statsd_encoder::to_fixed(1.5, 0));
  EXPECT_EQ("2", statsd_encoder::to_fixed(2.5, 0));
  EXPECT_EQ("4", statsd_encoder::to_fixed(3.5, 0));
  EXPECT_EQ("-2", statsd_encoder::to_fixed(-2.5, 0));
  EXPECT_EQ("-4", statsd_encoder::to_fixed(-3.5, 0));
  EXPECT_EQ("3", statsd_encoder::to_fixed(2.6, 0));
  EXPECT_EQ("2", statsd_encoder::to_fixed(2.4, 0));
  EXPECT_EQ("0.2", statsd_encoder::to_fixed(0.25, 1));
  EXPECT_EQ("0.8", statsd_encoder::to_fixed(0.75, 1));
  EXPECT_EQ("0.333333", statsd_encoder::to_fixed(1.0 / 3, 6));
  EXPECT_EQ("0.666667", statsd_encoder::to_fixed(2.0 / 3, 6));
  EXPECT_EQ("10.000000", statsd_encoder::to_fixed(9.9999995, 6));
  EXPECT_EQ("100", statsd_encoder::to_fixed(99.5, 0));
}

TEST(StatsdEncoderTests, to_fixed_decimal_ties) {
  // The doubles nearest to these are slightly above or below the written value, which must not
  // affect how the tie is broken.
  EXPECT_EQ("1.000000", statsd_encoder::to_fixed(1.0000005, 6));
  EXPECT_EQ("2.000000", statsd_encoder::to_fixed(2.0000005, 6));
  EXPECT_EQ("1000.000000", statsd_encoder::to_fixed(1000.0000005, 6));
  EXPECT_EQ("0.000000", statsd_encoder::to_fixed(0.0000005, 6));
  EXPECT_EQ("0.000002", statsd_encoder::to_fixed(0.0000015, 6));
  EXPECT_EQ("1.000002", statsd_encoder::to_fixed(1.0000015, 6));
  EXPECT_EQ("-1.000000", statsd_encoder::to_fixed(-1.0000005, 6));
  // not a tie: anything past the '5' rounds up
  EXPECT_EQ("1.000001", statsd_encoder::to_fixed(1.00000051, 6));
}

TEST(StatsdEncoderTests, to_fixed_extremes) {
  EXPECT_EQ("0.000000", statsd_encoder::to_fixed(0., 6));
  EXPECT_EQ("0.000000", statsd_encoder::to_fixed(-0., 6));
  EXPECT_EQ("0.000000", statsd_encoder::to_fixed(1e-300, 6));
  EXPECT_EQ("0.000000", statsd_encoder::to_fixed(-1e-300, 6));
  EXPECT_EQ("123456789012.000000", statsd_encoder::to_fixed(123456789012., 6));

  std::string huge = statsd_encoder::to_fixed(1e300, 6);
  ASSERT_EQ(301 + 7, huge.size());
  EXPECT_EQ("1" + std::string(300, '0') + ".000000", huge);

  EXPECT_EQ("inf", statsd_encoder::to_fixed(std::numeric_limits<double>::infinity(), 6));
  EXPECT_EQ("-inf", statsd_encoder::to_fixed(-std::numeric_limits<double>::infinity(), 6));
}

TEST(StatsdEncoderTests, format_value) {
  EXPECT_EQ("0", statsd_encoder::format_value(0));
  EXPECT_EQ("42", statsd_encoder::format_value(42));
  EXPECT_EQ("-42", statsd_encoder::format_value(-42));
  EXPECT_EQ("9223372036854775807",
      statsd_encoder::format_value(std::numeric_limits<int64_t>::max()));
  EXPECT_EQ("-9223372036854775808",
      statsd_encoder::format_value(std::numeric_limits<int64_t>::min()));
  // unsigned values past the signed range are clamped rather than wrapped
  EXPECT_EQ("9223372036854775807",
      statsd_encoder::format_value(std::numeric_limits<uint64_t>::max()));
  EXPECT_EQ("9223372036854775807",
      statsd_encoder::format_value((unsigned long long) std::numeric_limits<int64_t>::max() + 1));
  EXPECT_EQ("4294967295", statsd_encoder::format_value(std::numeric_limits<uint32_t>::max()));

  EXPECT_EQ("0.000000", statsd_encoder::format_value(0.));
  EXPECT_EQ("42.000000", statsd_encoder::format_value(42.));
  EXPECT_EQ("0.333333", statsd_encoder::format_value(1.0 / 3));
  EXPECT_EQ("-0.333333", statsd_encoder::format_value(-1.0 / 3));
  EXPECT_EQ("0.666667", statsd_encoder::format_value(2.0 / 3));
  EXPECT_EQ("1.500000", statsd_encoder::format_value(1.5f));
  EXPECT_EQ("0.000001", statsd_encoder::format_value(0.000001));
  // rounds to zero: no "-0.000000"
  EXPECT_EQ("0.000000", statsd_encoder::format_value(-0.0000001));
  EXPECT_EQ("0.000000", statsd_encoder::format_value(-0.));
  EXPECT_EQ("1.000000", statsd_encoder::format_value(1.0000005));
  EXPECT_EQ("0.100000", statsd_encoder::format_value(0.1f));
}

TEST(StatsdEncoderTests, encode_counter) {
  EXPECT_EQ("x:1|c", statsd_encoder::encode("", point("x", statsd::metric_type::COUNTER, 1), NO_TAGS));
  EXPECT_EQ("x:-1|c", statsd_encoder::encode("", point("x", statsd::metric_type::COUNTER, -1), NO_TAGS));
  EXPECT_EQ("x:1.250000|c",
      statsd_encoder::encode("", point("x", statsd::metric_type::COUNTER, 1.25), NO_TAGS));
}

TEST(StatsdEncoderTests, encode_types) {
  EXPECT_EQ("g:3|g", statsd_encoder::encode("", point("g", statsd::metric_type::GAUGE, 3), NO_TAGS));
  EXPECT_EQ("g:0.333333|g",
      statsd_encoder::encode("", point("g", statsd::metric_type::GAUGE, 1.0 / 3), NO_TAGS));
  EXPECT_EQ("t:250|ms", statsd_encoder::encode("", point("t", statsd::metric_type::TIMER, 250), NO_TAGS));
  EXPECT_EQ("t:2.500000|ms",
      statsd_encoder::encode("", point("t", statsd::metric_type::TIMER, 2.5), NO_TAGS));
  EXPECT_EQ("h:7|h", statsd_encoder::encode("", point("h", statsd::metric_type::HISTOGRAM, 7), NO_TAGS));
  EXPECT_EQ("h:0.100000|h",
      statsd_encoder::encode("", point("h", statsd::metric_type::HISTOGRAM, 0.1), NO_TAGS));
}

TEST(StatsdEncoderTests, encode_sample_rate) {
  std::string unsampled =
    statsd_encoder::encode("", point("x", statsd::metric_type::COUNTER, 1, 1.0), NO_TAGS);
  EXPECT_EQ("x:1|c", unsampled);
  EXPECT_EQ(0, count_substr(unsampled, "|@"));

  std::string sampled =
    statsd_encoder::encode("", point("x", statsd::metric_type::COUNTER, 1, 0.5), NO_TAGS);
  EXPECT_EQ("x:1|c|@0.500000", sampled);
  EXPECT_EQ(1, count_substr(sampled, "|@"));

  EXPECT_EQ("x:1|c|@0.333333",
      statsd_encoder::encode("", point("x", statsd::metric_type::COUNTER, 1, 1.0 / 3), NO_TAGS));
  EXPECT_EQ("x:1|c|@0.001000",
      statsd_encoder::encode("", point("x", statsd::metric_type::COUNTER, 1, 0.001), NO_TAGS));
}

TEST(StatsdEncoderTests, encode_prefix_and_tags) {
  statsd::tags_t constant, call;
  constant.push_back("env:prod");
  call.push_back("region:us");

  EXPECT_EQ("app.hits:1|c|#env:prod,region:us",
      statsd_encoder::encode(statsd_encoder::normalize_prefix("app"),
          point("hits", statsd::metric_type::COUNTER, 1, 1.0, call), constant));
  EXPECT_EQ("app.hits:1|c|#env:prod",
      statsd_encoder::encode(statsd_encoder::normalize_prefix("app"),
          point("hits", statsd::metric_type::COUNTER, 1), constant));
  EXPECT_EQ("hits:1|c|#region:us",
      statsd_encoder::encode("", point("hits", statsd::metric_type::COUNTER, 1, 1.0, call), NO_TAGS));
}

TEST(StatsdEncoderTests, encode_all_sections) {
  statsd::tags_t constant, call;
  constant.push_back("env:prod");
  call.push_back("a:b");
  call.push_back("c:d");

  // sample rate comes before the tag section
  EXPECT_EQ("app.req.time:0.125000|ms|@0.100000|#env:prod,a:b,c:d",
      statsd_encoder::encode("app.",
          point("req.time", statsd::metric_type::TIMER, 0.125, 0.1, call), constant));
}
