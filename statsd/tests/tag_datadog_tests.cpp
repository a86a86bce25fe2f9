#include <algorithm>

#include <gtest/gtest.h>

#include "tag_datadog.hpp"

namespace {
  const statsd::tags_t NO_TAGS;

  statsd::tags_t make_tags(const std::string& key, size_t count) {
    statsd::tags_t tags;
    for (size_t i = 0; i < count; ++i) {
      tags.push_back(key + ":" + std::to_string(i));
    }
    return tags;
  }
}

TEST(TagDatadogTests, append_tag) {
  std::string buf("hello:1|c");
  statsd::tag_datadog::TagMode mode = statsd::tag_datadog::FIRST_TAG;

  statsd::tag_datadog::append_tag(buf, "tag1", mode);
  EXPECT_EQ("hello:1|c|#tag1", buf);
  EXPECT_EQ(statsd::tag_datadog::APPEND_TAG, mode);

  statsd::tag_datadog::append_tag(buf, "key:value", mode);
  EXPECT_EQ("hello:1|c|#tag1,key:value", buf);
  EXPECT_EQ(statsd::tag_datadog::APPEND_TAG, mode);

  // empty tags aren't skipped
  statsd::tag_datadog::append_tag(buf, "", mode);
  EXPECT_EQ("hello:1|c|#tag1,key:value,", buf);
}

TEST(TagDatadogTests, no_tags_no_suffix) {
  EXPECT_EQ("", statsd::tag_datadog::tag_suffix(NO_TAGS, NO_TAGS));

  std::string buf("hello:1|c");
  statsd::tag_datadog::append_tags(buf, NO_TAGS, NO_TAGS);
  EXPECT_EQ("hello:1|c", buf);
}

TEST(TagDatadogTests, constant_tags_only) {
  statsd::tags_t constant;
  constant.push_back("env:prod");
  EXPECT_EQ("|#env:prod", statsd::tag_datadog::tag_suffix(constant, NO_TAGS));
  constant.push_back("role:web");
  EXPECT_EQ("|#env:prod,role:web", statsd::tag_datadog::tag_suffix(constant, NO_TAGS));
}

TEST(TagDatadogTests, call_tags_only) {
  statsd::tags_t call;
  call.push_back("region:us");
  EXPECT_EQ("|#region:us", statsd::tag_datadog::tag_suffix(NO_TAGS, call));
  call.push_back("az:1b");
  EXPECT_EQ("|#region:us,az:1b", statsd::tag_datadog::tag_suffix(NO_TAGS, call));
}

TEST(TagDatadogTests, constant_then_call_tags_in_forward_order) {
  statsd::tags_t constant, call;
  constant.push_back("a");
  constant.push_back("b");
  call.push_back("c");
  call.push_back("d");
  // Each list keeps the order it was given in: not "|#b,a,d,c".
  EXPECT_EQ("|#a,b,c,d", statsd::tag_datadog::tag_suffix(constant, call));
}

TEST(TagDatadogTests, separator_count) {
  for (size_t c = 0; c < 5; ++c) {
    for (size_t t = 0; t < 5; ++t) {
      std::string suffix =
        statsd::tag_datadog::tag_suffix(make_tags("const", c), make_tags("call", t));
      if (c + t == 0) {
        EXPECT_EQ("", suffix);
        continue;
      }
      EXPECT_EQ(0, suffix.find("|#")) << suffix;
      EXPECT_EQ(c + t - 1, (size_t) std::count(suffix.begin(), suffix.end(), ',')) << suffix;
      EXPECT_NE(',', suffix[suffix.size() - 1]) << suffix;
    }
  }
}

TEST(TagDatadogTests, tags_not_escaped) {
  statsd::tags_t call;
  call.push_back("a,b");
  call.push_back("c|d");
  EXPECT_EQ("|#a,b,c|d", statsd::tag_datadog::tag_suffix(NO_TAGS, call));
}
