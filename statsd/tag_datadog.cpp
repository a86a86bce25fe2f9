#include "tag_datadog.hpp"

namespace {
  const std::string DATADOG_TAG_PREFIX("|#");
  const std::string DATADOG_TAG_DIVIDER(",");
}

void statsd::tag_datadog::append_tag(std::string& buffer, const std::string& tag, TagMode& tag_mode) {
  switch (tag_mode) {
    case FIRST_TAG:
      // <buffer>|#tag
      buffer.append(DATADOG_TAG_PREFIX);
      tag_mode = APPEND_TAG;
      break;
    case APPEND_TAG:
      // <buffer>,tag
      buffer.append(DATADOG_TAG_DIVIDER);
      break;
  }
  buffer.append(tag);
}

void statsd::tag_datadog::append_tags(std::string& buffer,
    const tags_t& constant_tags, const tags_t& call_tags) {
  TagMode tag_mode = FIRST_TAG;
  for (const std::string& tag : constant_tags) {
    append_tag(buffer, tag, tag_mode);
  }
  for (const std::string& tag : call_tags) {
    append_tag(buffer, tag, tag_mode);
  }
}

std::string statsd::tag_datadog::tag_suffix(const tags_t& constant_tags, const tags_t& call_tags) {
  std::string suffix;
  append_tags(suffix, constant_tags, call_tags);
  return suffix;
}
