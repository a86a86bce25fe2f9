#pragma once

#include <string>

#include "metric_point.hpp"

namespace statsd {
  /**
   * Utilities for adding Datadog-formatted tags to StatsD data.
   */
  class tag_datadog {
   public:
    enum TagMode {
      FIRST_TAG,
      APPEND_TAG
    };

    /**
     * Appends a tag to the end of the provided buffer, with a delimiter determined by "tag_mode",
     * and updates "tag_mode" to the mode to be used in any next append_tag() call.
     */
    static void append_tag(std::string& buffer, const std::string& tag, TagMode& tag_mode);

    /**
     * Appends the tag section for the provided tags to the end of the buffer: nothing if both lists
     * are empty, otherwise "|#" followed by the constant tags and then the call tags, each list in
     * its original order.
     */
    static void append_tags(std::string& buffer,
        const tags_t& constant_tags, const tags_t& call_tags);

    /**
     * Returns the tag section which append_tags() would produce.
     */
    static std::string tag_suffix(const tags_t& constant_tags, const tags_t& call_tags);

   private:
    /**
     * No instantiation allowed.
     */
    tag_datadog() { }
    tag_datadog(const tag_datadog&) { }
  };
}
