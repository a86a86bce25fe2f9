#pragma once

#include <string>

#include "metric_point.hpp"

namespace statsd {
  /**
   * Formats metric points into single StatsD protocol lines:
   *
   *   <prefix><name>:<value>|<typecode>[|@<sample_rate>][|#<tag>,<tag>,...]
   *
   * Encoding doesn't validate anything: names or tags containing ':', '|' or ',' produce corrupt
   * lines.
   */
  class statsd_encoder {
   public:
    /**
     * Number of fractional digits used for floating point values and sample rates.
     */
    const static int FLOAT_PRECISION = 6;

    /**
     * Returns the prefix to be placed in front of metric names: "<prefix>." or "" if the
     * provided prefix is empty.
     */
    static std::string normalize_prefix(const std::string& prefix);

    /**
     * Returns the protocol type code for the provided type ("c", "g", "ms", "h").
     */
    static const char* type_code(metric_type::Value type);

    /**
     * Returns 'value' with exactly 'places' fractional digits. Rounding is half-even and applies to
     * the shortest decimal form which reads back as 'value', so that eg 1.0000005 is treated as a
     * tie even though its nearest double is slightly above it. Rounding to zero never produces a
     * '-' sign.
     */
    static std::string to_fixed(double value, int places);

    /**
     * Returns the wire representation of a value: integers as-is, floats rounded and printed with
     * FLOAT_PRECISION fractional digits.
     */
    static std::string format_value(const MetricValue& value);

    /**
     * Returns the full line for 'point'. 'prefix' must have passed through normalize_prefix().
     */
    static std::string encode(const std::string& prefix, const MetricPoint& point,
        const tags_t& constant_tags);

   private:
    /**
     * No instantiation allowed.
     */
    statsd_encoder() { }
    statsd_encoder(const statsd_encoder&) { }
  };
}
