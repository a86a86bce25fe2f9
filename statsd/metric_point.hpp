#pragma once

#include <stdint.h>
#include <limits>
#include <string>
#include <vector>

namespace statsd {

  typedef std::vector<std::string> tags_t;

  namespace metric_type {
    enum Value { UNKNOWN, COUNTER, GAUGE, TIMER, HISTOGRAM };
  }

  /**
   * A metric value, which is either an integer or a floating point number. The two are formatted
   * differently on the wire.
   *
   * Every builtin arithmetic type converts implicitly, so that eg count("x", 1) and gauge("x", 0.5)
   * pick the right representation without ambiguous overloads. Unsigned values above INT64_MAX are
   * clamped to INT64_MAX.
   */
  class MetricValue {
   public:
    MetricValue(int v) : integer(true), int_val(v), float_val(0) { }
    MetricValue(unsigned int v) : integer(true), int_val(v), float_val(0) { }
    MetricValue(long v) : integer(true), int_val(v), float_val(0) { }
    MetricValue(unsigned long v) : integer(true), int_val(clamp(v)), float_val(0) { }
    MetricValue(long long v) : integer(true), int_val(v), float_val(0) { }
    MetricValue(unsigned long long v) : integer(true), int_val(clamp(v)), float_val(0) { }
    MetricValue(float v) : integer(false), int_val(0), float_val(v) { }
    MetricValue(double v) : integer(false), int_val(0), float_val(v) { }

    bool is_integer() const {
      return integer;
    }
    int64_t int_value() const {
      return int_val;
    }
    double float_value() const {
      return float_val;
    }

    bool operator==(const MetricValue& other) const {
      return integer == other.integer && int_val == other.int_val && float_val == other.float_val;
    }

   private:
    static int64_t clamp(unsigned long long v) {
      const unsigned long long max = std::numeric_limits<int64_t>::max();
      return v > max ? std::numeric_limits<int64_t>::max() : (int64_t) v;
    }

    bool integer;
    int64_t int_val;
    double float_val;
  };

  /**
   * A single recorded measurement. Only lives for the duration of one encode+send.
   */
  class MetricPoint {
   public:
    MetricPoint(const std::string& name, metric_type::Value type, MetricValue value,
        double sample_rate, const tags_t& tags)
      : name(name), type(type), value(value), sample_rate(sample_rate), tags(tags) { }

    bool operator==(const MetricPoint& other) const {
      return name == other.name
        && type == other.type
        && value == other.value
        && sample_rate == other.sample_rate
        && tags == other.tags;
    }

    const std::string name;
    const metric_type::Value type;
    const MetricValue value;
    const double sample_rate;
    const tags_t tags;
  };
}
