#pragma once

#include <stddef.h>
#include <string>
#include <utility>
#include <vector>

#include "metric_point.hpp"

namespace statsd {
  namespace params {
    /**
     * Types
     */

    // Ordered "key=value" settings. When a key is repeated, the first occurrence wins.
    typedef std::vector<std::pair<std::string, std::string>> Parameters;

    metric_type::Value to_metric_type(const std::string& param);

    /**
     * Destination settings
     */

    // The host to send to. May be a hostname or a literal IPv4/IPv6 address.
    const std::string DEST_HOST = "dest_host";
    const std::string DEST_HOST_DEFAULT = "localhost";

    // The port to send to.
    const std::string DEST_PORT = "dest_port";
    const size_t DEST_PORT_DEFAULT = 8125;

    /**
     * Client settings
     */

    // Prefix for all metric names, joined with a '.'. Empty for no prefix.
    const std::string PREFIX = "prefix";
    const std::string PREFIX_DEFAULT = "";

    // Comma-separated tags added to every metric, eg "env:prod,role:web".
    const std::string CONSTANT_TAGS = "constant_tags";

    // Whether send errors should be logged. Otherwise they're silently dropped.
    const std::string LOG_ERRORS = "log_errors";
    const bool LOG_ERRORS_DEFAULT = true;

    /**
     * Metric settings
     */

    // The kind of metric to send.
    const std::string METRIC_TYPE = "metric_type";
    const std::string METRIC_TYPE_COUNTER = "counter";
    const std::string METRIC_TYPE_GAUGE = "gauge";
    const std::string METRIC_TYPE_TIMER = "timer";
    const std::string METRIC_TYPE_HISTOGRAM = "histogram";
    const std::string METRIC_TYPE_DEFAULT = METRIC_TYPE_COUNTER;

    // The name of the metric. Required.
    const std::string METRIC_NAME = "metric_name";

    // The value to send. Values with a '.' or exponent are sent as floating point.
    const std::string METRIC_VALUE = "metric_value";
    const std::string METRIC_VALUE_DEFAULT = "1";

    // The sample rate to send with, in (0, 1].
    const std::string SAMPLE_RATE = "sample_rate";
    const double SAMPLE_RATE_DEFAULT = 1.0;

    // Comma-separated tags for this metric only.
    const std::string TAGS = "tags";

    /**
     * Converts "key=value" command line arguments into Parameters.
     */
    Parameters parse_args(int argc, const char* const argv[]);

    std::string get_str(const Parameters& parameters, const std::string& key, const std::string& default_value);
    size_t get_uint(const Parameters& parameters, const std::string& key, size_t default_value);
    double get_double(const Parameters& parameters, const std::string& key, double default_value);
    bool get_bool(const Parameters& parameters, const std::string& key, bool default_value);
    tags_t get_list(const Parameters& parameters, const std::string& key);

    /**
     * Converts a metric value string into an integer value, or a floating value if it contains a
     * '.' or exponent.
     */
    MetricValue to_metric_value(const std::string& key, const std::string& v);
  }
}
