#include "send_command.hpp"

#include <glog/logging.h>

statsd::ClientConfig statsd::send_command::to_client_config(const params::Parameters& parameters) {
  ClientConfig config;
  config.host = params::get_str(parameters, params::DEST_HOST, params::DEST_HOST_DEFAULT);
  config.port = params::get_uint(parameters, params::DEST_PORT, params::DEST_PORT_DEFAULT);
  config.prefix = params::get_str(parameters, params::PREFIX, params::PREFIX_DEFAULT);
  config.constant_tags = params::get_list(parameters, params::CONSTANT_TAGS);
  if (params::get_bool(parameters, params::LOG_ERRORS, params::LOG_ERRORS_DEFAULT)) {
    config.error_handler = log_error_handler();
  }
  return config;
}

bool statsd::send_command::record_metric(StatsdClient& client, const params::Parameters& parameters) {
  const std::string type_str =
    params::get_str(parameters, params::METRIC_TYPE, params::METRIC_TYPE_DEFAULT);
  metric_type::Value type = params::to_metric_type(type_str);
  if (type == metric_type::UNKNOWN) {
    LOG(ERROR) << "Unknown " << params::METRIC_TYPE << ": " << type_str;
    return false;
  }

  const std::string name = params::get_str(parameters, params::METRIC_NAME, "");
  if (name.empty()) {
    LOG(ERROR) << "Missing required parameter: " << params::METRIC_NAME;
    return false;
  }

  MetricValue value = params::to_metric_value(params::METRIC_VALUE,
      params::get_str(parameters, params::METRIC_VALUE, params::METRIC_VALUE_DEFAULT));
  double sample_rate =
    params::get_double(parameters, params::SAMPLE_RATE, params::SAMPLE_RATE_DEFAULT);
  tags_t tags = params::get_list(parameters, params::TAGS);

  LOG(INFO) << "Recording " << type_str << " " << name << " (" << tags.size() << " tags)";
  switch (type) {
    case metric_type::COUNTER:
      client.count(name, value, sample_rate, tags);
      break;
    case metric_type::GAUGE:
      client.gauge(name, value, sample_rate, tags);
      break;
    case metric_type::TIMER:
      client.timer(name, value, sample_rate, tags);
      break;
    case metric_type::HISTOGRAM:
      client.histogram(name, value, sample_rate, tags);
      break;
    case metric_type::UNKNOWN:
      return false;
  }
  return true;
}
