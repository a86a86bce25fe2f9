#include "params.hpp"

#include <errno.h>
#include <stdlib.h>

#include <glog/logging.h>

namespace {
  const char KEY_VALUE_SEPARATOR = '=';
  const char LIST_SEPARATOR = ',';

  size_t to_uint(const std::string& key, const std::string& v) {
    char* invalid = NULL;
    long val = strtol(v.c_str(), &invalid, 10);
    if (v.empty() || (invalid != NULL && invalid[0] != '\0')) {
      LOG(FATAL) << "Invalid config value (must be int): " << key << "=" << v;
    }
    if (val < 0) {
      LOG(FATAL) << "Invalid config value (must be non-negative): " << key << "=" << v;
    }
    return (size_t) val;
  }

  double to_double(const std::string& key, const std::string& v) {
    char* invalid = NULL;
    double val = strtod(v.c_str(), &invalid);
    if (v.empty() || (invalid != NULL && invalid[0] != '\0')) {
      LOG(FATAL) << "Invalid config value (must be a number): " << key << "=" << v;
    }
    return val;
  }

  bool to_bool(const std::string& key, const std::string& v) {
    if (v.empty()) {
      LOG(FATAL) << "Invalid config value (must be non-empty): " << key << " = " << v;
      return false;
    }
    switch (v[0]) {
      case 't':
      case 'y':
      case '1':
        return true;
      case 'f':
      case 'n':
      case '0':
        return false;
      default: {
        LOG(FATAL) << "Invalid config value (must start with 't','y','1' (true) or 'f','n','0' (false)): " << key << " = " << v;
        return false;
      }
    }
  }

  const std::string* find(
      const statsd::params::Parameters& parameters, const std::string& key) {
    for (const std::pair<std::string, std::string>& parameter : parameters) {
      if (parameter.first == key) {
        return &parameter.second;
      }
    }
    return NULL;
  }
}

statsd::metric_type::Value statsd::params::to_metric_type(const std::string& param) {
  if (param == METRIC_TYPE_COUNTER || param == "c") {
    return metric_type::COUNTER;
  } else if (param == METRIC_TYPE_GAUGE || param == "g") {
    return metric_type::GAUGE;
  } else if (param == METRIC_TYPE_TIMER || param == "ms") {
    return metric_type::TIMER;
  } else if (param == METRIC_TYPE_HISTOGRAM || param == "h") {
    return metric_type::HISTOGRAM;
  }
  return metric_type::UNKNOWN;
}

statsd::params::Parameters statsd::params::parse_args(int argc, const char* const argv[]) {
  Parameters parameters;
  for (int i = 0; i < argc; ++i) {
    const std::string arg(argv[i]);
    size_t sep = arg.find(KEY_VALUE_SEPARATOR);
    if (sep == std::string::npos || sep == 0) {
      LOG(FATAL) << "Invalid argument (must be key=value): " << arg;
    }
    parameters.push_back(std::make_pair(arg.substr(0, sep), arg.substr(sep + 1)));
  }
  return parameters;
}

std::string statsd::params::get_str(
    const Parameters& parameters, const std::string& key, const std::string& default_value) {
  const std::string* v = find(parameters, key);
  if (v == NULL) {
    return default_value;
  }
  if (v->empty()) {
    LOG(FATAL) << "Invalid config value (must be non-empty): " << key << " = " << *v;
  }
  return *v;
}

size_t statsd::params::get_uint(
    const Parameters& parameters, const std::string& key, size_t default_value) {
  const std::string* v = find(parameters, key);
  if (v == NULL) {
    return default_value;
  }
  return to_uint(key, *v);
}

double statsd::params::get_double(
    const Parameters& parameters, const std::string& key, double default_value) {
  const std::string* v = find(parameters, key);
  if (v == NULL) {
    return default_value;
  }
  return to_double(key, *v);
}

bool statsd::params::get_bool(
    const Parameters& parameters, const std::string& key, bool default_value) {
  const std::string* v = find(parameters, key);
  if (v == NULL) {
    return default_value;
  }
  return to_bool(key, *v);
}

statsd::tags_t statsd::params::get_list(const Parameters& parameters, const std::string& key) {
  tags_t list;
  const std::string* v = find(parameters, key);
  if (v == NULL) {
    return list;
  }
  size_t start = 0;
  while (start <= v->size()) {
    size_t end = v->find(LIST_SEPARATOR, start);
    if (end == std::string::npos) {
      end = v->size();
    }
    if (end > start) {
      // skip empty entries, eg "a,,b" or a trailing ','
      list.push_back(v->substr(start, end - start));
    }
    start = end + 1;
  }
  return list;
}

statsd::MetricValue statsd::params::to_metric_value(const std::string& key, const std::string& v) {
  if (v.find_first_of(".eE") != std::string::npos) {
    return MetricValue(to_double(key, v));
  }
  char* invalid = NULL;
  errno = 0;
  long long val = strtoll(v.c_str(), &invalid, 10);
  if (v.empty() || (invalid != NULL && invalid[0] != '\0') || errno == ERANGE) {
    LOG(FATAL) << "Invalid config value (must be a number): " << key << "=" << v;
  }
  return MetricValue(val);
}
