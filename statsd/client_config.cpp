#include "client_config.hpp"

#include <glog/logging.h>

namespace {
  const std::string DEFAULT_HOST("localhost");

  void discard_error(const std::exception& /*e*/) { }

  void log_error(const std::exception& e) {
    LOG(ERROR) << "StatsD client error: " << e.what();
  }
}

const size_t statsd::ClientConfig::DEFAULT_PORT;

statsd::error_handler_t statsd::noop_error_handler() {
  return &discard_error;
}

statsd::error_handler_t statsd::log_error_handler() {
  return &log_error;
}

statsd::ClientConfig::ClientConfig()
  : prefix(),
    host(DEFAULT_HOST),
    port(DEFAULT_PORT),
    constant_tags(),
    error_handler(noop_error_handler()) { }
