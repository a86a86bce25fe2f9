#pragma once

#include <exception>
#include <functional>
#include <string>
#include <stddef.h>

#include "metric_point.hpp"

namespace statsd {

  /**
   * Receives any error raised while sending or stopping. Called synchronously from the thread
   * which made the failed call.
   */
  typedef std::function<void(const std::exception&)> error_handler_t;

  /**
   * Returns a handler which discards all errors. This is the default.
   */
  error_handler_t noop_error_handler();

  /**
   * Returns a handler which logs each error with LOG(ERROR).
   */
  error_handler_t log_error_handler();

  /**
   * Settings for constructing a client. These are copied into the client, which never changes them
   * afterwards.
   */
  struct ClientConfig {
    const static size_t DEFAULT_PORT = 8125;

    ClientConfig();

    // Prepended to all metric names as "<prefix>.", unless empty.
    std::string prefix;

    // The StatsD daemon to send to. May be a hostname or a literal IP.
    std::string host;
    size_t port;

    // Added in front of the call tags of every metric.
    tags_t constant_tags;

    error_handler_t error_handler;
  };
}
