#pragma once

#include <memory>
#include <string>

#include "metric_point.hpp"

namespace statsd {

  /**
   * The set of operations offered by a StatsD client.
   *
   * Each recording method has an unsampled form and a form taking a sample rate in (0, 1], and
   * accepts integer or floating point values. All of them funnel into record(), which is the only
   * recording hook implementations need to provide.
   *
   * Recording methods never throw: failures are reported through the client's error handler.
   */
  class StatsdClient {
   public:
    virtual ~StatsdClient() { }

    /**
     * Adjusts the named counter by 'delta'.
     */
    void count(const std::string& aspect, MetricValue delta, const tags_t& tags = tags_t());
    void count(const std::string& aspect, MetricValue delta, double sample_rate,
        const tags_t& tags = tags_t());

    /**
     * Adjusts the named counter by one.
     */
    void increment(const std::string& aspect, const tags_t& tags = tags_t());
    void increment(const std::string& aspect, double sample_rate, const tags_t& tags = tags_t());

    /**
     * Adjusts the named counter by minus one.
     */
    void decrement(const std::string& aspect, const tags_t& tags = tags_t());
    void decrement(const std::string& aspect, double sample_rate, const tags_t& tags = tags_t());

    /**
     * Records the latest fixed value of the named gauge.
     */
    void gauge(const std::string& aspect, MetricValue value, const tags_t& tags = tags_t());
    void gauge(const std::string& aspect, MetricValue value, double sample_rate,
        const tags_t& tags = tags_t());

    /**
     * Records an execution time in milliseconds for the named operation.
     */
    void timer(const std::string& aspect, MetricValue time_ms, const tags_t& tags = tags_t());
    void timer(const std::string& aspect, MetricValue time_ms, double sample_rate,
        const tags_t& tags = tags_t());

    /**
     * Records a value to be tracked with average, maximum and percentiles.
     */
    void histogram(const std::string& aspect, MetricValue value, const tags_t& tags = tags_t());
    void histogram(const std::string& aspect, MetricValue value, double sample_rate,
        const tags_t& tags = tags_t());

    /**
     * Cleanly shuts down the client, releasing its socket.
     */
    virtual void stop() = 0;

   protected:
    /**
     * Samples, encodes and sends a single point.
     */
    virtual void record(const MetricPoint& point) = 0;
  };

  typedef std::shared_ptr<StatsdClient> statsd_client_ptr_t;
}
