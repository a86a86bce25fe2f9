#include "statsd_client.hpp"

namespace {
  const double UNSAMPLED = 1.0;
}

void statsd::StatsdClient::count(const std::string& aspect, MetricValue delta, const tags_t& tags) {
  count(aspect, delta, UNSAMPLED, tags);
}

void statsd::StatsdClient::count(const std::string& aspect, MetricValue delta, double sample_rate,
    const tags_t& tags) {
  record(MetricPoint(aspect, metric_type::COUNTER, delta, sample_rate, tags));
}

void statsd::StatsdClient::increment(const std::string& aspect, const tags_t& tags) {
  count(aspect, 1, UNSAMPLED, tags);
}

void statsd::StatsdClient::increment(const std::string& aspect, double sample_rate,
    const tags_t& tags) {
  count(aspect, 1, sample_rate, tags);
}

void statsd::StatsdClient::decrement(const std::string& aspect, const tags_t& tags) {
  count(aspect, -1, UNSAMPLED, tags);
}

void statsd::StatsdClient::decrement(const std::string& aspect, double sample_rate,
    const tags_t& tags) {
  count(aspect, -1, sample_rate, tags);
}

void statsd::StatsdClient::gauge(const std::string& aspect, MetricValue value, const tags_t& tags) {
  gauge(aspect, value, UNSAMPLED, tags);
}

void statsd::StatsdClient::gauge(const std::string& aspect, MetricValue value, double sample_rate,
    const tags_t& tags) {
  record(MetricPoint(aspect, metric_type::GAUGE, value, sample_rate, tags));
}

void statsd::StatsdClient::timer(const std::string& aspect, MetricValue time_ms, const tags_t& tags) {
  timer(aspect, time_ms, UNSAMPLED, tags);
}

void statsd::StatsdClient::timer(const std::string& aspect, MetricValue time_ms, double sample_rate,
    const tags_t& tags) {
  record(MetricPoint(aspect, metric_type::TIMER, time_ms, sample_rate, tags));
}

void statsd::StatsdClient::histogram(const std::string& aspect, MetricValue value,
    const tags_t& tags) {
  histogram(aspect, value, UNSAMPLED, tags);
}

void statsd::StatsdClient::histogram(const std::string& aspect, MetricValue value,
    double sample_rate, const tags_t& tags) {
  record(MetricPoint(aspect, metric_type::HISTOGRAM, value, sample_rate, tags));
}
