#include "blocking_statsd_client.hpp"

#include <boost/asio.hpp>
#include <glog/logging.h>

#include "errors.hpp"
#include "statsd_encoder.hpp"
#include "udp_sender.hpp"

statsd::statsd_client_ptr_t statsd::BlockingStatsdClient::create(const ClientConfig& config) {
  std::shared_ptr<boost::asio::io_service> io_service(new boost::asio::io_service);
  udp_sender_ptr_t sender(new UDPSender(io_service, config.host, config.port));
  try {
    sender->open();
  } catch (const ClientInitError& e) {
    LOG(ERROR) << "Failed to start StatsD client: " << e.what();
    throw;
  } catch (const std::exception& e) {
    LOG(ERROR) << "Failed to start StatsD client: " << e.what();
    throw ClientInitError(std::string("Failed to start StatsD client: ") + e.what());
  }
  return statsd_client_ptr_t(new BlockingStatsdClient(config, sender));
}

statsd::BlockingStatsdClient::BlockingStatsdClient(const ClientConfig& config,
    datagram_sink_ptr_t sink,
    sampler_ptr_t sampler)
  : prefix(statsd_encoder::normalize_prefix(config.prefix)),
    constant_tags(config.constant_tags),
    error_handler(config.error_handler ? config.error_handler : noop_error_handler()),
    sink(sink),
    sampler(sampler),
    stopped(false) {
  LOG(INFO) << "BlockingStatsdClient constructed with prefix[" << prefix << "] "
            << "and " << constant_tags.size() << " constant tags";
}

statsd::BlockingStatsdClient::~BlockingStatsdClient() {
  if (!stopped) {
    try {
      stop();
    } catch (const std::exception& e) {
      // thrown by the error handler itself
      LOG(ERROR) << "Error handler failed while stopping BlockingStatsdClient: " << e.what();
    }
  }
}

void statsd::BlockingStatsdClient::stop() {
  if (stopped.exchange(true)) {
    LOG(WARNING) << "BlockingStatsdClient already stopped, ignoring stop()";
    return;
  }
  LOG(INFO) << "Stopping BlockingStatsdClient";
  try {
    sink->close();
  } catch (const std::exception& e) {
    error_handler(e);
  }
}

void statsd::BlockingStatsdClient::record(const MetricPoint& point) {
  if (!sampler->should_send(point.sample_rate)) {
    return;
  }
  if (stopped) {
    error_handler(ClientError("Client stopped, dropping metric: " + point.name));
    return;
  }
  try {
    const std::string line = statsd_encoder::encode(prefix, point, constant_tags);
    sink->send(line.data(), line.size());
  } catch (const std::exception& e) {
    error_handler(e);
  }
}
