#include <stdio.h>

#include <glog/logging.h>

#include "blocking_statsd_client.hpp"
#include "errors.hpp"
#include "send_command.hpp"

/**
 * Sends a single metric to a StatsD daemon, eg:
 *   statsd_send dest_host=127.0.0.1 prefix=app metric_type=gauge metric_name=load metric_value=0.5
 */
int main(int argc, char* argv[]) {
  ::google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = 1;

  if (argc < 2) {
    fprintf(stderr,
        "Usage: %s key=value [key=value ...]\n"
        "Keys: %s %s %s %s %s\n"
        "      %s %s %s %s %s\n", argv[0],
        statsd::params::DEST_HOST.c_str(), statsd::params::DEST_PORT.c_str(),
        statsd::params::PREFIX.c_str(), statsd::params::CONSTANT_TAGS.c_str(),
        statsd::params::LOG_ERRORS.c_str(),
        statsd::params::METRIC_TYPE.c_str(), statsd::params::METRIC_NAME.c_str(),
        statsd::params::METRIC_VALUE.c_str(), statsd::params::SAMPLE_RATE.c_str(),
        statsd::params::TAGS.c_str());
    return -1;
  }

  statsd::params::Parameters parameters = statsd::params::parse_args(argc - 1, argv + 1);
  statsd::ClientConfig config = statsd::send_command::to_client_config(parameters);

  statsd::statsd_client_ptr_t client;
  try {
    client = statsd::BlockingStatsdClient::create(config);
  } catch (const statsd::ClientInitError& e) {
    LOG(ERROR) << "Unable to create client for " << config.host << ":" << config.port
               << ": " << e.what();
    return 1;
  }

  bool recorded = statsd::send_command::record_metric(*client, parameters);
  client->stop();
  return recorded ? 0 : 1;
}
