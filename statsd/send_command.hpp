#pragma once

#include "client_config.hpp"
#include "params.hpp"
#include "statsd_client.hpp"

namespace statsd {
  /**
   * Glue between "key=value" parameters and a client, for sending one-off metrics from the
   * command line.
   */
  namespace send_command {
    /**
     * Returns the client configuration described by the dest_host, dest_port, prefix,
     * constant_tags and log_errors parameters.
     */
    ClientConfig to_client_config(const params::Parameters& parameters);

    /**
     * Records the metric described by the metric_type, metric_name, metric_value, sample_rate and
     * tags parameters. Returns false without recording anything if the type or name is invalid.
     */
    bool record_metric(StatsdClient& client, const params::Parameters& parameters);
  }
}
