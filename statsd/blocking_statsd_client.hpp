#pragma once

#include <atomic>

#include "client_config.hpp"
#include "datagram_sink.hpp"
#include "sampler.hpp"
#include "statsd_client.hpp"

namespace statsd {

  /**
   * A StatsdClient which sends each metric as it's recorded, as a single UDP datagram, from the
   * calling thread.
   *
   * Upon construction the client is connected to the configured host and port. Once constructed,
   * errors while sending or stopping are passed to the configured error handler and then consumed,
   * so that failures in metrics never affect the instrumented code. Recording after stop() is
   * reported to the error handler as a ClientError.
   *
   * The client holds no mutable state besides its stopped flag, so recording methods may be called
   * concurrently. stop() must not race with in-flight recording calls.
   */
  class BlockingStatsdClient : public StatsdClient {
   public:
    /**
     * Creates a client connected to the host and port in 'config'. Throws ClientInitError if the
     * connection can't be established.
     */
    static statsd_client_ptr_t create(const ClientConfig& config);

    /**
     * Use create(). This is meant for access by tests.
     */
    BlockingStatsdClient(const ClientConfig& config,
        datagram_sink_ptr_t sink,
        sampler_ptr_t sampler = sampler_ptr_t(new Sampler));

    /**
     * Stops the client if stop() wasn't already called. If the error handler throws while
     * handling a close failure, the exception is logged rather than propagated.
     */
    virtual ~BlockingStatsdClient();

    /**
     * Closes the socket. Only the first call has any effect: later calls are logged and ignored.
     */
    void stop();

   protected:
    void record(const MetricPoint& point);

   private:
    const std::string prefix;
    const tags_t constant_tags;
    const error_handler_t error_handler;

    const datagram_sink_ptr_t sink;
    const sampler_ptr_t sampler;
    std::atomic_bool stopped;
  };
}
