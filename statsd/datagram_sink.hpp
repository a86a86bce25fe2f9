#pragma once

#include <memory>
#include <stddef.h>

namespace statsd {
  /**
   * A DatagramSink passes each provided buffer to a remote endpoint as a single datagram.
   *
   * This interface class is implemented in udp_sender.*. The interface is kept separate from the
   * implementation to allow for easier mockery.
   */
  class DatagramSink {
   public:
    virtual ~DatagramSink() { }

    /**
     * Sends the provided data as one datagram. Throws boost::system::system_error on failure.
     */
    virtual void send(const char* bytes, size_t size) = 0;

    /**
     * Releases the underlying socket. Throws boost::system::system_error on failure.
     */
    virtual void close() = 0;
  };

  typedef std::shared_ptr<DatagramSink> datagram_sink_ptr_t;
}
