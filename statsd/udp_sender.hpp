#pragma once

#include <atomic>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "datagram_sink.hpp"

namespace statsd {

  /**
   * A UDPSender is the underlying implementation of getting data to a UDP endpoint. The
   * destination is resolved once in open(), after which the socket stays connected to that single
   * address until close(). There is no re-resolution or reconnection.
   *
   * send() may be called concurrently from several threads. close() must not be called while
   * sends are in flight.
   */
  class UDPSender : public DatagramSink {
   public:
    /**
     * Creates a UDPSender which uses the provided io_service for socket operations. All operations
     * are synchronous, so the io_service doesn't need to be run().
     *
     * open() must be called before send()ing data.
     */
    UDPSender(std::shared_ptr<boost::asio::io_service> io_service,
        const std::string& host,
        size_t port);

    virtual ~UDPSender();

    /**
     * Resolves the host and connects the socket to it. Throws ClientInitError if the host can't be
     * resolved or the socket can't be opened/connected.
     */
    void open();

    void send(const char* bytes, size_t size);

    void close();

    /**
     * Returns the endpoint which was selected by open().
     */
    boost::asio::ip::udp::endpoint endpoint() const;

    /**
     * Running totals of bytes which were sent, or which failed to send, since construction.
     */
    size_t sent_byte_count() const;
    size_t failed_byte_count() const;

   protected:
    typedef boost::asio::ip::udp::resolver udp_resolver_t;
    typedef boost::asio::ip::udp::endpoint endpoint_t;

    /**
     * DNS lookup operation. Broken out for easier mocking in tests.
     */
    virtual std::vector<endpoint_t> resolve(boost::system::error_code& ec);

    /**
     * The underlying socket's file descriptor, or -1 when it isn't open.
     */
    int native_handle();

   private:
    boost::asio::ip::address select_address(const std::vector<endpoint_t>& resolved);

    const std::string send_host;
    const size_t send_port;

    std::shared_ptr<boost::asio::io_service> io_service;
    endpoint_t current_endpoint;
    boost::asio::ip::udp::socket socket;
    std::atomic<size_t> sent_bytes, failed_bytes;
  };

  typedef std::shared_ptr<UDPSender> udp_sender_ptr_t;
}
