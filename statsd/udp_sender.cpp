#include "udp_sender.hpp"

#include <random>
#include <set>
#include <sstream>

#include <glog/logging.h>

#include "errors.hpp"
#include "socket_util.hpp"

namespace {
  const size_t MAX_PORT = 65535;
}

statsd::UDPSender::UDPSender(
    std::shared_ptr<boost::asio::io_service> io_service,
    const std::string& host,
    size_t port)
  : send_host(host),
    send_port(port),
    io_service(io_service),
    socket(*io_service),
    sent_bytes(0),
    failed_bytes(0) {
  LOG(INFO) << "UDPSender constructed for " << send_host << ":" << send_port;
}

statsd::UDPSender::~UDPSender() {
  if (socket.is_open()) {
    boost::system::error_code ec;
    socket.close(ec);
    if (ec) {
      LOG(ERROR) << "Error on writer socket close. "
                 << "err='" << ec.message() << "'(" << ec << ")";
    }
  }
}

void statsd::UDPSender::open() {
  if (send_host.empty()) {
    throw ClientInitError("Invalid StatsD host: must be non-empty");
  }
  if (send_port == 0 || send_port > MAX_PORT) {
    std::ostringstream oss;
    oss << "Invalid StatsD port for host[" << send_host << "]: " << send_port;
    throw ClientInitError(oss.str());
  }

  boost::system::error_code ec;
  std::vector<endpoint_t> resolved = resolve(ec);
  boost::asio::ip::address selected_address;
  if (ec || resolved.empty()) {
    // dns lookup failed or had no results, fall back to parsing the host string as a literal ip
    boost::system::error_code ec2;
    selected_address = boost::asio::ip::address::from_string(send_host, ec2);
    if (ec2) {
      std::ostringstream oss;
      oss << "Unable to resolve host[" << send_host << "]: ";
      if (ec) {
        oss << "err='" << ec.message() << "'(" << ec << "), ";
      } else {
        oss << "no results, ";
      }
      oss << "err2='" << ec2.message() << "'(" << ec2 << ")";
      throw ClientInitError(oss.str());
    }
  } else {
    selected_address = select_address(resolved);
  }

  endpoint_t new_endpoint(selected_address, send_port);
  socket.open(new_endpoint.protocol(), ec);
  if (ec) {
    std::ostringstream oss;
    oss << "Failed to open writer socket to endpoint[" << new_endpoint << "] "
        << "err='" << ec.message() << "'(" << ec << ")";
    throw ClientInitError(oss.str());
  }
  set_cloexec(socket, ec);
  if (ec) {
    // still usable, but may leak into child processes
    LOG(WARNING) << "Failed to set CLOEXEC on writer socket to endpoint[" << new_endpoint << "] "
                 << "err='" << ec.message() << "'(" << ec << ")";
  }

  socket.connect(new_endpoint, ec);
  if (ec) {
    boost::system::error_code close_ec;
    socket.close(close_ec);
    std::ostringstream oss;
    oss << "Failed to connect writer socket to endpoint[" << new_endpoint << "] "
        << "err='" << ec.message() << "'(" << ec << ")";
    throw ClientInitError(oss.str());
  }

  current_endpoint = new_endpoint;
  LOG(INFO) << "Connected to dest host[" << send_host << "] at endpoint[" << current_endpoint << "]";
}

void statsd::UDPSender::send(const char* bytes, size_t size) {
  if (size == 0) {
    return;
  }

  DLOG(INFO) << "Send " << size << " bytes to " << send_host << ":" << send_port;
  boost::system::error_code ec;
  size_t sent = socket.send(boost::asio::buffer(bytes, size), 0 /* flags */, ec);
  if (ec) {
    failed_bytes += size;
    std::ostringstream oss;
    oss << "Failed to send " << size << " bytes of data to [" << send_host << ":" << send_port << "]";
    throw boost::system::system_error(ec, oss.str());
  }
  if (sent != size) {
    LOG(WARNING) << "Sent size=" << sent << " doesn't match requested size=" << size;
  }
  sent_bytes += sent;
}

void statsd::UDPSender::close() {
  LOG(INFO) << "UDP Throughput (bytes) to " << send_host << ":" << send_port << ": "
            << "sent=" << sent_bytes.load() << ", failed=" << failed_bytes.load();
  if (!socket.is_open()) {
    return;
  }
  boost::system::error_code ec;
  socket.close(ec);
  if (ec) {
    throw boost::system::system_error(ec, "Error on writer socket close");
  }
}

boost::asio::ip::udp::endpoint statsd::UDPSender::endpoint() const {
  return current_endpoint;
}

size_t statsd::UDPSender::sent_byte_count() const {
  return sent_bytes.load();
}

size_t statsd::UDPSender::failed_byte_count() const {
  return failed_bytes.load();
}

int statsd::UDPSender::native_handle() {
  return socket.is_open() ? socket.native_handle() : -1;
}

std::vector<boost::asio::ip::udp::endpoint> statsd::UDPSender::resolve(
    boost::system::error_code& ec) {
  std::vector<endpoint_t> endpoints;
  udp_resolver_t resolver(*io_service);
  udp_resolver_t::iterator iter = resolver.resolve(udp_resolver_t::query(send_host, ""), ec);
  for (; !ec && iter != udp_resolver_t::iterator(); ++iter) {
    endpoints.push_back(iter->endpoint());
  }
  return endpoints;
}

boost::asio::ip::address statsd::UDPSender::select_address(const std::vector<endpoint_t>& resolved) {
  // normalize any randomized ordering produced by the dns server before picking an entry, so that
  // selection is only affected by our own randomization
  std::multiset<boost::asio::ip::address> sorted_resolved_addresses;
  for (const endpoint_t& endpoint : resolved) {
    sorted_resolved_addresses.insert(endpoint.address());
  }

  size_t rand_index;
  {
    std::random_device dev;
    std::mt19937 engine{dev()};
    std::uniform_int_distribution<size_t> dist(0, sorted_resolved_addresses.size() - 1);
    rand_index = dist(engine);
  }

  std::multiset<boost::asio::ip::address>::const_iterator iter = sorted_resolved_addresses.begin();
  for (size_t i = 0; i < rand_index; ++i) {
    ++iter;
  }

  LOG(INFO) << "Resolved dest host[" << send_host << "] "
            << "-> results[size=" << sorted_resolved_addresses.size() << "] "
            << "-> selected[" << *iter << "]";
  return *iter;
}
