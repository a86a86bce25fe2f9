#pragma once

#include <stdexcept>
#include <string>

namespace statsd {
  /**
   * Base class for errors produced by the client itself (as opposed to errors passed through from
   * the socket layer, which arrive as boost::system::system_error).
   */
  class ClientError : public std::runtime_error {
   public:
    explicit ClientError(const std::string& what)
      : std::runtime_error(what) { }
  };

  /**
   * Thrown when a client can't reach an Open state: the target couldn't be resolved, or the socket
   * couldn't be opened/connected. This is the only error which is surfaced to callers directly.
   */
  class ClientInitError : public ClientError {
   public:
    explicit ClientInitError(const std::string& what)
      : ClientError(what) { }
  };
}
