#pragma once

#include <errno.h>
#include <fcntl.h>

#include <boost/asio.hpp>

namespace statsd {
  /**
   * Marks the socket's file descriptor as close-on-exec, so that processes forked and exec'd by the
   * application don't hold on to it. On failure, 'ec' holds the errno of the failed fcntl() call.
   */
  inline void set_cloexec(boost::asio::ip::udp::socket& socket, boost::system::error_code& ec) {
    ec = boost::system::error_code();
    int fd_flags = fcntl(socket.native_handle(), F_GETFD, 0);
    if (fd_flags < 0 || fcntl(socket.native_handle(), F_SETFD, fd_flags | FD_CLOEXEC) < 0) {
      ec = boost::system::error_code(errno, boost::system::system_category());
    }
  }
}
