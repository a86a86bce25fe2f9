#pragma once

#include <gmock/gmock.h>

#include "datagram_sink.hpp"

class MockDatagramSink : public statsd::DatagramSink {
 public:
  MOCK_METHOD2(send, void(const char* bytes, size_t size));
  MOCK_METHOD0(close, void());
};
