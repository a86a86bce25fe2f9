#include "sampler.hpp"

#include <random>

namespace {
  double thread_random() {
    static thread_local std::mt19937 engine{std::random_device()()};
    std::uniform_real_distribution<double> dist(0., 1.);
    // flip [0,1) to (0,1]: a rate of zero must never pass
    return 1. - dist(engine);
  }
}

statsd::Sampler::Sampler()
  : random_source(&thread_random) { }

statsd::Sampler::Sampler(random_source_t random_source)
  : random_source(random_source) { }

bool statsd::Sampler::should_send(double sample_rate) const {
  if (sample_rate == 1.0) {
    return true;
  }
  return random_source() <= sample_rate;
}
