#pragma once

#include <functional>
#include <memory>

namespace statsd {
  /**
   * Decides whether a sampled metric point should be sent at all.
   */
  class Sampler {
   public:
    /**
     * Returns a uniformly distributed value in (0, 1].
     */
    typedef std::function<double()> random_source_t;

    /**
     * Creates a Sampler which draws from a per-thread generator. Safe for concurrent use.
     */
    Sampler();

    /**
     * Creates a Sampler which draws from the provided source. Meant for access by tests.
     */
    explicit Sampler(random_source_t random_source);

    /**
     * Returns whether a point with the provided sample rate should be sent. A rate of exactly 1.0
     * always passes without drawing. Rates outside (0, 1] aren't validated: <=0 never passes.
     */
    bool should_send(double sample_rate) const;

   private:
    const random_source_t random_source;
  };

  typedef std::shared_ptr<Sampler> sampler_ptr_t;
}
