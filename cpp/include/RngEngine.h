#pragma once
#include <cstdint>

namespace wicketsim {
    /**
     * @brief Small, copyable PCG32 engine offering
     *   • Uniform [0,1)
     *   • Exponential via inversion
     *   • Poisson via Knuth (small λ) or Atkinson rejection (large λ)
     *
     * Each (seed, stream) pair selects an independent sequence, so trial chunks can
     * be given their own streams and replayed regardless of which thread runs them.
     */
    class RngEngine {
    public:
        /**
         * @param seed    Optional seed (default = time ^ thread_id).
         * @param stream  PCG stream selector.
         */
        explicit RngEngine(uint64_t seed = defaultSeed(), uint64_t stream = 0);

        /** @return a double ∈ [0,1) */
        double uniform();

        /** @return a double ∈ (0,1) */
        double uniformOpen();

        /** @brief Draw one Exponential variate.
         *  @param mean  Must be > 0.
         *  @return an Exponential(1/mean) variate */
        double exponential(double mean);

        /** @brief Draw one Poisson variate.
         *  @param lambda  Must be >= 0.
         *  @return a Poisson(lambda) variate */
        int poisson(double lambda);

        /** Default seed generator (clock ^ thread_id) */
        static uint64_t defaultSeed();

        /** @return next 32-bit uniform integer via PCG */
        uint32_t nextUInt32();

    private:
        // --- PCG state ---
        uint64_t state_;
        uint64_t increment_;

        int poissonKnuth(double lambda);
        int poissonAtkinson(double lambda);
    };
}
