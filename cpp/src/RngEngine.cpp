#include "RngEngine.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <functional>
#include <thread>


using namespace wicketsim;

namespace {
    constexpr double PI = 3.14159265358979323846;

    // Below this mean Knuth's product method is cheaper than rejection.
    constexpr double POISSON_KNUTH_LIMIT = 30.0;
}


//------------------------------------------------------------------------------
// defaultSeed(): mix high-res clock and thread ID for initial seeding
//------------------------------------------------------------------------------
uint64_t RngEngine::defaultSeed() {
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    const auto tid = std::hash<std::thread::id>()(std::this_thread::get_id());
    return static_cast<uint64_t>(now) ^ (static_cast<uint64_t>(tid) << 1);
}

//------------------------------------------------------------------------------
// Constructor: the stream picks the (odd) PCG increment
//------------------------------------------------------------------------------
RngEngine::RngEngine(const uint64_t seed, const uint64_t stream) : state_(0), increment_(stream << 1u | 1u) {
    nextUInt32();
    state_ += seed;
    nextUInt32();
}

//------------------------------------------------------------------------------
// nextUInt32(): PCG-XSH-RR 32-bit generator
//------------------------------------------------------------------------------
uint32_t RngEngine::nextUInt32() {
    const uint64_t old = state_;
    state_ = old * 6364136223846793005ULL + increment_;
    const auto xorshifted = static_cast<uint32_t>(((old >> 18u) ^ old) >> 27u);
    const auto rot = static_cast<uint32_t>(old >> 59u);
    return (xorshifted >> rot) | (xorshifted << ((-rot) & 31u));
}

//------------------------------------------------------------------------------
// uniform(): convert nextUInt32() into [0,1)
//------------------------------------------------------------------------------
double RngEngine::uniform() {
    return nextUInt32() * (1.0 / 4294967296.0);
}

//------------------------------------------------------------------------------
// uniformOpen(): shift by half an ulp of the 32-bit grid to exclude 0
//------------------------------------------------------------------------------
double RngEngine::uniformOpen() {
    return (nextUInt32() + 0.5) * (1.0 / 4294967296.0);
}

//------------------------------------------------------------------------------
// exponential(mean): inverse CDF
//------------------------------------------------------------------------------
double RngEngine::exponential(const double mean) {
    assert(mean > 0.0 && "Exponential mean must be positive");
    return -mean * std::log(uniformOpen());
}

//------------------------------------------------------------------------------
// poisson(lambda): Knuth for small means, Atkinson's rejection otherwise
//------------------------------------------------------------------------------
int RngEngine::poisson(const double lambda) {
    assert(lambda >= 0.0 && "Poisson mean must be non-negative");
    if (lambda == 0.0) return 0;
    if (lambda < POISSON_KNUTH_LIMIT) return poissonKnuth(lambda);
    return poissonAtkinson(lambda);
}

int RngEngine::poissonKnuth(const double lambda) {
    const double L = std::exp(-lambda);
    int k = 0;
    double t = 1.0;
    do {
        ++k;
        t *= uniform();
    }
    while (t > L);
    return k - 1;
}

// Atkinson (1979), logistic envelope
int RngEngine::poissonAtkinson(const double lambda) {
    const double c = 0.767 - 3.36 / lambda;
    const double beta = PI / std::sqrt(3.0 * lambda);
    const double alpha = beta * lambda;
    const double k = std::log(c) - lambda - std::log(beta);
    const double logLambda = std::log(lambda);

    while (true) {
        const double u = uniformOpen();
        const double x = (alpha - std::log((1.0 - u) / u)) / beta;
        const int n = static_cast<int>(std::floor(x + 0.5));
        if (n < 0) continue;
        const double v = uniformOpen();
        const double y = alpha - beta * x;
        const double t = 1.0 + std::exp(y);
        const double lhs = y + std::log(v / (t * t));
        const double rhs = k + n * logLambda - std::lgamma(n + 1.0);
        if (lhs <= rhs) return n;
    }
}
