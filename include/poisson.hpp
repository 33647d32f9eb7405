#pragma once

#include <cstdint>
#include <vector>

namespace tl {

class RandomSource;

// Knuth's multiplicative Poisson sampler. Thresholds are computed once per
// rate so a simulation pays for the exponential only at construction.
class PoissonSampler {
public:
    // Rates above this are drawn as a sum of independent chunks; e^(-rate)
    // would otherwise underflow.
    static constexpr double kMaxChunkRate = 256.0;

    explicit PoissonSampler(double lambda);

    std::uint32_t draw(RandomSource& rng) const;
    double getLambda() const { return lambda_; }

private:
    std::uint32_t drawChunk(RandomSource& rng, double threshold) const;

    double lambda_;
    std::vector<double> thresholds_;
};

std::uint32_t samplePoisson(double lambda, RandomSource& rng);

} // namespace tl
