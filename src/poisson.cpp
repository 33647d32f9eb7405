#include "poisson.hpp"

#include "deterministic_math.hpp"
#include "errors.hpp"
#include "rng.hpp"

#include <cmath>
#include <sstream>

namespace tl {

PoissonSampler::PoissonSampler(double lambda)
    : lambda_(lambda) {
    if (!std::isfinite(lambda) || lambda < 0.0) {
        std::ostringstream oss;
        oss << "Poisson rate must be finite and non-negative, got " << lambda;
        throw InvalidParameterError(oss.str());
    }

    double remaining = lambda;
    while (remaining > 0.0) {
        double chunk = remaining > kMaxChunkRate ? kMaxChunkRate : remaining;
        thresholds_.push_back(DeterministicMath::expNeg(chunk));
        remaining -= chunk;
    }
}

std::uint32_t PoissonSampler::drawChunk(RandomSource& rng, double threshold) const {
    std::uint32_t k = 0;
    double p = 1.0;
    do {
        ++k;
        p *= rng.uniform01();
    } while (p > threshold);
    return k - 1;
}

std::uint32_t PoissonSampler::draw(RandomSource& rng) const {
    // lambda == 0 has no thresholds: zero without touching the source.
    std::uint32_t total = 0;
    for (double threshold : thresholds_) {
        total += drawChunk(rng, threshold);
    }
    return total;
}

std::uint32_t samplePoisson(double lambda, RandomSource& rng) {
    return PoissonSampler(lambda).draw(rng);
}

} // namespace tl
