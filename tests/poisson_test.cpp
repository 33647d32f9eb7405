#include "deterministic_math.hpp"
#include "errors.hpp"
#include "poisson.hpp"
#include "rng.hpp"
#include "test_helpers.hpp"

#include <boost/math/distributions/poisson.hpp>

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "poisson_test failure: " << msg << std::endl;
    std::exit(1);
}

void expectInvalidRate(double lambda) {
    bool caught = false;
    try {
        tl::PoissonSampler sampler(lambda);
        (void)sampler;
    } catch (const tl::InvalidParameterError&) {
        caught = true;
    }
    if (!caught) {
        fail("rate " + std::to_string(lambda) + " did not raise InvalidParameterError");
    }
}

} // namespace

int main() {
    using namespace tl;

    // Zero rate: always zero, no randomness consumed.
    {
        tl_test::CountingRng rng(1);
        PoissonSampler sampler(0.0);
        for (int i = 0; i < 1000; ++i) {
            if (sampler.draw(rng) != 0) {
                fail("lambda=0 produced a non-zero draw");
            }
        }
        if (rng.calls() != 0) {
            fail("lambda=0 consumed uniforms");
        }
    }

    // Knuth's loop against a scripted source: L = e^-1 ~ 0.3679.
    // 0.9 -> 0.72 -> 0.36 <= L after three multiplications, so k - 1 = 2.
    {
        tl_test::ScriptedRng rng({ 0.9, 0.8, 0.5 });
        std::uint32_t value = samplePoisson(1.0, rng);
        if (value != 2) {
            fail("scripted Knuth draw expected 2, got " + std::to_string(value));
        }
        if (rng.consumed() != 3) {
            fail("scripted Knuth draw consumed wrong number of uniforms");
        }
    }

    // A zero uniform terminates immediately.
    {
        tl_test::ScriptedRng rng({ 0.0 });
        if (samplePoisson(4.0, rng) != 0) {
            fail("zero uniform should yield 0");
        }
    }

    expectInvalidRate(-0.5);
    expectInvalidRate(std::numeric_limits<double>::quiet_NaN());
    expectInvalidRate(std::numeric_limits<double>::infinity());

    if (DeterministicMath::expNeg(0.0) != 1.0) {
        fail("expNeg(0) must be exactly 1");
    }
    if (std::abs(DeterministicMath::expNeg(2.5) - std::exp(-2.5)) > 1e-15) {
        fail("expNeg(2.5) disagrees with std::exp");
    }

    // Empirical pmf against the exact Poisson pmf.
    {
        const double lambda = 2.5;
        const int draws = 200'000;
        SeededRng rng(20240817);
        PoissonSampler sampler(lambda);
        std::vector<int> counts(40, 0);
        double sum = 0.0;
        for (int i = 0; i < draws; ++i) {
            std::uint32_t k = sampler.draw(rng);
            sum += k;
            if (k < counts.size()) {
                ++counts[k];
            }
        }
        double mean = sum / draws;
        if (std::abs(mean - lambda) > 0.02) {
            fail("sample mean " + std::to_string(mean) + " far from 2.5");
        }

        boost::math::poisson_distribution<double> exact(lambda);
        for (int k = 0; k <= 8; ++k) {
            double empirical = static_cast<double>(counts[k]) / draws;
            double expected = boost::math::pdf(exact, k);
            if (std::abs(empirical - expected) > 0.005) {
                fail("pmf mismatch at k=" + std::to_string(k));
            }
        }
    }

    // Rates past the underflow point are drawn in chunks and stay unbiased.
    {
        const double lambda = 1000.0;
        const int draws = 4'000;
        SeededRng rng(7);
        PoissonSampler sampler(lambda);
        double sum = 0.0;
        for (int i = 0; i < draws; ++i) {
            sum += sampler.draw(rng);
        }
        double mean = sum / draws;
        // Standard error of the mean is sqrt(1000 / 4000) = 0.5.
        if (std::abs(mean - lambda) > 3.0) {
            fail("large-rate sample mean " + std::to_string(mean) + " far from 1000");
        }
    }

    std::cout << "poisson_test passed" << std::endl;
    return 0;
}
