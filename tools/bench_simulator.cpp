#include "rng.hpp"
#include "simulator.hpp"

#include <chrono>
#include <iostream>
#include <vector>

namespace {

using SteadyClock = std::chrono::steady_clock;

} // namespace

int main() {
    std::vector<std::size_t> iterationCounts = {
        2'000,
        20'000,
        200'000,
        2'000'000,
    };
    const tl::MatchParameters params{ 1.5, 1.1, 5.2, 4.6 };

    for (auto iterations : iterationCounts) {
        tl::SeededRng rng(42);
        auto start = SteadyClock::now();
        auto result = tl::simulate(params, tl::Orientation::DesignatedIsHome, iterations, rng);
        auto end = SteadyClock::now();

        auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
        std::cout << "iterations=" << iterations << " time: " << elapsedMs
                  << "ms p=" << result.probability << " uniforms=" << rng.getCallCount() << "\n";
    }

    return 0;
}
