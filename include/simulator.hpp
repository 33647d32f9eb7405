#pragma once

#include <cstddef>
#include <cstdint>

#include "match.hpp"

namespace tl {

class RandomSource;

// "Under 3.5 goals in each half" + "designated team wins a half" + "over 5.5 corners".
struct CompoundMarket {
    double firstHalfWeight = 0.45;
    double secondHalfWeight = 0.55;
    double halfGoalLine = 3.5;
    double cornerLine = 5.5;
};

constexpr std::size_t kDefaultIterations = 20'000;

// One iteration's draws, already mapped to designated/opponent sides.
struct IterationDraw {
    std::uint32_t designatedFirstHalf = 0;
    std::uint32_t opponentFirstHalf = 0;
    std::uint32_t designatedSecondHalf = 0;
    std::uint32_t opponentSecondHalf = 0;
    std::uint32_t corners = 0;
};

struct LegOutcome {
    bool firstHalfUnder = false;
    bool secondHalfUnder = false;
    bool designatedWinsHalf = false;
    bool cornersOver = false;

    bool allHold() const {
        return firstHalfUnder && secondHalfUnder && designatedWinsHalf && cornersOver;
    }
};

struct LegHits {
    std::size_t firstHalfUnder = 0;
    std::size_t secondHalfUnder = 0;
    std::size_t designatedWinsHalf = 0;
    std::size_t cornersOver = 0;
};

struct SimulationResult {
    double probability = 0.0;
    std::size_t iterationCount = 0;
    std::size_t successCount = 0;
    LegHits legs{};
};

LegOutcome settleIteration(const IterationDraw& draw, const CompoundMarket& market);

SimulationResult simulate(const MatchParameters& params,
                          Orientation orientation,
                          std::size_t iterations,
                          RandomSource& rng,
                          const CompoundMarket& market = CompoundMarket{});

} // namespace tl
