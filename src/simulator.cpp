#include "simulator.hpp"

#include "errors.hpp"
#include "poisson.hpp"
#include "rng.hpp"

#include <cmath>

namespace tl {

namespace {

void validateMarket(const CompoundMarket& market) {
    if (!std::isfinite(market.firstHalfWeight) || market.firstHalfWeight <= 0.0 ||
        !std::isfinite(market.secondHalfWeight) || market.secondHalfWeight <= 0.0) {
        throw InvalidParameterError("Half goal weights must be finite and positive");
    }
    if (!std::isfinite(market.halfGoalLine) || !std::isfinite(market.cornerLine)) {
        throw InvalidParameterError("Market lines must be finite");
    }
}

struct SideRates {
    double goals;
    double corners;
};

} // namespace

LegOutcome settleIteration(const IterationDraw& draw, const CompoundMarket& market) {
    const double firstHalfGoals = static_cast<double>(draw.designatedFirstHalf + draw.opponentFirstHalf);
    const double secondHalfGoals =
        static_cast<double>(draw.designatedSecondHalf + draw.opponentSecondHalf);

    LegOutcome outcome;
    outcome.firstHalfUnder = firstHalfGoals < market.halfGoalLine;
    outcome.secondHalfUnder = secondHalfGoals < market.halfGoalLine;
    // A drawn half is not a win.
    outcome.designatedWinsHalf = draw.designatedFirstHalf > draw.opponentFirstHalf ||
                                 draw.designatedSecondHalf > draw.opponentSecondHalf;
    outcome.cornersOver = static_cast<double>(draw.corners) > market.cornerLine;
    return outcome;
}

SimulationResult simulate(const MatchParameters& params,
                          Orientation orientation,
                          std::size_t iterations,
                          RandomSource& rng,
                          const CompoundMarket& market) {
    validateParameters(params);
    validateMarket(market);
    if (iterations == 0) {
        throw InvalidParameterError("Simulation needs at least one iteration");
    }

    const SideRates home{ params.homeExpectedGoals, params.homeExpectedCorners };
    const SideRates away{ params.awayExpectedGoals, params.awayExpectedCorners };
    const SideRates& designated = orientation == Orientation::DesignatedIsHome ? home : away;
    const SideRates& opponent = orientation == Orientation::DesignatedIsHome ? away : home;

    const PoissonSampler designatedFirst(designated.goals * market.firstHalfWeight);
    const PoissonSampler opponentFirst(opponent.goals * market.firstHalfWeight);
    const PoissonSampler designatedSecond(designated.goals * market.secondHalfWeight);
    const PoissonSampler opponentSecond(opponent.goals * market.secondHalfWeight);
    const PoissonSampler designatedCorners(designated.corners);
    const PoissonSampler opponentCorners(opponent.corners);

    SimulationResult result;
    result.iterationCount = iterations;

    for (std::size_t i = 0; i < iterations; ++i) {
        // Designated side draws first so mirrored fixtures share sample paths.
        IterationDraw draw;
        draw.designatedFirstHalf = designatedFirst.draw(rng);
        draw.opponentFirstHalf = opponentFirst.draw(rng);
        draw.designatedSecondHalf = designatedSecond.draw(rng);
        draw.opponentSecondHalf = opponentSecond.draw(rng);
        draw.corners = designatedCorners.draw(rng) + opponentCorners.draw(rng);

        LegOutcome outcome = settleIteration(draw, market);
        result.legs.firstHalfUnder += outcome.firstHalfUnder ? 1 : 0;
        result.legs.secondHalfUnder += outcome.secondHalfUnder ? 1 : 0;
        result.legs.designatedWinsHalf += outcome.designatedWinsHalf ? 1 : 0;
        result.legs.cornersOver += outcome.cornersOver ? 1 : 0;
        if (outcome.allHold()) {
            ++result.successCount;
        }
    }

    result.probability =
        static_cast<double>(result.successCount) / static_cast<double>(iterations);
    return result;
}

} // namespace tl
