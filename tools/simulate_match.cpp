#include "config.hpp"
#include "rng.hpp"
#include "simulator.hpp"
#include "value.hpp"

#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

namespace {

void printLegs(const tl::SimulationResult& result) {
    auto share = [&](std::size_t hits) {
        return static_cast<double>(hits) / static_cast<double>(result.iterationCount);
    };
    std::cout << "    U3.5 1st half:      " << share(result.legs.firstHalfUnder) << '\n';
    std::cout << "    U3.5 2nd half:      " << share(result.legs.secondHalfUnder) << '\n';
    std::cout << "    Team Y wins a half: " << share(result.legs.designatedWinsHalf) << '\n';
    std::cout << "    Over 5.5 corners:   " << share(result.legs.cornersOver) << '\n';
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 7) {
        std::cerr << "Usage: simulate_match <homeGoals> <awayGoals> <homeCorners> <awayCorners> "
                     "<iterations> <seed> [marketOdds]\n";
        return 1;
    }

    tl::MatchParameters params{};
    std::size_t iterations = 0;
    std::uint64_t seed = 0;
    std::optional<double> marketOdds;
    try {
        params.homeExpectedGoals = tl::parseDoubleSetting("homeGoals", argv[1]);
        params.awayExpectedGoals = tl::parseDoubleSetting("awayGoals", argv[2]);
        params.homeExpectedCorners = tl::parseDoubleSetting("homeCorners", argv[3]);
        params.awayExpectedCorners = tl::parseDoubleSetting("awayCorners", argv[4]);
        iterations = static_cast<std::size_t>(tl::parseUnsignedSetting("iterations", argv[5]));
        seed = tl::parseUnsignedSetting("seed", argv[6]);
        if (argc > 7) {
            marketOdds = tl::parseDoubleSetting("marketOdds", argv[7]);
        }
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    try {
        std::cout << std::fixed << std::setprecision(6);
        for (auto orientation : { tl::Orientation::DesignatedIsHome, tl::Orientation::DesignatedIsAway }) {
            tl::SeededRng rng(seed);
            auto result = tl::simulate(params, orientation, iterations, rng);
            std::cout << "Team Y = " << tl::toString(orientation) << ": p = " << result.probability
                      << " (" << result.successCount << "/" << result.iterationCount << ")\n";
            printLegs(result);
        }

        tl::EvaluatorConfig cfg;
        cfg.iterations = iterations;
        tl::Fixture fixture;
        auto assessment =
            tl::generateAssessment(fixture, params, marketOdds, cfg, tl::seededFactory(seed));
        std::cout << "\nSelected Team Y: " << tl::toString(assessment.orientation) << '\n';
        std::cout << "Odds: " << assessment.marketOdds << (assessment.syntheticOdds ? " (synthetic)" : "")
                  << '\n';
        std::cout << "Implied probability: " << assessment.impliedProbability << '\n';
        std::cout << "Edge: " << assessment.edge << "  EV: " << assessment.expectedValue << '\n';
        std::cout << "Confidence: " << tl::toString(assessment.confidenceTier) << '\n';
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    return 0;
}
