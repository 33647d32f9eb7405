#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "match.hpp"
#include "odds.hpp"
#include "rng.hpp"
#include "simulator.hpp"

namespace tl {

// Two buckets only: everything at or below the threshold is Medium.
enum class ConfidenceTier { Medium, High };

const char* toString(ConfidenceTier tier);

struct EvaluatorConfig {
    std::size_t iterations = kDefaultIterations;
    double confidenceThreshold = 0.15;
    CompoundMarket market{};
    PricingConfig pricing{};
};

struct ValueAssessment {
    std::int64_t matchId = 0;
    std::string kickoff;
    std::string league;
    std::string homeTeam;
    std::string awayTeam;

    Orientation orientation = Orientation::DesignatedIsHome;
    double modelProbability = 0.0;
    double homeDesignatedProbability = 0.0;
    double awayDesignatedProbability = 0.0;
    std::size_t iterations = 0;

    double marketOdds = 0.0;
    std::optional<double> averageOdds;
    std::string bookmaker;
    bool syntheticOdds = false;

    double impliedProbability = 0.0;
    double edge = 0.0;
    double expectedValue = 0.0;
    ConfidenceTier confidenceTier = ConfidenceTier::Medium;
};

ConfidenceTier classifyConfidence(double modelProbability, double threshold);

// Runs one simulation per orientation, each on a fresh source from makeRng,
// keeps the better orientation (ties go to home) and prices it against the
// quote, or against synthesizeQuote when no quote is given.
ValueAssessment evaluate(const MatchParameters& params,
                         const std::optional<MarketQuote>& quote,
                         const EvaluatorConfig& cfg,
                         const RandomSourceFactory& makeRng);

void attachFixture(ValueAssessment& assessment, const Fixture& fixture);

ValueAssessment generateAssessment(const Fixture& fixture,
                                   const MatchParameters& params,
                                   std::optional<double> marketOdds,
                                   const EvaluatorConfig& cfg,
                                   const RandomSourceFactory& makeRng);

} // namespace tl
