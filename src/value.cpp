#include "value.hpp"

#include "errors.hpp"

#include <stdexcept>

namespace tl {

namespace {

double runOrientation(const MatchParameters& params,
                      Orientation orientation,
                      const EvaluatorConfig& cfg,
                      const RandomSourceFactory& makeRng) {
    std::unique_ptr<RandomSource> rng = makeRng();
    if (!rng) {
        throw std::runtime_error("Random source factory returned null");
    }
    return simulate(params, orientation, cfg.iterations, *rng, cfg.market).probability;
}

} // namespace

const char* toString(ConfidenceTier tier) {
    switch (tier) {
    case ConfidenceTier::Medium:
        return "Medium";
    case ConfidenceTier::High:
        return "High";
    }
    return "Unknown";
}

ConfidenceTier classifyConfidence(double modelProbability, double threshold) {
    return modelProbability > threshold ? ConfidenceTier::High : ConfidenceTier::Medium;
}

ValueAssessment evaluate(const MatchParameters& params,
                         const std::optional<MarketQuote>& quote,
                         const EvaluatorConfig& cfg,
                         const RandomSourceFactory& makeRng) {
    validateParameters(params);
    if (quote) {
        validateOdds(quote->bestOdds);
    }

    ValueAssessment assessment;
    assessment.iterations = cfg.iterations;
    assessment.homeDesignatedProbability =
        runOrientation(params, Orientation::DesignatedIsHome, cfg, makeRng);
    assessment.awayDesignatedProbability =
        runOrientation(params, Orientation::DesignatedIsAway, cfg, makeRng);

    if (assessment.homeDesignatedProbability >= assessment.awayDesignatedProbability) {
        assessment.orientation = Orientation::DesignatedIsHome;
        assessment.modelProbability = assessment.homeDesignatedProbability;
    } else {
        assessment.orientation = Orientation::DesignatedIsAway;
        assessment.modelProbability = assessment.awayDesignatedProbability;
    }

    MarketQuote price = quote ? *quote : synthesizeQuote(assessment.modelProbability, cfg.pricing);
    assessment.marketOdds = price.bestOdds;
    assessment.averageOdds = price.averageOdds;
    assessment.bookmaker = price.bookmaker;
    assessment.syntheticOdds = price.synthetic;

    assessment.impliedProbability = 1.0 / assessment.marketOdds;
    assessment.edge = assessment.modelProbability - assessment.impliedProbability;
    assessment.expectedValue = assessment.modelProbability * assessment.marketOdds - 1.0;
    assessment.confidenceTier =
        classifyConfidence(assessment.modelProbability, cfg.confidenceThreshold);
    return assessment;
}

void attachFixture(ValueAssessment& assessment, const Fixture& fixture) {
    assessment.matchId = fixture.id;
    assessment.kickoff = fixture.utcDate;
    assessment.league = fixture.league;
    assessment.homeTeam = fixture.homeTeam;
    assessment.awayTeam = fixture.awayTeam;
}

ValueAssessment generateAssessment(const Fixture& fixture,
                                   const MatchParameters& params,
                                   std::optional<double> marketOdds,
                                   const EvaluatorConfig& cfg,
                                   const RandomSourceFactory& makeRng) {
    std::optional<MarketQuote> quote;
    if (marketOdds) {
        MarketQuote supplied;
        supplied.bestOdds = *marketOdds;
        supplied.bookmaker = "supplied";
        quote = supplied;
    }

    ValueAssessment assessment = evaluate(params, quote, cfg, makeRng);
    attachFixture(assessment, fixture);
    return assessment;
}

} // namespace tl
