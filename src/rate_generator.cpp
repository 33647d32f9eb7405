#include "rate_generator.hpp"

#include "rng.hpp"

#include <sstream>
#include <stdexcept>

namespace tl {

HeuristicRateGenerator::HeuristicRateGenerator(const HeuristicRanges& ranges)
    : ranges_(ranges) {}

MatchParameters HeuristicRateGenerator::generate(const Fixture&, RandomSource& rng) const {
    MatchParameters params{};
    params.homeExpectedGoals = ranges_.homeGoalsBase + rng.uniform01() * ranges_.homeGoalsSpread;
    params.awayExpectedGoals = ranges_.awayGoalsBase + rng.uniform01() * ranges_.awayGoalsSpread;
    params.homeExpectedCorners =
        ranges_.homeCornersBase + rng.uniform01() * ranges_.homeCornersSpread;
    params.awayExpectedCorners =
        ranges_.awayCornersBase + rng.uniform01() * ranges_.awayCornersSpread;
    return params;
}

TableRateGenerator::TableRateGenerator(std::map<std::int64_t, MatchParameters> rates)
    : rates_(std::move(rates)) {}

void TableRateGenerator::setRates(std::int64_t matchId, const MatchParameters& params) {
    rates_[matchId] = params;
}

MatchParameters TableRateGenerator::generate(const Fixture& fixture, RandomSource&) const {
    auto it = rates_.find(fixture.id);
    if (it == rates_.end()) {
        std::ostringstream oss;
        oss << "No expected rates for match " << fixture.id;
        throw std::runtime_error(oss.str());
    }
    return it->second;
}

} // namespace tl
