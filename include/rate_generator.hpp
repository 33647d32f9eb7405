#pragma once

#include <cstdint>
#include <map>
#include <memory>

#include "match.hpp"

namespace tl {

class RandomSource;

// Turns fixture context into expected rates. Implementations must be safe to
// call from several analysis workers at once; all randomness comes from rng.
class RateGenerator {
public:
    virtual ~RateGenerator() = default;
    virtual MatchParameters generate(const Fixture& fixture, RandomSource& rng) const = 0;
};

using RateGeneratorPtr = std::shared_ptr<const RateGenerator>;

// Uniform jitter around league-average rates: base + U[0,1) * spread.
struct HeuristicRanges {
    double homeGoalsBase = 1.2;
    double homeGoalsSpread = 0.8;
    double awayGoalsBase = 1.0;
    double awayGoalsSpread = 0.8;
    double homeCornersBase = 4.5;
    double homeCornersSpread = 2.0;
    double awayCornersBase = 4.0;
    double awayCornersSpread = 2.0;
};

class HeuristicRateGenerator : public RateGenerator {
public:
    HeuristicRateGenerator() = default;
    explicit HeuristicRateGenerator(const HeuristicRanges& ranges);

    MatchParameters generate(const Fixture& fixture, RandomSource& rng) const override;
    const HeuristicRanges& getRanges() const { return ranges_; }

private:
    HeuristicRanges ranges_;
};

// Rates supplied per match id by an external model.
class TableRateGenerator : public RateGenerator {
public:
    TableRateGenerator() = default;
    explicit TableRateGenerator(std::map<std::int64_t, MatchParameters> rates);

    void setRates(std::int64_t matchId, const MatchParameters& params);
    MatchParameters generate(const Fixture& fixture, RandomSource& rng) const override;
    std::size_t size() const { return rates_.size(); }

private:
    std::map<std::int64_t, MatchParameters> rates_;
};

} // namespace tl
