#pragma once

#include <cstdint>
#include <string>

namespace tl {

// Full-match expected counts (rates), not per-half.
struct MatchParameters {
    double homeExpectedGoals;
    double awayExpectedGoals;
    double homeExpectedCorners;
    double awayExpectedCorners;
};

// Which side must win at least one half.
enum class Orientation { DesignatedIsHome, DesignatedIsAway };

const char* toString(Orientation orientation);

// Throws InvalidParameterError unless every rate is finite and > 0.
void validateParameters(const MatchParameters& params);

struct Fixture {
    std::int64_t id = 0;
    std::string utcDate;
    std::string status;
    std::int64_t leagueId = 0;
    std::string league;
    std::int64_t homeTeamId = 0;
    std::string homeTeam;
    std::int64_t awayTeamId = 0;
    std::string awayTeam;
};

// Only fixtures that have not kicked off are analyzed.
bool isUpcoming(const Fixture& fixture);

} // namespace tl
