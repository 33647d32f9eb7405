#include "match.hpp"

#include "errors.hpp"

#include <cmath>
#include <sstream>

namespace tl {

namespace {

void requirePositiveRate(double value, const char* name) {
    if (!std::isfinite(value) || value <= 0.0) {
        std::ostringstream oss;
        oss << name << " must be finite and positive, got " << value;
        throw InvalidParameterError(oss.str());
    }
}

} // namespace

const char* toString(Orientation orientation) {
    switch (orientation) {
    case Orientation::DesignatedIsHome:
        return "home";
    case Orientation::DesignatedIsAway:
        return "away";
    }
    return "unknown";
}

void validateParameters(const MatchParameters& params) {
    requirePositiveRate(params.homeExpectedGoals, "homeExpectedGoals");
    requirePositiveRate(params.awayExpectedGoals, "awayExpectedGoals");
    requirePositiveRate(params.homeExpectedCorners, "homeExpectedCorners");
    requirePositiveRate(params.awayExpectedCorners, "awayExpectedCorners");
}

bool isUpcoming(const Fixture& fixture) {
    return fixture.status == "TIMED" || fixture.status == "SCHEDULED";
}

} // namespace tl
