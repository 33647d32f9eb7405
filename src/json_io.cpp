#include "json_io.hpp"

#include <fstream>
#include <stdexcept>

namespace tl {

namespace {

using nlohmann::json;

const json& requireArray(const json& doc, const char* what) {
    if (!doc.is_array()) {
        throw std::runtime_error(std::string(what) + " document must be a JSON array");
    }
    return doc;
}

const json& requireField(const json& row, const char* field, const char* what) {
    if (!row.is_object()) {
        throw std::runtime_error(std::string(what) + " entries must be JSON objects");
    }
    auto it = row.find(field);
    if (it == row.end() || it->is_null()) {
        throw std::runtime_error(std::string(what) + " entry missing field \"" + field + "\"");
    }
    return *it;
}

template <typename T>
T fieldAs(const json& row, const char* field, const char* what) {
    const json& value = requireField(row, field, what);
    try {
        return value.get<T>();
    } catch (const json::exception& ex) {
        throw std::runtime_error(std::string(what) + " field \"" + field + "\": " + ex.what());
    }
}

template <typename T>
T optionalFieldAs(const json& row, const char* field, T fallback) {
    auto it = row.find(field);
    if (it == row.end() || it->is_null()) {
        return fallback;
    }
    return it->get<T>();
}

} // namespace

json readJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Unable to open input path: " + path);
    }
    try {
        return json::parse(in);
    } catch (const json::parse_error& ex) {
        throw std::runtime_error("Malformed JSON in " + path + ": " + ex.what());
    }
}

std::vector<Fixture> fixturesFromJson(const json& doc) {
    std::vector<Fixture> fixtures;
    for (const auto& row : requireArray(doc, "Fixtures")) {
        Fixture fixture;
        fixture.id = fieldAs<std::int64_t>(row, "id", "Fixture");
        fixture.utcDate = fieldAs<std::string>(row, "utc_date", "Fixture");
        fixture.status = fieldAs<std::string>(row, "status", "Fixture");
        fixture.leagueId = optionalFieldAs<std::int64_t>(row, "league_id", 0);
        fixture.league = optionalFieldAs<std::string>(row, "league_name", "");
        fixture.homeTeamId = optionalFieldAs<std::int64_t>(row, "home_team_id", 0);
        fixture.homeTeam = fieldAs<std::string>(row, "home_name", "Fixture");
        fixture.awayTeamId = optionalFieldAs<std::int64_t>(row, "away_team_id", 0);
        fixture.awayTeam = fieldAs<std::string>(row, "away_name", "Fixture");
        fixtures.push_back(std::move(fixture));
    }
    return fixtures;
}

std::map<std::int64_t, MatchParameters> ratesFromJson(const json& doc) {
    std::map<std::int64_t, MatchParameters> rates;
    for (const auto& row : requireArray(doc, "Rates")) {
        MatchParameters params{};
        params.homeExpectedGoals = fieldAs<double>(row, "home_expected_goals", "Rates");
        params.awayExpectedGoals = fieldAs<double>(row, "away_expected_goals", "Rates");
        params.homeExpectedCorners = fieldAs<double>(row, "home_expected_corners", "Rates");
        params.awayExpectedCorners = fieldAs<double>(row, "away_expected_corners", "Rates");
        // Validated per match at evaluation time so one bad row cannot sink the batch.
        rates[fieldAs<std::int64_t>(row, "match_id", "Rates")] = params;
    }
    return rates;
}

std::map<std::int64_t, MarketQuote> quotesFromJson(const json& doc) {
    std::map<std::int64_t, MarketQuote> quotes;
    for (const auto& row : requireArray(doc, "Odds")) {
        MarketQuote quote;
        quote.bestOdds = fieldAs<double>(row, "best_odds", "Odds");
        auto average = row.find("average_odds");
        if (average != row.end() && !average->is_null()) {
            quote.averageOdds = average->get<double>();
        }
        quote.bookmaker = optionalFieldAs<std::string>(row, "bookmaker", "unknown");
        quote.synthetic = false;
        quotes[fieldAs<std::int64_t>(row, "match_id", "Odds")] = quote;
    }
    return quotes;
}

json toJson(const ValueAssessment& assessment) {
    json j;
    j["id"] = assessment.matchId;
    j["homeTeam"] = assessment.homeTeam;
    j["awayTeam"] = assessment.awayTeam;
    j["league"] = assessment.league;
    j["date"] = assessment.kickoff;
    j["probModel"] = assessment.modelProbability;
    j["probHomeDesignated"] = assessment.homeDesignatedProbability;
    j["probAwayDesignated"] = assessment.awayDesignatedProbability;
    j["iterations"] = assessment.iterations;
    if (assessment.averageOdds) {
        j["oddAvg"] = *assessment.averageOdds;
    } else {
        j["oddAvg"] = nullptr;
    }
    j["bestOdd"] = assessment.marketOdds;
    j["bookmaker"] = assessment.bookmaker;
    j["syntheticOdds"] = assessment.syntheticOdds;
    j["probImplied"] = assessment.impliedProbability;
    j["edge"] = assessment.edge;
    j["ev"] = assessment.expectedValue;
    j["confidence"] = toString(assessment.confidenceTier);
    j["isTeamYHome"] = assessment.orientation == Orientation::DesignatedIsHome;
    return j;
}

json toJson(const std::vector<ValueAssessment>& assessments) {
    json out = json::array();
    for (const auto& assessment : assessments) {
        out.push_back(toJson(assessment));
    }
    return out;
}

json toJson(const BatchReport& report, const std::vector<ValueAssessment>& selected) {
    json j;
    // Seeds exceed the 53-bit range some JSON readers keep exact.
    j["seed"] = std::to_string(report.seed);
    j["analyzed"] = report.assessments.size();
    j["notUpcoming"] = report.notUpcoming;
    j["skipped"] = report.skipped;
    j["cancelled"] = report.cancelled;
    json failures = json::array();
    for (const auto& failure : report.failures) {
        failures.push_back({ { "id", failure.matchId }, { "reason", failure.reason } });
    }
    j["failures"] = failures;
    j["matches"] = toJson(selected);
    return j;
}

} // namespace tl
