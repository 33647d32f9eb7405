#include "json_io.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "json_io_test failure: " << msg << std::endl;
    std::exit(1);
}

template <typename Fn>
void expectRuntimeError(Fn&& fn, const std::string& what) {
    try {
        fn();
    } catch (const std::runtime_error&) {
        return;
    }
    fail("expected runtime_error: " + what);
}

} // namespace

int main() {
    using namespace tl;
    using nlohmann::json;

    json fixturesDoc = json::parse(R"([
        {"id": 501, "utc_date": "2026-10-18T14:00:00Z", "status": "TIMED",
         "league_id": 2019, "league_name": "Serie A",
         "home_team_id": 98, "home_name": "AC \"Milan\"",
         "away_team_id": 99, "away_name": "Fiorentina"},
        {"id": 502, "utc_date": "2026-10-18T16:00:00Z", "status": "FINISHED",
         "league_name": null, "home_name": "Lecce", "away_name": "Monza"}
    ])");
    auto fixtures = fixturesFromJson(fixturesDoc);
    if (fixtures.size() != 2 || fixtures[0].id != 501 || fixtures[0].league != "Serie A" ||
        fixtures[0].homeTeam != "AC \"Milan\"" || fixtures[0].awayTeamId != 99) {
        fail("fixture fields not parsed");
    }
    if (!fixtures[1].league.empty() || fixtures[1].homeTeamId != 0 || isUpcoming(fixtures[1])) {
        fail("optional fixture fields not defaulted");
    }

    expectRuntimeError([] { fixturesFromJson(json::object()); }, "non-array fixtures");
    expectRuntimeError([] { fixturesFromJson(json::parse(R"([{"id": 1, "status": "TIMED"}])")); },
                       "fixture missing utc_date");
    expectRuntimeError(
        [] {
            fixturesFromJson(json::parse(
                R"([{"id": "x", "utc_date": "d", "status": "TIMED", "home_name": "a", "away_name": "b"}])"));
        },
        "fixture id of wrong type");

    auto rates = ratesFromJson(json::parse(R"([
        {"match_id": 501, "home_expected_goals": 1.5, "away_expected_goals": 1.1,
         "home_expected_corners": 5.2, "away_expected_corners": 4.6},
        {"match_id": 502, "home_expected_goals": -1.0, "away_expected_goals": 1.1,
         "home_expected_corners": 5.2, "away_expected_corners": 4.6}
    ])"));
    if (rates.size() != 2 || rates.at(501).homeExpectedCorners != 5.2) {
        fail("rates not parsed");
    }
    // Out-of-range rates load and fail later, per match.
    if (rates.at(502).homeExpectedGoals != -1.0) {
        fail("invalid rate row rejected at load time");
    }

    auto quotes = quotesFromJson(json::parse(R"([
        {"match_id": 501, "best_odds": 7.25, "average_odds": 6.4, "bookmaker": "Pinnacle"},
        {"match_id": 503, "best_odds": 4.0}
    ])"));
    if (quotes.size() != 2 || quotes.at(501).bestOdds != 7.25 || !quotes.at(501).averageOdds ||
        quotes.at(501).bookmaker != "Pinnacle" || quotes.at(501).synthetic) {
        fail("full quote not parsed");
    }
    if (quotes.at(503).averageOdds || quotes.at(503).bookmaker != "unknown") {
        fail("sparse quote not defaulted");
    }

    ValueAssessment assessment;
    assessment.matchId = 501;
    assessment.homeTeam = fixtures[0].homeTeam;
    assessment.awayTeam = fixtures[0].awayTeam;
    assessment.league = "Serie A";
    assessment.kickoff = "2026-10-18T14:00:00Z";
    assessment.orientation = Orientation::DesignatedIsAway;
    assessment.modelProbability = 0.2;
    assessment.marketOdds = 5.5;
    assessment.impliedProbability = 1.0 / 5.5;
    assessment.edge = 0.2 - 1.0 / 5.5;
    assessment.expectedValue = 0.1;
    assessment.confidenceTier = ConfidenceTier::High;

    json row = toJson(assessment);
    if (row["id"] != 501 || row["homeTeam"] != "AC \"Milan\"" || row["confidence"] != "High" ||
        row["isTeamYHome"] != false || !row["oddAvg"].is_null()) {
        fail("assessment serialization wrong");
    }
    // The escaped text must parse back to the same team name.
    if (json::parse(row.dump())["homeTeam"] != "AC \"Milan\"") {
        fail("team name escaping broken");
    }

    BatchReport report;
    report.seed = 18446744073709551615ULL;
    report.assessments.push_back(assessment);
    report.failures.push_back(MatchFailure{ 502, "No expected rates for match 502" });
    report.notUpcoming = 1;
    json batch = toJson(report, report.assessments);
    if (batch["seed"] != "18446744073709551615" || batch["analyzed"] != 1 ||
        batch["failures"].size() != 1 || batch["failures"][0]["id"] != 502 ||
        batch["matches"].size() != 1 || batch["cancelled"] != false) {
        fail("batch report serialization wrong");
    }

    const std::string path = "json_io_test_fixtures.json";
    {
        std::ofstream out(path);
        out << fixturesDoc.dump(2);
    }
    if (fixturesFromJson(readJsonFile(path)).size() != 2) {
        fail("file round trip lost fixtures");
    }
    {
        std::ofstream out(path);
        out << "[{\"id\": 1,";
    }
    expectRuntimeError([&] { readJsonFile(path); }, "truncated file");
    std::remove(path.c_str());
    expectRuntimeError([] { readJsonFile("/nonexistent/touchline/fixtures.json"); }, "missing file");

    std::cout << "json_io_test passed" << std::endl;
    return 0;
}
