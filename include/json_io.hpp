#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "analysis.hpp"
#include "match.hpp"
#include "odds.hpp"
#include "value.hpp"

namespace tl {

nlohmann::json readJsonFile(const std::string& path);

// Rows of the matches/teams/leagues join: id, utc_date, status, league_id,
// league_name, home_team_id, home_name, away_team_id, away_name.
std::vector<Fixture> fixturesFromJson(const nlohmann::json& doc);

// match_id, home_expected_goals, away_expected_goals, home_expected_corners,
// away_expected_corners.
std::map<std::int64_t, MatchParameters> ratesFromJson(const nlohmann::json& doc);

// match_id, best_odds, optional average_odds and bookmaker.
std::map<std::int64_t, MarketQuote> quotesFromJson(const nlohmann::json& doc);

nlohmann::json toJson(const ValueAssessment& assessment);
nlohmann::json toJson(const std::vector<ValueAssessment>& assessments);
nlohmann::json toJson(const BatchReport& report, const std::vector<ValueAssessment>& selected);

} // namespace tl
