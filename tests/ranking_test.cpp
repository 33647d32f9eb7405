#include "ranking.hpp"

#include <cstdlib>
#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "ranking_test failure: " << msg << std::endl;
    std::exit(1);
}

tl::ValueAssessment makeAssessment(std::int64_t id, double ev, double edge, std::string kickoff,
                                   std::string league = "Serie A") {
    tl::ValueAssessment assessment;
    assessment.matchId = id;
    assessment.expectedValue = ev;
    assessment.edge = edge;
    assessment.kickoff = std::move(kickoff);
    assessment.league = std::move(league);
    return assessment;
}

} // namespace

int main() {
    using namespace tl;

    std::vector<ValueAssessment> five = {
        makeAssessment(1, 0.3, 0.02, "2026-10-20T18:00:00Z"),
        makeAssessment(2, -0.1, -0.01, "2026-10-19T18:00:00Z"),
        makeAssessment(3, 0.05, 0.04, "2026-10-18T18:00:00Z"),
        makeAssessment(4, 0.0, 0.0, "2026-10-21T18:00:00Z"),
        makeAssessment(5, 0.4, 0.01, "2026-10-17T18:00:00Z", "La Liga"),
    };

    auto selected = selectValueBets(five);
    std::multiset<double> evs;
    for (const auto& assessment : selected) {
        evs.insert(assessment.expectedValue);
    }
    if (evs != std::multiset<double>{ 0.3, 0.05, 0.4 }) {
        fail("positive-EV filter kept the wrong entries");
    }
    if (selected[0].matchId != 1 || selected[1].matchId != 3 || selected[2].matchId != 5) {
        fail("selection reordered the caller's sequence");
    }

    std::vector<ValueAssessment> many;
    for (int i = 0; i < 80; ++i) {
        many.push_back(makeAssessment(i, (i % 4 == 0) ? -0.2 : 0.1, 0.01, "2026-10-18T12:00:00Z"));
    }
    auto capped = selectValueBets(many);
    if (capped.size() != kMaxReportedAssessments) {
        fail("selection not capped at 50");
    }
    if (selectValueBets(many, 3).size() != 3) {
        fail("custom cap ignored");
    }

    auto byEv = selected;
    sortAssessments(byEv, RankKey::ExpectedValue);
    if (byEv[0].matchId != 5 || byEv[2].matchId != 3) {
        fail("EV ranking not descending");
    }

    auto byEdge = selected;
    sortAssessments(byEdge, RankKey::Edge);
    if (byEdge[0].matchId != 3 || byEdge[2].matchId != 5) {
        fail("edge ranking not descending");
    }

    auto byDate = selected;
    sortAssessments(byDate, RankKey::Kickoff);
    if (byDate[0].matchId != 5 || byDate[2].matchId != 1) {
        fail("kickoff ranking not ascending");
    }

    ReportFilter laLiga;
    laLiga.league = "La Liga";
    auto filtered = applyFilter(five, laLiga);
    if (filtered.size() != 1 || filtered[0].matchId != 5) {
        fail("league filter wrong");
    }

    ReportFilter minEdge;
    minEdge.minEdge = 0.02;
    filtered = applyFilter(five, minEdge);
    if (filtered.size() != 2) {
        fail("minimum-edge filter wrong");
    }

    if (parseRankKey("edge") != RankKey::Edge || parseRankKey("date") != RankKey::Kickoff ||
        parseRankKey("odds").has_value()) {
        fail("rank key parsing wrong");
    }

    std::cout << "ranking_test passed" << std::endl;
    return 0;
}
