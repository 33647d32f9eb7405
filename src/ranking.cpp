#include "ranking.hpp"

#include <algorithm>

namespace tl {

const char* toString(RankKey key) {
    switch (key) {
    case RankKey::ExpectedValue:
        return "ev";
    case RankKey::Edge:
        return "edge";
    case RankKey::Kickoff:
        return "date";
    }
    return "unknown";
}

std::optional<RankKey> parseRankKey(const std::string& text) {
    if (text == "ev") {
        return RankKey::ExpectedValue;
    }
    if (text == "edge") {
        return RankKey::Edge;
    }
    if (text == "date") {
        return RankKey::Kickoff;
    }
    return std::nullopt;
}

std::vector<ValueAssessment> selectValueBets(const std::vector<ValueAssessment>& assessments,
                                             std::size_t maxResults) {
    std::vector<ValueAssessment> selected;
    for (const auto& assessment : assessments) {
        if (selected.size() >= maxResults) {
            break;
        }
        if (assessment.expectedValue > 0.0) {
            selected.push_back(assessment);
        }
    }
    return selected;
}

void sortAssessments(std::vector<ValueAssessment>& assessments, RankKey key) {
    switch (key) {
    case RankKey::ExpectedValue:
        std::stable_sort(assessments.begin(), assessments.end(),
                         [](const ValueAssessment& a, const ValueAssessment& b) {
                             return a.expectedValue > b.expectedValue;
                         });
        break;
    case RankKey::Edge:
        std::stable_sort(assessments.begin(), assessments.end(),
                         [](const ValueAssessment& a, const ValueAssessment& b) {
                             return a.edge > b.edge;
                         });
        break;
    case RankKey::Kickoff:
        // ISO-8601 UTC timestamps order lexicographically.
        std::stable_sort(assessments.begin(), assessments.end(),
                         [](const ValueAssessment& a, const ValueAssessment& b) {
                             return a.kickoff < b.kickoff;
                         });
        break;
    }
}

std::vector<ValueAssessment> applyFilter(const std::vector<ValueAssessment>& assessments,
                                         const ReportFilter& filter) {
    std::vector<ValueAssessment> kept;
    for (const auto& assessment : assessments) {
        if (filter.league != "All" && assessment.league != filter.league) {
            continue;
        }
        if (assessment.edge < filter.minEdge) {
            continue;
        }
        kept.push_back(assessment);
    }
    return kept;
}

} // namespace tl
