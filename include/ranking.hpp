#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "value.hpp"

namespace tl {

constexpr std::size_t kMaxReportedAssessments = 50;

enum class RankKey { ExpectedValue, Edge, Kickoff };

const char* toString(RankKey key);
std::optional<RankKey> parseRankKey(const std::string& text);

struct ReportFilter {
    std::string league = "All";
    double minEdge = 0.0;
};

// Positive-EV entries in the caller's order, at most maxResults of them.
std::vector<ValueAssessment> selectValueBets(const std::vector<ValueAssessment>& assessments,
                                             std::size_t maxResults = kMaxReportedAssessments);

// EV and edge sort descending, kickoff ascending. Stable.
void sortAssessments(std::vector<ValueAssessment>& assessments, RankKey key);

std::vector<ValueAssessment> applyFilter(const std::vector<ValueAssessment>& assessments,
                                         const ReportFilter& filter);

} // namespace tl
