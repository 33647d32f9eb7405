#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "analysis.hpp"
#include "ranking.hpp"

namespace tl {

struct AppConfig {
    AnalysisConfig analysis{};
    // Unset means a fresh libsodium seed per run.
    std::optional<std::uint64_t> seed;
    std::size_t maxResults = kMaxReportedAssessments;
    RankKey rankBy = RankKey::ExpectedValue;
    ReportFilter filter{};
};

// Overrides from TL_ITERATIONS, TL_SEED, TL_THREADS, TL_MAX_RESULTS, TL_MARGIN,
// TL_MARKUP, TL_CONFIDENCE_THRESHOLD and TL_RANK_BY. Unset or blank variables
// leave the base value alone; malformed ones throw std::runtime_error.
AppConfig loadConfigFromEnvironment(AppConfig base = AppConfig{});

// Shared with the command-line parser. Both throw std::runtime_error naming the setting.
std::uint64_t parseUnsignedSetting(const std::string& name, const std::string& text);
double parseDoubleSetting(const std::string& name, const std::string& text);

std::string trim(const std::string& value);

} // namespace tl
