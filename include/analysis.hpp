#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "match.hpp"
#include "odds.hpp"
#include "rate_generator.hpp"
#include "value.hpp"

namespace tl {

// Cooperative cancellation for a batch. Matches already being evaluated run
// to completion; unclaimed ones are skipped.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    void cancel() { cancelled_.store(true, std::memory_order_release); }
    void setDeadline(Clock::time_point deadline) { deadline_ = deadline; }
    bool isCancelled() const;

private:
    std::atomic<bool> cancelled_{ false };
    std::optional<Clock::time_point> deadline_;
};

struct AnalysisConfig {
    EvaluatorConfig evaluator{};
    std::uint64_t seed = 0;
    // 0 picks std::thread::hardware_concurrency().
    std::size_t threads = 0;
};

struct MatchFailure {
    std::int64_t matchId = 0;
    std::string reason;
};

struct BatchReport {
    std::uint64_t seed = 0;
    std::vector<ValueAssessment> assessments;
    std::vector<MatchFailure> failures;
    std::size_t notUpcoming = 0;
    std::size_t skipped = 0;
    bool cancelled = false;
};

// Stream indices under a match seed.
constexpr std::uint64_t kRateStream = 0;
constexpr std::uint64_t kSimulationStream = 1;

// Evaluates one fixture with seeds derived from (batchSeed, fixture.id).
ValueAssessment analyzeFixture(const Fixture& fixture,
                               const RateGenerator& rates,
                               const OddsSource& odds,
                               const EvaluatorConfig& cfg,
                               std::uint64_t batchSeed);

// Upcoming fixtures in kickoff order, evaluated on a worker pool. A failing
// match is recorded in BatchReport::failures and never aborts the batch.
BatchReport analyzeFixtures(const std::vector<Fixture>& fixtures,
                            const RateGenerator& rates,
                            const OddsSource& odds,
                            const AnalysisConfig& cfg,
                            const CancellationToken& token);

} // namespace tl
