#include "analysis.hpp"

#include "rng.hpp"

#include <algorithm>
#include <exception>
#include <thread>

namespace tl {

bool CancellationToken::isCancelled() const {
    if (cancelled_.load(std::memory_order_acquire)) {
        return true;
    }
    return deadline_ && Clock::now() >= *deadline_;
}

ValueAssessment analyzeFixture(const Fixture& fixture,
                               const RateGenerator& rates,
                               const OddsSource& odds,
                               const EvaluatorConfig& cfg,
                               std::uint64_t batchSeed) {
    const std::uint64_t matchSeed = deriveSeed(batchSeed, static_cast<std::uint64_t>(fixture.id));

    SeededRng rateRng(deriveSeed(matchSeed, kRateStream));
    MatchParameters params = rates.generate(fixture, rateRng);

    ValueAssessment assessment = evaluate(params,
                                          odds.lookup(fixture.id),
                                          cfg,
                                          seededFactory(deriveSeed(matchSeed, kSimulationStream)));
    attachFixture(assessment, fixture);
    return assessment;
}

BatchReport analyzeFixtures(const std::vector<Fixture>& fixtures,
                            const RateGenerator& rates,
                            const OddsSource& odds,
                            const AnalysisConfig& cfg,
                            const CancellationToken& token) {
    BatchReport report;
    report.seed = cfg.seed;

    std::vector<Fixture> upcoming;
    upcoming.reserve(fixtures.size());
    for (const auto& fixture : fixtures) {
        if (isUpcoming(fixture)) {
            upcoming.push_back(fixture);
        } else {
            ++report.notUpcoming;
        }
    }
    std::stable_sort(upcoming.begin(), upcoming.end(), [](const Fixture& a, const Fixture& b) {
        return a.utcDate < b.utcDate;
    });

    const std::size_t n = upcoming.size();
    struct Slot {
        bool claimed = false;
        std::optional<ValueAssessment> assessment;
        std::optional<std::string> error;
    };
    // Each slot is written by exactly one worker; join() publishes them.
    std::vector<Slot> slots(n);
    std::atomic<std::size_t> next{ 0 };

    auto worker = [&]() {
        while (!token.isCancelled()) {
            std::size_t idx = next.fetch_add(1, std::memory_order_relaxed);
            if (idx >= n) {
                return;
            }
            Slot& slot = slots[idx];
            slot.claimed = true;
            try {
                slot.assessment = analyzeFixture(upcoming[idx], rates, odds, cfg.evaluator, cfg.seed);
            } catch (const std::exception& ex) {
                slot.error = ex.what();
            }
        }
    };

    std::size_t threadCount = cfg.threads;
    if (threadCount == 0) {
        threadCount = std::max(1u, std::thread::hardware_concurrency());
    }
    threadCount = std::min(threadCount, std::max<std::size_t>(n, 1));

    if (threadCount <= 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(threadCount);
        for (std::size_t i = 0; i < threadCount; ++i) {
            pool.emplace_back(worker);
        }
        for (auto& thread : pool) {
            thread.join();
        }
    }

    for (std::size_t i = 0; i < n; ++i) {
        Slot& slot = slots[i];
        if (!slot.claimed) {
            ++report.skipped;
        } else if (slot.assessment) {
            report.assessments.push_back(std::move(*slot.assessment));
        } else {
            report.failures.push_back(MatchFailure{ upcoming[i].id, slot.error.value_or("unknown error") });
        }
    }
    report.cancelled = report.skipped > 0;
    return report;
}

} // namespace tl
