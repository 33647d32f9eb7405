#include "analysis.hpp"
#include "config.hpp"
#include "json_io.hpp"
#include "ranking.hpp"
#include "rate_generator.hpp"
#include "secure_random.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tl;

namespace {

struct CliOptions {
    std::string fixturesPath;
    std::string ratesPath;
    std::string oddsPath;
    std::uint64_t timeoutMs = 0;
    bool json = false;
};

void printUsage() {
    std::cerr << "Usage: touchline <fixtures.json> [--rates rates.json] [--odds odds.json]\n"
              << "                 [--iterations N] [--seed S] [--threads T] [--max-results M]\n"
              << "                 [--rank-by ev|edge|date] [--league NAME] [--min-edge X]\n"
              << "                 [--timeout-ms MS] [--json]\n";
    std::cerr << "Environment: TL_ITERATIONS, TL_SEED, TL_THREADS, TL_MAX_RESULTS, TL_MARGIN,\n"
              << "             TL_MARKUP, TL_CONFIDENCE_THRESHOLD, TL_RANK_BY\n";
}

CliOptions parseArguments(int argc, char* argv[], AppConfig& cfg) {
    CliOptions opts;
    auto valueFor = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--rates") {
            opts.ratesPath = valueFor(i, arg);
        } else if (arg == "--odds") {
            opts.oddsPath = valueFor(i, arg);
        } else if (arg == "--iterations") {
            std::uint64_t iterations = parseUnsignedSetting(arg, valueFor(i, arg));
            if (iterations == 0) {
                throw std::runtime_error("--iterations must be positive");
            }
            cfg.analysis.evaluator.iterations = static_cast<std::size_t>(iterations);
        } else if (arg == "--seed") {
            cfg.seed = parseUnsignedSetting(arg, valueFor(i, arg));
        } else if (arg == "--threads") {
            cfg.analysis.threads = static_cast<std::size_t>(parseUnsignedSetting(arg, valueFor(i, arg)));
        } else if (arg == "--max-results") {
            cfg.maxResults = static_cast<std::size_t>(parseUnsignedSetting(arg, valueFor(i, arg)));
        } else if (arg == "--rank-by") {
            auto key = parseRankKey(valueFor(i, arg));
            if (!key) {
                throw std::runtime_error("--rank-by must be one of ev, edge, date");
            }
            cfg.rankBy = *key;
        } else if (arg == "--league") {
            cfg.filter.league = valueFor(i, arg);
        } else if (arg == "--min-edge") {
            cfg.filter.minEdge = parseDoubleSetting(arg, valueFor(i, arg));
        } else if (arg == "--timeout-ms") {
            opts.timeoutMs = parseUnsignedSetting(arg, valueFor(i, arg));
        } else if (arg == "--json") {
            opts.json = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::runtime_error("Unknown option " + arg);
        } else if (opts.fixturesPath.empty()) {
            opts.fixturesPath = arg;
        } else {
            throw std::runtime_error("Unexpected argument " + arg);
        }
    }

    if (opts.fixturesPath.empty()) {
        throw std::runtime_error("A fixtures file is required");
    }
    return opts;
}

void printTable(const std::vector<ValueAssessment>& rows) {
    std::cout << std::left << std::setw(10) << "Match" << std::setw(22) << "Kickoff"
              << std::setw(44) << "Fixture" << std::setw(6) << "Y" << std::right
              << std::setw(9) << "P(model)" << std::setw(9) << "Odds" << std::setw(9) << "Edge"
              << std::setw(9) << "EV" << "  Confidence\n";
    for (const auto& row : rows) {
        std::string fixture = row.homeTeam + " v " + row.awayTeam;
        std::cout << std::left << std::setw(10) << row.matchId << std::setw(22) << row.kickoff
                  << std::setw(44) << fixture.substr(0, 43) << std::setw(6) << toString(row.orientation)
                  << std::right << std::fixed << std::setprecision(4) << std::setw(9)
                  << row.modelProbability << std::setprecision(2) << std::setw(9) << row.marketOdds
                  << std::setprecision(4) << std::setw(9) << row.edge << std::setw(9)
                  << row.expectedValue << "  " << toString(row.confidenceTier) << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    AppConfig cfg;
    CliOptions opts;
    try {
        cfg = loadConfigFromEnvironment();
        opts = parseArguments(argc, argv, cfg);
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        printUsage();
        return 1;
    }

    std::vector<Fixture> fixtures;
    RateGeneratorPtr rates;
    OddsSourcePtr odds;
    try {
        fixtures = fixturesFromJson(readJsonFile(opts.fixturesPath));
        if (opts.ratesPath.empty()) {
            rates = std::make_shared<HeuristicRateGenerator>();
        } else {
            rates = std::make_shared<TableRateGenerator>(ratesFromJson(readJsonFile(opts.ratesPath)));
        }
        if (opts.oddsPath.empty()) {
            odds = std::make_shared<SyntheticOddsSource>();
        } else {
            odds = std::make_shared<QuotedOddsSource>(quotesFromJson(readJsonFile(opts.oddsPath)));
        }
        cfg.analysis.seed = cfg.seed ? *cfg.seed : secureRandomSeed();
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }

    CancellationToken token;
    if (opts.timeoutMs > 0) {
        token.setDeadline(CancellationToken::Clock::now() + std::chrono::milliseconds(opts.timeoutMs));
    }

    auto start = std::chrono::steady_clock::now();
    BatchReport report = analyzeFixtures(fixtures, *rates, *odds, cfg.analysis, token);
    auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - start)
                         .count();

    for (const auto& failure : report.failures) {
        std::cerr << "match " << failure.matchId << " skipped: " << failure.reason << "\n";
    }
    if (report.cancelled) {
        std::cerr << "Analysis cancelled; " << report.skipped
                  << " upcoming matches were not evaluated\n";
    }

    auto selected = applyFilter(selectValueBets(report.assessments, cfg.maxResults), cfg.filter);
    sortAssessments(selected, cfg.rankBy);

    if (opts.json) {
        std::cout << toJson(report, selected).dump(2) << "\n";
        return 0;
    }

    std::cout << "Target market: U3.5 goals (1st half) + U3.5 goals (2nd half) + Team Y wins a half"
              << " + Over 5.5 corners\n";
    std::cout << "Seed: " << report.seed << "  iterations/orientation: "
              << cfg.analysis.evaluator.iterations << "  analyzed: " << report.assessments.size()
              << "  failed: " << report.failures.size() << "  time: " << elapsedMs << " ms\n";
    std::cout << "Positive-EV opportunities (ranked by " << toString(cfg.rankBy)
              << ", league=" << cfg.filter.league << ", min edge=" << cfg.filter.minEdge << "):\n\n";
    printTable(selected);
    return 0;
}
