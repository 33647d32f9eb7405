#include "config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "config_test failure: " << msg << std::endl;
    std::exit(1);
}

const char* const kVariables[] = {
    "TL_ITERATIONS", "TL_SEED", "TL_THREADS", "TL_MAX_RESULTS",
    "TL_MARGIN", "TL_MARKUP", "TL_CONFIDENCE_THRESHOLD", "TL_RANK_BY",
};

void clearEnvironment() {
    for (const char* name : kVariables) {
        ::unsetenv(name);
    }
}

void expectRejected(const char* name, const char* value) {
    clearEnvironment();
    ::setenv(name, value, 1);
    try {
        tl::loadConfigFromEnvironment();
    } catch (const std::runtime_error& ex) {
        if (std::string(ex.what()).find(name) == std::string::npos) {
            fail(std::string("error does not name ") + name + ": " + ex.what());
        }
        return;
    }
    fail(std::string(name) + "=" + value + " was accepted");
}

} // namespace

int main() {
    using namespace tl;

    clearEnvironment();
    AppConfig defaults = loadConfigFromEnvironment();
    if (defaults.analysis.evaluator.iterations != 20'000 || defaults.seed ||
        defaults.maxResults != 50 || defaults.rankBy != RankKey::ExpectedValue ||
        defaults.analysis.evaluator.pricing.bookmakerMargin != 0.20 ||
        defaults.analysis.evaluator.pricing.bestPriceMarkup != 1.10 ||
        defaults.analysis.evaluator.confidenceThreshold != 0.15) {
        fail("defaults changed without environment");
    }

    ::setenv("TL_ITERATIONS", " 5000 ", 1);
    ::setenv("TL_SEED", "18446744073709551615", 1);
    ::setenv("TL_THREADS", "3", 1);
    ::setenv("TL_MAX_RESULTS", "10", 1);
    ::setenv("TL_MARGIN", "0.05", 1);
    ::setenv("TL_MARKUP", "1.0", 1);
    ::setenv("TL_CONFIDENCE_THRESHOLD", "0.3", 1);
    ::setenv("TL_RANK_BY", "edge", 1);
    AppConfig cfg = loadConfigFromEnvironment();
    if (cfg.analysis.evaluator.iterations != 5000 || !cfg.seed ||
        *cfg.seed != 18446744073709551615ULL || cfg.analysis.threads != 3 ||
        cfg.maxResults != 10 || cfg.analysis.evaluator.pricing.bookmakerMargin != 0.05 ||
        cfg.analysis.evaluator.pricing.bestPriceMarkup != 1.0 ||
        cfg.analysis.evaluator.confidenceThreshold != 0.3 || cfg.rankBy != RankKey::Edge) {
        fail("environment overrides not applied");
    }

    clearEnvironment();
    ::setenv("TL_SEED", "   ", 1);
    AppConfig base;
    base.seed = 42;
    if (loadConfigFromEnvironment(base).seed != std::optional<std::uint64_t>(42)) {
        fail("blank variable overrode the base value");
    }

    expectRejected("TL_ITERATIONS", "0");
    expectRejected("TL_ITERATIONS", "-5");
    expectRejected("TL_ITERATIONS", "12abc");
    expectRejected("TL_SEED", "99999999999999999999999");
    expectRejected("TL_MARGIN", "1.0");
    expectRejected("TL_MARKUP", "nan");
    expectRejected("TL_RANK_BY", "odds");
    clearEnvironment();

    if (trim("  padded\t") != "padded" || !trim(" \n ").empty()) {
        fail("trim wrong");
    }

    std::cout << "config_test passed" << std::endl;
    return 0;
}
