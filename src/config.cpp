#include "config.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace tl {

namespace {

std::optional<std::string> readEnv(const char* name) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return std::nullopt;
    }
    std::string value = trim(env);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::uint64_t parseUnsignedSetting(const std::string& name, const std::string& text) {
    std::string value = trim(text);
    if (value.empty() || value.front() == '-' || value.front() == '+') {
        throw std::runtime_error(name + " must be an unsigned integer, got \"" + text + "\"");
    }
    std::size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &consumed, 10);
    } catch (const std::exception&) {
        throw std::runtime_error(name + " must be an unsigned integer, got \"" + text + "\"");
    }
    if (consumed != value.size()) {
        throw std::runtime_error(name + " has trailing characters: \"" + text + "\"");
    }
    return static_cast<std::uint64_t>(parsed);
}

double parseDoubleSetting(const std::string& name, const std::string& text) {
    std::string value = trim(text);
    std::size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error(name + " must be a number, got \"" + text + "\"");
    }
    if (consumed != value.size() || !std::isfinite(parsed)) {
        throw std::runtime_error(name + " must be a finite number, got \"" + text + "\"");
    }
    return parsed;
}

AppConfig loadConfigFromEnvironment(AppConfig base) {
    AppConfig cfg = std::move(base);

    if (auto value = readEnv("TL_ITERATIONS")) {
        std::uint64_t iterations = parseUnsignedSetting("TL_ITERATIONS", *value);
        if (iterations == 0) {
            throw std::runtime_error("TL_ITERATIONS must be positive");
        }
        cfg.analysis.evaluator.iterations = static_cast<std::size_t>(iterations);
    }
    if (auto value = readEnv("TL_SEED")) {
        cfg.seed = parseUnsignedSetting("TL_SEED", *value);
    }
    if (auto value = readEnv("TL_THREADS")) {
        cfg.analysis.threads = static_cast<std::size_t>(parseUnsignedSetting("TL_THREADS", *value));
    }
    if (auto value = readEnv("TL_MAX_RESULTS")) {
        cfg.maxResults = static_cast<std::size_t>(parseUnsignedSetting("TL_MAX_RESULTS", *value));
    }
    if (auto value = readEnv("TL_MARGIN")) {
        double margin = parseDoubleSetting("TL_MARGIN", *value);
        if (margin < 0.0 || margin >= 1.0) {
            throw std::runtime_error("TL_MARGIN must be in [0, 1)");
        }
        cfg.analysis.evaluator.pricing.bookmakerMargin = margin;
    }
    if (auto value = readEnv("TL_MARKUP")) {
        double markup = parseDoubleSetting("TL_MARKUP", *value);
        if (markup <= 0.0) {
            throw std::runtime_error("TL_MARKUP must be positive");
        }
        cfg.analysis.evaluator.pricing.bestPriceMarkup = markup;
    }
    if (auto value = readEnv("TL_CONFIDENCE_THRESHOLD")) {
        cfg.analysis.evaluator.confidenceThreshold =
            parseDoubleSetting("TL_CONFIDENCE_THRESHOLD", *value);
    }
    if (auto value = readEnv("TL_RANK_BY")) {
        auto key = parseRankKey(*value);
        if (!key) {
            throw std::runtime_error("TL_RANK_BY must be one of ev, edge, date");
        }
        cfg.rankBy = *key;
    }
    return cfg;
}

} // namespace tl
