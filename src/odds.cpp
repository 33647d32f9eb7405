#include "odds.hpp"

#include "errors.hpp"

#include <cmath>
#include <sstream>

namespace tl {

void validateOdds(double decimalOdds) {
    if (!std::isfinite(decimalOdds) || decimalOdds <= 1.0) {
        std::ostringstream oss;
        oss << "Decimal odds must be finite and greater than 1, got " << decimalOdds;
        throw InvalidOddsError(oss.str());
    }
}

MarketQuote synthesizeQuote(double modelProbability, const PricingConfig& pricing) {
    if (!std::isfinite(modelProbability) || modelProbability <= 0.0 || modelProbability > 1.0) {
        std::ostringstream oss;
        oss << "Cannot synthesize a price for model probability " << modelProbability;
        throw InvalidOddsError(oss.str());
    }
    if (!(pricing.bookmakerMargin >= 0.0 && pricing.bookmakerMargin < 1.0)) {
        throw InvalidOddsError("Bookmaker margin must be in [0, 1)");
    }
    if (!std::isfinite(pricing.bestPriceMarkup) || pricing.bestPriceMarkup <= 0.0) {
        throw InvalidOddsError("Best price markup must be finite and positive");
    }

    double average = 1.0 / (modelProbability * (1.0 - pricing.bookmakerMargin));
    MarketQuote quote;
    quote.averageOdds = average;
    quote.bestOdds = average * pricing.bestPriceMarkup;
    quote.bookmaker = "synthetic";
    quote.synthetic = true;
    validateOdds(quote.bestOdds);
    return quote;
}

std::optional<MarketQuote> SyntheticOddsSource::lookup(std::int64_t) const {
    return std::nullopt;
}

QuotedOddsSource::QuotedOddsSource(std::map<std::int64_t, MarketQuote> quotes)
    : quotes_(std::move(quotes)) {}

void QuotedOddsSource::addQuote(std::int64_t matchId, MarketQuote quote) {
    quotes_[matchId] = std::move(quote);
}

std::optional<MarketQuote> QuotedOddsSource::lookup(std::int64_t matchId) const {
    auto it = quotes_.find(matchId);
    if (it == quotes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace tl
