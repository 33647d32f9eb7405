#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace tl {

struct MarketQuote {
    double bestOdds = 0.0;
    std::optional<double> averageOdds;
    std::string bookmaker;
    bool synthetic = false;
};

// Placeholder economics until live prices for the compound market exist.
// Neither constant is calibrated.
struct PricingConfig {
    double bookmakerMargin = 0.20;
    double bestPriceMarkup = 1.10;
};

// Throws InvalidOddsError unless odds are finite and > 1.
void validateOdds(double decimalOdds);

// Average price = 1 / (p * (1 - margin)); best price = average * markup.
MarketQuote synthesizeQuote(double modelProbability, const PricingConfig& pricing);

class OddsSource {
public:
    virtual ~OddsSource() = default;
    // nullopt means no price is known and the evaluator prices synthetically.
    virtual std::optional<MarketQuote> lookup(std::int64_t matchId) const = 0;
};

using OddsSourcePtr = std::shared_ptr<const OddsSource>;

class SyntheticOddsSource : public OddsSource {
public:
    std::optional<MarketQuote> lookup(std::int64_t matchId) const override;
};

class QuotedOddsSource : public OddsSource {
public:
    QuotedOddsSource() = default;
    explicit QuotedOddsSource(std::map<std::int64_t, MarketQuote> quotes);

    void addQuote(std::int64_t matchId, MarketQuote quote);
    std::optional<MarketQuote> lookup(std::int64_t matchId) const override;
    std::size_t size() const { return quotes_.size(); }

private:
    std::map<std::int64_t, MarketQuote> quotes_;
};

} // namespace tl
