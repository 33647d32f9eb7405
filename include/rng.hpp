#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <random>

namespace tl {

class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual double uniform01() = 0;
};

// Deterministic source for reproducible analysis runs and tests.
class SeededRng : public RandomSource {
public:
    explicit SeededRng(std::uint64_t seed);
    double uniform01() override;

    std::uint64_t getSeed() const { return seed_; }
    std::uint64_t getCallCount() const { return callCount_; }

private:
    std::uint64_t seed_;
    std::uint64_t callCount_;
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> dist_;
};

using RandomSourceFactory = std::function<std::unique_ptr<RandomSource>()>;

// Every call yields a fresh SeededRng starting from the same seed.
RandomSourceFactory seededFactory(std::uint64_t seed);

// Mixes a parent seed with a stream index (match id, sub-stream) into an
// independent child seed.
std::uint64_t deriveSeed(std::uint64_t parent, std::uint64_t stream);

} // namespace tl
