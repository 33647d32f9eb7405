#include "rng.hpp"

namespace tl {

namespace {

constexpr std::uint64_t kGoldenGamma = 0x9e3779b97f4a7c15ULL;

std::uint64_t splitMix64(std::uint64_t x) {
    x += kGoldenGamma;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

} // namespace

SeededRng::SeededRng(std::uint64_t seed)
    : seed_(seed)
    , callCount_(0)
    , engine_(seed)
    , dist_(0.0, 1.0) {}

double SeededRng::uniform01() {
    ++callCount_;
    return dist_(engine_);
}

RandomSourceFactory seededFactory(std::uint64_t seed) {
    return [seed]() -> std::unique_ptr<RandomSource> { return std::make_unique<SeededRng>(seed); };
}

std::uint64_t deriveSeed(std::uint64_t parent, std::uint64_t stream) {
    return splitMix64(splitMix64(parent) ^ (stream * kGoldenGamma));
}

} // namespace tl
