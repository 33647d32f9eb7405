#include "analysis.hpp"
#include "config.hpp"
#include "rng.hpp"
#include "secure_random.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void usage() {
    std::cerr << "Usage: generate_seeds [count]\n"
              << "       generate_seeds --derive <batchSeed> <matchId> [matchId...]\n";
}

// Reproduces the per-match seeds a batch run with batchSeed hands to its workers.
int printDerived(int argc, char* argv[]) {
    if (argc < 4) {
        usage();
        return 1;
    }
    const std::uint64_t batchSeed = tl::parseUnsignedSetting("batchSeed", argv[2]);
    std::cout << "batch " << batchSeed << '\n';
    for (int i = 3; i < argc; ++i) {
        const std::uint64_t matchId = tl::parseUnsignedSetting("matchId", argv[i]);
        const std::uint64_t matchSeed = tl::deriveSeed(batchSeed, matchId);
        std::cout << "match " << matchId << ": seed " << matchSeed
                  << " rates " << tl::deriveSeed(matchSeed, tl::kRateStream)
                  << " simulation " << tl::deriveSeed(matchSeed, tl::kSimulationStream) << '\n';
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        if (argc > 1 && std::string(argv[1]) == "--derive") {
            return printDerived(argc, argv);
        }

        std::uint64_t count = 1;
        if (argc > 2) {
            usage();
            return 1;
        }
        if (argc == 2) {
            count = tl::parseUnsignedSetting("count", argv[1]);
            if (count == 0) {
                std::cerr << "count must be positive\n";
                return 1;
            }
        }
        for (std::uint64_t i = 0; i < count; ++i) {
            std::cout << tl::secureRandomSeed() << '\n';
        }
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }
    return 0;
}
