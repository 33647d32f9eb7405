#include "secure_random.hpp"

#include <stdexcept>

#include <sodium.h>

namespace tl {

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes) {
    std::vector<std::uint8_t> buffer(numBytes);
    if (numBytes == 0) {
        return buffer;
    }

    if (sodium_init() < 0) {
        throw std::runtime_error("Unable to initialize libsodium RNG");
    }
    randombytes_buf(buffer.data(), buffer.size());
    return buffer;
}

std::uint64_t secureRandomSeed() {
    auto bytes = secureRandomBytes(sizeof(std::uint64_t));
    std::uint64_t seed = 0;
    for (auto byte : bytes) {
        seed = (seed << 8) | byte;
    }
    sodium_memzero(bytes.data(), bytes.size());
    return seed;
}

} // namespace tl
