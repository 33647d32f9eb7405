#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tl {

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes);

// Fresh batch seed for runs where the operator did not pin one.
std::uint64_t secureRandomSeed();

} // namespace tl
