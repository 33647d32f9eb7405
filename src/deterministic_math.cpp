#include "deterministic_math.hpp"

#include <cmath>
#include <stdexcept>

namespace tl {

void DeterministicMath::requireNonNegative(double value) {
    if (!std::isfinite(value)) {
        throw std::domain_error("Deterministic exp requires a finite argument");
    }
    if (value < 0.0) {
        throw std::domain_error("Deterministic exp requires a non-negative argument");
    }
}

double DeterministicMath::expNeg(double value) {
    requireNonNegative(value);
    if (value == 0.0) {
        return 1.0;
    }
    HighPrecision hpValue = HighPrecision(value);
    HighPrecision result = boost::multiprecision::exp(-hpValue);
    return static_cast<double>(result);
}

} // namespace tl
