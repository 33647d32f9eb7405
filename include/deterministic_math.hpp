#pragma once

#include <boost/multiprecision/cpp_dec_float.hpp>

namespace tl {

class DeterministicMath {
public:
    using HighPrecision = boost::multiprecision::cpp_dec_float_50;

    // e^(-value), rounded once to double so Poisson thresholds do not depend on libm.
    static double expNeg(double value);

private:
    static void requireNonNegative(double value);
};

} // namespace tl
