#include "phasecloud/core/types.hpp"
#include "phasecloud/core/exception.h"
#include <iomanip>
#include <sstream>

namespace phasecloud {
namespace core {

FitCoefficients FitCoefficients::fromVector(const std::vector<double>& values) {
    if (values.size() != COUNT) {
        PHASECLOUD_THROW(ConfigException,
                         "Expected 5 fit coefficients (a,b,c,d,e), got " +
                         std::to_string(values.size()));
    }

    FitCoefficients coeffs;
    coeffs.a = values[0];
    coeffs.b = values[1];
    coeffs.c = values[2];
    coeffs.d = values[3];
    coeffs.e = values[4];
    return coeffs;
}

std::string FitCoefficients::toString() const {
    std::ostringstream ss;
    ss << std::setprecision(10);
    ss << "(a=" << a << ", b=" << b << ", c=" << c << ", d=" << d << ", e=" << e << ")";
    return ss.str();
}

} // namespace core
} // namespace phasecloud
