#include <qwire/qasm/decomposition.hpp>

#include <algorithm>
#include <cmath>

namespace qwire::qasm {

EulerAngles decompose_single_qubit(std::complex<double> alpha, std::complex<double> beta) {
    double abs_alpha = std::clamp(std::abs(alpha), -1.0, 1.0);
    double angle_alpha = -std::atan2(alpha.imag(), alpha.real());
    double angle_beta = std::atan2(beta.imag(), beta.real());

    EulerAngles angles;
    angles.theta = 2.0 * std::acos(abs_alpha);
    angles.phi = angle_alpha + angle_beta;
    angles.lambda = angle_alpha - angle_beta;
    return angles;
}

} // namespace qwire::qasm
