#pragma once

#include <complex>

namespace qwire::qasm {

struct EulerAngles {
    double theta;
    double phi;
    double lambda;
};

// Angles of u3(theta, phi, lambda) for the unitary whose first column is
// (alpha, beta). Unit norm of the column is the caller's responsibility.
EulerAngles decompose_single_qubit(std::complex<double> alpha, std::complex<double> beta);

} // namespace qwire::qasm
