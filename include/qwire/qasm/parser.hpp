/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <string>

#include <qwire/circuit/circuit.hpp>

namespace qwire::qasm {

/**
 * Reads an OpenQASM 2.0 program back into a circuit.
 *
 * Covers what the backend writes: the header, qreg and creg
 * declarations, the gates of the gate table plus sx, sxdg and the u1, u2
 * and u3 forms, and measurements. Qubit operands of several qregs are
 * numbered consecutively in declaration order. A bare `measure q -> c`
 * becomes a repeated measurement of one shot. Parameters are evaluated
 * with pi known; expressions naming other variables stay symbolic.
 * `barrier` is accepted and dropped.
 *
 * Throws CircuitFormatError on malformed text and
 * UnsupportedOperationError for statements with no instruction
 * counterpart (gate definitions, reset, conditionals, unknown gates).
 */
circuit::Circuit string_to_circuit(const std::string& text);

// Throws CircuitFormatError when the file cannot be read.
circuit::Circuit file_to_circuit(const std::string& path);

} // namespace qwire::qasm
