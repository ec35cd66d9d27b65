/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <complex>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <qwire/circuit/parameter.hpp>

namespace qwire::circuit {

using Complex = std::complex<double>;

/**
 * Gates with a fixed operand and parameter layout
 */
enum class GateKind {
    RotateX,
    RotateY,
    RotateZ,
    PhaseShiftState1,
    Hadamard,
    PauliX,
    PauliY,
    PauliZ,
    SGate,
    TGate,
    SqrtPauliX,
    InvSqrtPauliX,
    CNOT,
    ControlledPauliY,
    ControlledPauliZ,
    ControlledPhaseShift,
    MolmerSorensenXX,
    SWAP
};

// Operand layout shared by every consumer of a gate kind. Single-qubit
// gates use the slot "qubit", two-qubit gates "control" and "target";
// the parameter slot, when present, is "theta".
struct GateLayout {
    GateKind kind;
    const char* name;
    std::size_t qubit_count;
    std::size_t parameter_count;
};

const GateLayout& layout_of(GateKind kind);

struct GateOperation {
    GateKind kind;
    std::vector<std::size_t> qubits;     // slot order: qubit | control, target
    std::vector<Parameter> parameters;   // slot order: theta
};

// Generic single-qubit unitary given by its first column (alpha, beta).
struct SingleQubitGate {
    std::size_t qubit;
    Parameter alpha_r;
    Parameter alpha_i;
    Parameter beta_r;
    Parameter beta_i;
    Parameter global_phase{0.0};
};

struct MeasureQubit {
    std::size_t qubit;
    std::string readout;
    std::size_t readout_index;
};

// Measures every qubit; the optional mapping sends qubit -> readout bit.
struct PragmaRepeatedMeasurement {
    std::string readout;
    std::size_t number_measurements;
    std::optional<std::map<std::size_t, std::size_t>> qubit_mapping;
};

enum class RegisterKind { Bit, Float, Complex };

struct Definition {
    std::string name;
    std::size_t length;
    RegisterKind kind{RegisterKind::Bit};
    bool is_output{true};
};

struct PragmaSetNumberOfMeasurements {
    std::size_t number_measurements;
    std::string readout;
};

struct PragmaSetStateVector {
    std::vector<Complex> amplitudes;
};

struct PragmaGetStateVector {
    std::string readout;
};

struct PragmaGetDensityMatrix {
    std::string readout;
};

struct InputSymbolic {
    std::string name;
    double value;
};

// Anything the codec has no model for. Kept so it can be rejected loudly.
struct OpaqueOperation {
    std::string name;
};

using Instruction = std::variant<
    GateOperation,
    SingleQubitGate,
    MeasureQubit,
    PragmaRepeatedMeasurement,
    Definition,
    PragmaSetNumberOfMeasurements,
    PragmaSetStateVector,
    PragmaGetStateVector,
    PragmaGetDensityMatrix,
    InputSymbolic,
    OpaqueOperation>;

// Instruction name as used in circuit files and error messages ("RotateX", "DefinitionBit").
std::string name_of(const Instruction& instruction);
std::string name_of(GateKind kind);
std::optional<GateKind> gate_kind_from_name(const std::string& name);

std::vector<std::size_t> involved_qubits(const Instruction& instruction);

namespace ops {

Instruction rotate_x(std::size_t qubit, Parameter theta);
Instruction rotate_y(std::size_t qubit, Parameter theta);
Instruction rotate_z(std::size_t qubit, Parameter theta);
Instruction phase_shift(std::size_t qubit, Parameter theta);
Instruction hadamard(std::size_t qubit);
Instruction pauli_x(std::size_t qubit);
Instruction pauli_y(std::size_t qubit);
Instruction pauli_z(std::size_t qubit);
Instruction s_gate(std::size_t qubit);
Instruction t_gate(std::size_t qubit);
Instruction sqrt_pauli_x(std::size_t qubit);
Instruction inv_sqrt_pauli_x(std::size_t qubit);
Instruction cnot(std::size_t control, std::size_t target);
Instruction controlled_pauli_y(std::size_t control, std::size_t target);
Instruction controlled_pauli_z(std::size_t control, std::size_t target);
Instruction controlled_phase_shift(std::size_t control, std::size_t target, Parameter theta);
Instruction molmer_sorensen_xx(std::size_t control, std::size_t target);
Instruction swap(std::size_t control, std::size_t target);

Instruction single_qubit_gate(std::size_t qubit, Parameter alpha_r, Parameter alpha_i,
                              Parameter beta_r, Parameter beta_i, Parameter global_phase = 0.0);
Instruction measure_qubit(std::size_t qubit, std::string readout, std::size_t readout_index);
Instruction repeated_measurement(std::string readout, std::size_t number_measurements,
                                 std::optional<std::map<std::size_t, std::size_t>> qubit_mapping = std::nullopt);
Instruction define_bit(std::string name, std::size_t length, bool is_output = true);
Instruction define_float(std::string name, std::size_t length, bool is_output = true);
Instruction define_complex(std::string name, std::size_t length, bool is_output = true);
Instruction set_number_of_measurements(std::size_t number_measurements, std::string readout);
Instruction set_state_vector(std::vector<Complex> amplitudes);
Instruction get_state_vector(std::string readout);
Instruction get_density_matrix(std::string readout);
Instruction input_symbolic(std::string name, double value);

// Gate by kind with explicit operand lists; checks the operand and parameter counts.
Instruction gate(GateKind kind, std::vector<std::size_t> qubits, std::vector<Parameter> parameters = {});

} // namespace ops

} // namespace qwire::circuit
