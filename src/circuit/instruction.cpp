/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <qwire/circuit/instruction.hpp>

#include <array>
#include <stdexcept>
#include <type_traits>

#include <fmt/format.h>

namespace qwire::circuit {

namespace {

constexpr std::array<GateLayout, 18> kGateLayouts{{
    {GateKind::RotateX, "RotateX", 1, 1},
    {GateKind::RotateY, "RotateY", 1, 1},
    {GateKind::RotateZ, "RotateZ", 1, 1},
    {GateKind::PhaseShiftState1, "PhaseShiftState1", 1, 1},
    {GateKind::Hadamard, "Hadamard", 1, 0},
    {GateKind::PauliX, "PauliX", 1, 0},
    {GateKind::PauliY, "PauliY", 1, 0},
    {GateKind::PauliZ, "PauliZ", 1, 0},
    {GateKind::SGate, "SGate", 1, 0},
    {GateKind::TGate, "TGate", 1, 0},
    {GateKind::SqrtPauliX, "SqrtPauliX", 1, 0},
    {GateKind::InvSqrtPauliX, "InvSqrtPauliX", 1, 0},
    {GateKind::CNOT, "CNOT", 2, 0},
    {GateKind::ControlledPauliY, "ControlledPauliY", 2, 0},
    {GateKind::ControlledPauliZ, "ControlledPauliZ", 2, 0},
    {GateKind::ControlledPhaseShift, "ControlledPhaseShift", 2, 1},
    {GateKind::MolmerSorensenXX, "MolmerSorensenXX", 2, 0},
    {GateKind::SWAP, "SWAP", 2, 0},
}};

const char* register_suffix(RegisterKind kind) {
    switch (kind) {
        case RegisterKind::Bit: return "Bit";
        case RegisterKind::Float: return "Float";
        case RegisterKind::Complex: return "Complex";
    }
    return "Bit";
}

} // namespace

const GateLayout& layout_of(GateKind kind) {
    for (const auto& layout : kGateLayouts) {
        if (layout.kind == kind) return layout;
    }
    throw std::invalid_argument("Unknown gate kind");
}

std::string name_of(GateKind kind) { return layout_of(kind).name; }

std::optional<GateKind> gate_kind_from_name(const std::string& name) {
    for (const auto& layout : kGateLayouts) {
        if (name == layout.name) return layout.kind;
    }
    return std::nullopt;
}

std::string name_of(const Instruction& instruction) {
    return std::visit([](const auto& op) -> std::string {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, GateOperation>) return name_of(op.kind);
        else if constexpr (std::is_same_v<T, SingleQubitGate>) return "SingleQubitGate";
        else if constexpr (std::is_same_v<T, MeasureQubit>) return "MeasureQubit";
        else if constexpr (std::is_same_v<T, PragmaRepeatedMeasurement>) return "PragmaRepeatedMeasurement";
        else if constexpr (std::is_same_v<T, Definition>) return std::string("Definition") + register_suffix(op.kind);
        else if constexpr (std::is_same_v<T, PragmaSetNumberOfMeasurements>) return "PragmaSetNumberOfMeasurements";
        else if constexpr (std::is_same_v<T, PragmaSetStateVector>) return "PragmaSetStateVector";
        else if constexpr (std::is_same_v<T, PragmaGetStateVector>) return "PragmaGetStateVector";
        else if constexpr (std::is_same_v<T, PragmaGetDensityMatrix>) return "PragmaGetDensityMatrix";
        else if constexpr (std::is_same_v<T, InputSymbolic>) return "InputSymbolic";
        else return op.name;
    }, instruction);
}

std::vector<std::size_t> involved_qubits(const Instruction& instruction) {
    if (const auto* g = std::get_if<GateOperation>(&instruction)) return g->qubits;
    if (const auto* u = std::get_if<SingleQubitGate>(&instruction)) return {u->qubit};
    if (const auto* m = std::get_if<MeasureQubit>(&instruction)) return {m->qubit};
    if (const auto* r = std::get_if<PragmaRepeatedMeasurement>(&instruction)) {
        std::vector<std::size_t> qubits;
        if (r->qubit_mapping) {
            for (const auto& [qubit, bit] : *r->qubit_mapping) qubits.push_back(qubit);
        }
        return qubits;
    }
    return {};
}

namespace ops {

Instruction gate(GateKind kind, std::vector<std::size_t> qubits, std::vector<Parameter> parameters) {
    const auto& layout = layout_of(kind);
    if (qubits.size() != layout.qubit_count) {
        throw std::invalid_argument(fmt::format("{} acts on {} qubit(s), got {}",
                                                layout.name, layout.qubit_count, qubits.size()));
    }
    if (parameters.size() != layout.parameter_count) {
        throw std::invalid_argument(fmt::format("{} takes {} parameter(s), got {}",
                                                layout.name, layout.parameter_count, parameters.size()));
    }
    if (qubits.size() == 2 && qubits[0] == qubits[1]) {
        throw std::invalid_argument(fmt::format("{} needs two distinct qubits", layout.name));
    }
    return GateOperation{kind, std::move(qubits), std::move(parameters)};
}

Instruction rotate_x(std::size_t qubit, Parameter theta) { return gate(GateKind::RotateX, {qubit}, {std::move(theta)}); }
Instruction rotate_y(std::size_t qubit, Parameter theta) { return gate(GateKind::RotateY, {qubit}, {std::move(theta)}); }
Instruction rotate_z(std::size_t qubit, Parameter theta) { return gate(GateKind::RotateZ, {qubit}, {std::move(theta)}); }
Instruction phase_shift(std::size_t qubit, Parameter theta) { return gate(GateKind::PhaseShiftState1, {qubit}, {std::move(theta)}); }
Instruction hadamard(std::size_t qubit) { return gate(GateKind::Hadamard, {qubit}); }
Instruction pauli_x(std::size_t qubit) { return gate(GateKind::PauliX, {qubit}); }
Instruction pauli_y(std::size_t qubit) { return gate(GateKind::PauliY, {qubit}); }
Instruction pauli_z(std::size_t qubit) { return gate(GateKind::PauliZ, {qubit}); }
Instruction s_gate(std::size_t qubit) { return gate(GateKind::SGate, {qubit}); }
Instruction t_gate(std::size_t qubit) { return gate(GateKind::TGate, {qubit}); }
Instruction sqrt_pauli_x(std::size_t qubit) { return gate(GateKind::SqrtPauliX, {qubit}); }
Instruction inv_sqrt_pauli_x(std::size_t qubit) { return gate(GateKind::InvSqrtPauliX, {qubit}); }
Instruction cnot(std::size_t control, std::size_t target) { return gate(GateKind::CNOT, {control, target}); }
Instruction controlled_pauli_y(std::size_t control, std::size_t target) { return gate(GateKind::ControlledPauliY, {control, target}); }
Instruction controlled_pauli_z(std::size_t control, std::size_t target) { return gate(GateKind::ControlledPauliZ, {control, target}); }
Instruction controlled_phase_shift(std::size_t control, std::size_t target, Parameter theta) {
    return gate(GateKind::ControlledPhaseShift, {control, target}, {std::move(theta)});
}
Instruction molmer_sorensen_xx(std::size_t control, std::size_t target) { return gate(GateKind::MolmerSorensenXX, {control, target}); }
Instruction swap(std::size_t control, std::size_t target) { return gate(GateKind::SWAP, {control, target}); }

Instruction single_qubit_gate(std::size_t qubit, Parameter alpha_r, Parameter alpha_i,
                              Parameter beta_r, Parameter beta_i, Parameter global_phase) {
    return SingleQubitGate{qubit, std::move(alpha_r), std::move(alpha_i),
                           std::move(beta_r), std::move(beta_i), std::move(global_phase)};
}

Instruction measure_qubit(std::size_t qubit, std::string readout, std::size_t readout_index) {
    return MeasureQubit{qubit, std::move(readout), readout_index};
}

Instruction repeated_measurement(std::string readout, std::size_t number_measurements,
                                 std::optional<std::map<std::size_t, std::size_t>> qubit_mapping) {
    return PragmaRepeatedMeasurement{std::move(readout), number_measurements, std::move(qubit_mapping)};
}

static Instruction define(std::string name, std::size_t length, RegisterKind kind, bool is_output) {
    if (length == 0) throw std::invalid_argument("Register '" + name + "' must have a positive length");
    return Definition{std::move(name), length, kind, is_output};
}

Instruction define_bit(std::string name, std::size_t length, bool is_output) {
    return define(std::move(name), length, RegisterKind::Bit, is_output);
}
Instruction define_float(std::string name, std::size_t length, bool is_output) {
    return define(std::move(name), length, RegisterKind::Float, is_output);
}
Instruction define_complex(std::string name, std::size_t length, bool is_output) {
    return define(std::move(name), length, RegisterKind::Complex, is_output);
}

Instruction set_number_of_measurements(std::size_t number_measurements, std::string readout) {
    return PragmaSetNumberOfMeasurements{number_measurements, std::move(readout)};
}

Instruction set_state_vector(std::vector<Complex> amplitudes) {
    return PragmaSetStateVector{std::move(amplitudes)};
}

Instruction get_state_vector(std::string readout) { return PragmaGetStateVector{std::move(readout)}; }
Instruction get_density_matrix(std::string readout) { return PragmaGetDensityMatrix{std::move(readout)}; }
Instruction input_symbolic(std::string name, double value) { return InputSymbolic{std::move(name), value}; }

} // namespace ops

} // namespace qwire::circuit
