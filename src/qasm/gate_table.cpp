#include <qwire/qasm/gate_table.hpp>

#include <array>
#include <stdexcept>

namespace qwire::qasm {

using circuit::GateKind;

namespace {

constexpr double kHalfPi = 1.57079632679489661923;

constexpr std::array<GateTranslation, 18> kGateTable{{
    {GateKind::RotateX, "rx", false, 0.0},
    {GateKind::RotateY, "ry", false, 0.0},
    {GateKind::RotateZ, "rz", false, 0.0},
    {GateKind::PhaseShiftState1, "p", false, 0.0},
    {GateKind::Hadamard, "h", false, 0.0},
    {GateKind::PauliX, "x", false, 0.0},
    {GateKind::PauliY, "y", false, 0.0},
    {GateKind::PauliZ, "z", false, 0.0},
    {GateKind::SGate, "s", false, 0.0},
    {GateKind::TGate, "t", false, 0.0},
    {GateKind::SqrtPauliX, "rx", true, kHalfPi},
    {GateKind::InvSqrtPauliX, "rx", true, -kHalfPi},
    {GateKind::CNOT, "cx", false, 0.0},
    {GateKind::ControlledPauliY, "cy", false, 0.0},
    {GateKind::ControlledPauliZ, "cz", false, 0.0},
    {GateKind::ControlledPhaseShift, "cp", false, 0.0},
    {GateKind::MolmerSorensenXX, "rxx(pi/2)", false, 0.0},
    {GateKind::SWAP, "swap", false, 0.0},
}};

} // namespace

const GateTranslation& translation_of(GateKind kind) {
    for (const auto& entry : kGateTable) {
        if (entry.kind == kind) return entry;
    }
    throw std::invalid_argument("Gate kind has no QASM translation");
}

std::optional<GateKind> kind_from_mnemonic(std::string_view mnemonic) {
    for (const auto& entry : kGateTable) {
        if (!entry.has_fixed_parameter && entry.mnemonic == mnemonic) return entry.kind;
    }
    return std::nullopt;
}

} // namespace qwire::qasm
