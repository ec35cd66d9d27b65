#pragma once

#include <optional>
#include <string_view>

#include <qwire/circuit/instruction.hpp>

namespace qwire::qasm {

// QASM rendering rule for a fixed-layout gate. Operands are emitted in
// the slot order of circuit::layout_of(kind); a fixed parameter, when
// present, takes the place of the (absent) theta slot.
struct GateTranslation {
    circuit::GateKind kind;
    std::string_view mnemonic;
    bool has_fixed_parameter;
    double fixed_parameter;
};

const GateTranslation& translation_of(circuit::GateKind kind);

// Gate kind a plain mnemonic ("h", "cx", "rz") reads back as. Entries
// carrying a fixed parameter are never matched, so "rx" is RotateX.
std::optional<circuit::GateKind> kind_from_mnemonic(std::string_view mnemonic);

} // namespace qwire::qasm
