#pragma once

#include <nlohmann/json.hpp>

#include <qwire/circuit/circuit.hpp>

namespace qwire::circuit {

// {"instructions": [{"op": "CNOT", "control": 0, "target": 1}, ...]}
// Unknown "op" names load as OpaqueOperation; malformed entries throw
// CircuitFormatError naming the offending index.
Circuit circuit_from_json(const nlohmann::json& j);
nlohmann::json circuit_to_json(const Circuit& circuit);

Instruction instruction_from_json(const nlohmann::json& j);
nlohmann::json instruction_to_json(const Instruction& instruction);

// [[re, im], ...]
std::vector<Complex> amplitudes_from_json(const nlohmann::json& j);
nlohmann::json amplitudes_to_json(const std::vector<Complex>& amplitudes);

} // namespace qwire::circuit
