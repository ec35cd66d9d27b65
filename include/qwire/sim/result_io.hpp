#pragma once

#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include <qwire/sim/decoder.hpp>

namespace qwire::sim {

struct SimulatorResult {
    RawOutcomes outcomes;
    std::optional<std::vector<circuit::Complex>> amplitudes;
};

// {"memory": [...]} or {"counts": {...}}, optionally "statevector" /
// "density_matrix" as [[re, im], ...]. Throws CircuitFormatError.
SimulatorResult parse_simulator_result(const nlohmann::json& j);

nlohmann::json to_json(const DecodedRegisters& decoded);

} // namespace qwire::sim
