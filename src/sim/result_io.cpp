#include <qwire/sim/result_io.hpp>

#include <fmt/format.h>

#include <qwire/circuit/json_io.hpp>
#include <qwire/errors.hpp>

using json = nlohmann::json;

namespace qwire::sim {

SimulatorResult parse_simulator_result(const json& j) {
    SimulatorResult result;
    try {
        if (j.contains("memory")) {
            result.outcomes.mode = OutcomeMode::PerShot;
            result.outcomes.shots = j.at("memory").get<std::vector<std::string>>();
        } else if (j.contains("counts")) {
            result.outcomes.mode = OutcomeMode::Histogram;
            const auto& counts = j.at("counts");
            if (!counts.is_object()) throw CircuitFormatError("Malformed simulator result: counts must be an object");
            for (const auto& el : counts.items()) {
                if (!el.value().is_number_unsigned()) {
                    throw CircuitFormatError(fmt::format(
                        "Malformed simulator result: count for '{}' must be a non-negative integer, got {}",
                        el.key(), el.value().dump()));
                }
                result.outcomes.counts[el.key()] = el.value().get<std::size_t>();
            }
        }
        for (const char* key : {"statevector", "density_matrix"}) {
            if (j.contains(key)) result.amplitudes = circuit::amplitudes_from_json(j.at(key));
        }
    } catch (const json::exception& e) {
        throw CircuitFormatError(fmt::format("Malformed simulator result: {}", e.what()));
    }
    return result;
}

json to_json(const DecodedRegisters& decoded) {
    json complexes = json::object();
    for (const auto& [name, entries] : decoded.complexes) {
        json list = json::array();
        for (const auto& amplitudes : entries) list.push_back(circuit::amplitudes_to_json(amplitudes));
        complexes[name] = list;
    }
    return json{
        {"bit_registers", decoded.bits},
        {"float_registers", decoded.floats},
        {"complex_registers", complexes},
    };
}

} // namespace qwire::sim
