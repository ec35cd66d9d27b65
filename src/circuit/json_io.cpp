#include <qwire/circuit/json_io.hpp>

#include <stdexcept>
#include <type_traits>

#include <fmt/format.h>

#include <qwire/errors.hpp>

using json = nlohmann::json;

namespace qwire::circuit {

namespace {

Parameter parameter_from_json(const json& j) {
    if (j.is_number()) return Parameter(j.get<double>());
    return Parameter(j.get<std::string>());
}

json parameter_to_json(const Parameter& p) {
    if (p.is_symbolic()) return p.expression();
    return p.value();
}

RegisterKind register_kind_from_op(const std::string& op) {
    if (op == "DefinitionFloat") return RegisterKind::Float;
    if (op == "DefinitionComplex") return RegisterKind::Complex;
    return RegisterKind::Bit;
}

const char* const kQubitSlots[2][2] = {{"qubit", nullptr}, {"control", "target"}};

} // namespace

std::vector<Complex> amplitudes_from_json(const json& j) {
    std::vector<Complex> out;
    for (const auto& a : j) {
        if (a.is_number()) out.emplace_back(a.get<double>(), 0.0);
        else out.emplace_back(a.at(0).get<double>(), a.at(1).get<double>());
    }
    return out;
}

json amplitudes_to_json(const std::vector<Complex>& amplitudes) {
    json out = json::array();
    for (const auto& a : amplitudes) out.push_back(json::array({a.real(), a.imag()}));
    return out;
}

Instruction instruction_from_json(const json& j) {
    const std::string op = j.at("op").get<std::string>();

    if (auto kind = gate_kind_from_name(op)) {
        const auto& layout = layout_of(*kind);
        std::vector<std::size_t> qubits;
        for (std::size_t i = 0; i < layout.qubit_count; ++i) {
            qubits.push_back(j.at(kQubitSlots[layout.qubit_count - 1][i]).get<std::size_t>());
        }
        std::vector<Parameter> params;
        if (layout.parameter_count == 1) params.push_back(parameter_from_json(j.at("theta")));
        return ops::gate(*kind, std::move(qubits), std::move(params));
    }
    if (op == "SingleQubitGate") {
        return ops::single_qubit_gate(j.at("qubit").get<std::size_t>(),
                                      parameter_from_json(j.at("alpha_r")), parameter_from_json(j.at("alpha_i")),
                                      parameter_from_json(j.at("beta_r")), parameter_from_json(j.at("beta_i")),
                                      parameter_from_json(j.value("global_phase", json(0.0))));
    }
    if (op == "MeasureQubit") {
        return ops::measure_qubit(j.at("qubit").get<std::size_t>(), j.at("readout").get<std::string>(),
                                  j.at("readout_index").get<std::size_t>());
    }
    if (op == "PragmaRepeatedMeasurement") {
        std::optional<std::map<std::size_t, std::size_t>> mapping;
        if (j.contains("qubit_mapping") && !j.at("qubit_mapping").is_null()) {
            mapping.emplace();
            for (const auto& el : j.at("qubit_mapping").items()) {
                mapping->emplace(std::stoul(el.key()), el.value().get<std::size_t>());
            }
        }
        return ops::repeated_measurement(j.at("readout").get<std::string>(),
                                         j.at("number_measurements").get<std::size_t>(), std::move(mapping));
    }
    if (op == "DefinitionBit" || op == "DefinitionFloat" || op == "DefinitionComplex") {
        auto name = j.at("name").get<std::string>();
        auto length = j.at("length").get<std::size_t>();
        bool is_output = j.value("is_output", true);
        switch (register_kind_from_op(op)) {
            case RegisterKind::Float: return ops::define_float(std::move(name), length, is_output);
            case RegisterKind::Complex: return ops::define_complex(std::move(name), length, is_output);
            case RegisterKind::Bit: break;
        }
        return ops::define_bit(std::move(name), length, is_output);
    }
    if (op == "PragmaSetNumberOfMeasurements") {
        return ops::set_number_of_measurements(j.at("number_measurements").get<std::size_t>(),
                                               j.at("readout").get<std::string>());
    }
    if (op == "PragmaSetStateVector") return ops::set_state_vector(amplitudes_from_json(j.at("statevector")));
    if (op == "PragmaGetStateVector") return ops::get_state_vector(j.at("readout").get<std::string>());
    if (op == "PragmaGetDensityMatrix") return ops::get_density_matrix(j.at("readout").get<std::string>());
    if (op == "InputSymbolic") return ops::input_symbolic(j.at("name").get<std::string>(), j.at("value").get<double>());
    return OpaqueOperation{op};
}

json instruction_to_json(const Instruction& instruction) {
    json j;
    j["op"] = name_of(instruction);
    std::visit([&j](const auto& op) {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, GateOperation>) {
            const auto& layout = layout_of(op.kind);
            for (std::size_t i = 0; i < op.qubits.size(); ++i) j[kQubitSlots[layout.qubit_count - 1][i]] = op.qubits[i];
            if (!op.parameters.empty()) j["theta"] = parameter_to_json(op.parameters[0]);
        } else if constexpr (std::is_same_v<T, SingleQubitGate>) {
            j["qubit"] = op.qubit;
            j["alpha_r"] = parameter_to_json(op.alpha_r);
            j["alpha_i"] = parameter_to_json(op.alpha_i);
            j["beta_r"] = parameter_to_json(op.beta_r);
            j["beta_i"] = parameter_to_json(op.beta_i);
            j["global_phase"] = parameter_to_json(op.global_phase);
        } else if constexpr (std::is_same_v<T, MeasureQubit>) {
            j["qubit"] = op.qubit;
            j["readout"] = op.readout;
            j["readout_index"] = op.readout_index;
        } else if constexpr (std::is_same_v<T, PragmaRepeatedMeasurement>) {
            j["readout"] = op.readout;
            j["number_measurements"] = op.number_measurements;
            if (op.qubit_mapping) {
                json mapping = json::object();
                for (const auto& [qubit, bit] : *op.qubit_mapping) mapping[std::to_string(qubit)] = bit;
                j["qubit_mapping"] = mapping;
            }
        } else if constexpr (std::is_same_v<T, Definition>) {
            j["name"] = op.name;
            j["length"] = op.length;
            j["is_output"] = op.is_output;
        } else if constexpr (std::is_same_v<T, PragmaSetNumberOfMeasurements>) {
            j["number_measurements"] = op.number_measurements;
            j["readout"] = op.readout;
        } else if constexpr (std::is_same_v<T, PragmaSetStateVector>) {
            j["statevector"] = amplitudes_to_json(op.amplitudes);
        } else if constexpr (std::is_same_v<T, PragmaGetStateVector> || std::is_same_v<T, PragmaGetDensityMatrix>) {
            j["readout"] = op.readout;
        } else if constexpr (std::is_same_v<T, InputSymbolic>) {
            j["name"] = op.name;
            j["value"] = op.value;
        }
    }, instruction);
    return j;
}

Circuit circuit_from_json(const json& j) {
    Circuit c;
    if (!j.is_array() && !(j.is_object() && j.contains("instructions"))) {
        throw CircuitFormatError("Circuit JSON needs an \"instructions\" array");
    }
    const auto& list = j.is_array() ? j : j.at("instructions");
    if (!list.is_array()) throw CircuitFormatError("\"instructions\" must be an array");
    std::size_t index = 0;
    for (const auto& entry : list) {
        try {
            c += instruction_from_json(entry);
        } catch (const json::exception& e) {
            throw CircuitFormatError(fmt::format("Instruction {}: {}", index, e.what()));
        } catch (const std::logic_error& e) {
            throw CircuitFormatError(fmt::format("Instruction {}: {}", index, e.what()));
        }
        ++index;
    }
    return c;
}

json circuit_to_json(const Circuit& circuit) {
    json list = json::array();
    for (const auto& instruction : circuit) list.push_back(instruction_to_json(instruction));
    return json{{"instructions", list}};
}

} // namespace qwire::circuit
