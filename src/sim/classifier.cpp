/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <qwire/sim/classifier.hpp>

#include <algorithm>
#include <map>

#include <fmt/format.h>

#include <qwire/errors.hpp>

namespace qwire::sim {

using namespace qwire::circuit;

std::size_t MeasurementMetadata::shots() const {
    std::size_t n = 0;
    for (const auto& m : repeated_measurements) n = std::max(n, m.number_measurements);
    if (n == 0) {
        for (const auto& m : measurement_counts) n = std::max(n, m.number_measurements);
    }
    return n == 0 ? 1 : n;
}

const RegisterDeclaration* ClassifiedCircuit::find_register(const std::string& name) const {
    for (const auto& reg : registers) {
        if (reg.name == name) return &reg;
    }
    return nullptr;
}

ClassifiedCircuit classify(const Circuit& circuit) {
    ClassifiedCircuit out;
    auto& meta = out.metadata;

    for (const auto& instruction : circuit) {
        if (const auto* init = std::get_if<PragmaSetStateVector>(&instruction)) {
            out.initial_state = init->amplitudes;
        } else if (const auto* rep = std::get_if<PragmaRepeatedMeasurement>(&instruction)) {
            meta.repeated_measurements.push_back({rep->readout, rep->number_measurements, rep->qubit_mapping});
            out.emittable += instruction;
        } else if (const auto* mq = std::get_if<MeasureQubit>(&instruction)) {
            meta.qubit_measurements.push_back({mq->qubit, mq->readout, mq->readout_index});
            out.emittable += instruction;
        } else if (const auto* count = std::get_if<PragmaSetNumberOfMeasurements>(&instruction)) {
            meta.measurement_counts.push_back({count->readout, count->number_measurements});
        } else if (const auto* sv = std::get_if<PragmaGetStateVector>(&instruction)) {
            meta.state_vector_requested = true;
            meta.continuous_readout = sv->readout;
        } else if (const auto* dm = std::get_if<PragmaGetDensityMatrix>(&instruction)) {
            meta.density_matrix_requested = true;
            meta.continuous_readout = dm->readout;
        } else {
            if (const auto* def = std::get_if<Definition>(&instruction)) {
                if (out.find_register(def->name) != nullptr) {
                    throw ValidationError(fmt::format("Register '{}' is defined more than once", def->name));
                }
                out.registers.push_back({def->name, def->length, def->kind, def->is_output});
            }
            out.emittable += instruction;
        }
    }

    validate(out);
    return out;
}

static const RegisterDeclaration& require_register(const ClassifiedCircuit& c, const std::string& name,
                                                   RegisterKind kind, const char* what) {
    const auto* reg = c.find_register(name);
    if (reg == nullptr || reg->kind != kind) {
        throw ValidationError(fmt::format("{} reads into '{}', which is not a defined {} register",
                                          what, name, kind == RegisterKind::Complex ? "complex" : "bit"));
    }
    return *reg;
}

void validate(const ClassifiedCircuit& classified) {
    const auto& meta = classified.metadata;

    if (!meta.repeated_measurements.empty() && !meta.qubit_measurements.empty()) {
        throw ValidationError("Only input Circuits containing one type of measurement.");
    }
    if (meta.state_vector_requested && meta.density_matrix_requested) {
        throw ValidationError(
            "The Circuit contains both a PragmaGetStateVector and a PragmaGetDensityMatrix "
            "instruction. Simulation not possible.");
    }
    if (!meta.has_measurement() && !meta.state_vector_requested && !meta.density_matrix_requested) {
        throw ValidationError(
            "The Circuit does not contain Measurement, PragmaGetStateVector or "
            "PragmaGetDensityMatrix operations. Simulation not possible.");
    }

    for (const auto& m : meta.repeated_measurements) {
        const auto& reg = require_register(classified, m.readout, RegisterKind::Bit, "PragmaRepeatedMeasurement");
        if (m.qubit_mapping) {
            std::map<std::size_t, std::size_t> owner;  // bit -> qubit
            for (const auto& [qubit, bit] : *m.qubit_mapping) {
                if (bit >= reg.length) {
                    throw ValidationError(fmt::format("Qubit {} is mapped to bit {} of '{}' (length {})",
                                                      qubit, bit, reg.name, reg.length));
                }
                auto [it, inserted] = owner.emplace(bit, qubit);
                if (!inserted) {
                    throw ValidationError(fmt::format("Qubits {} and {} are both mapped to bit {} of '{}'",
                                                      it->second, qubit, bit, reg.name));
                }
            }
        }
    }
    for (const auto& m : meta.qubit_measurements) {
        const auto& reg = require_register(classified, m.readout, RegisterKind::Bit, "MeasureQubit");
        if (m.readout_index >= reg.length) {
            throw ValidationError(fmt::format("MeasureQubit writes bit {} of '{}' (length {})",
                                              m.readout_index, reg.name, reg.length));
        }
    }
    for (const auto& m : meta.measurement_counts) {
        require_register(classified, m.readout, RegisterKind::Bit, "PragmaSetNumberOfMeasurements");
    }
    if (meta.state_vector_requested || meta.density_matrix_requested) {
        require_register(classified, meta.continuous_readout, RegisterKind::Complex,
                         meta.state_vector_requested ? "PragmaGetStateVector" : "PragmaGetDensityMatrix");
    }
}

} // namespace qwire::sim
