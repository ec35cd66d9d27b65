/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <qwire/circuit/circuit.hpp>

namespace qwire::sim {

struct RegisterDeclaration {
    std::string name;
    std::size_t length;
    circuit::RegisterKind kind;
    bool is_output;
};

struct RepeatedMeasurementInfo {
    std::string readout;
    std::size_t number_measurements;
    std::optional<std::map<std::size_t, std::size_t>> qubit_mapping;
};

struct QubitMeasurementInfo {
    std::size_t qubit;
    std::string readout;
    std::size_t readout_index;
};

struct MeasurementCountInfo {
    std::string readout;
    std::size_t number_measurements;
};

struct MeasurementMetadata {
    std::vector<RepeatedMeasurementInfo> repeated_measurements;
    std::vector<QubitMeasurementInfo> qubit_measurements;
    std::vector<MeasurementCountInfo> measurement_counts;
    bool state_vector_requested{false};
    bool density_matrix_requested{false};
    std::string continuous_readout;  // register named by the state vector / density matrix request

    bool has_measurement() const {
        return !repeated_measurements.empty() || !qubit_measurements.empty();
    }

    // Shots to request: repeated measurement count, else the largest
    // measurement-count pragma, else 1.
    std::size_t shots() const;
};

struct ClassifiedCircuit {
    circuit::Circuit emittable;
    MeasurementMetadata metadata;
    std::vector<RegisterDeclaration> registers;            // declaration order
    std::optional<std::vector<circuit::Complex>> initial_state;

    const RegisterDeclaration* find_register(const std::string& name) const;
};

/**
 * Splits a circuit into the part sent to the QASM translator and the
 * metadata the simulator run needs. Measurements stay in the emittable
 * circuit; measurement-count and state/density pragmas are dropped; a
 * state vector initialisation is lifted out into `initial_state`.
 * Runs validate() before returning.
 */
ClassifiedCircuit classify(const circuit::Circuit& circuit);

// Throws ValidationError when the circuit cannot give retrievable output.
void validate(const ClassifiedCircuit& classified);

} // namespace qwire::sim
