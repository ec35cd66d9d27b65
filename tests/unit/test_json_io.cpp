/*
 * Unit tests for circuit and simulator result JSON files
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <nlohmann/json.hpp>

#include <qwire/circuit/json_io.hpp>
#include <qwire/errors.hpp>
#include <qwire/sim/result_io.hpp>

using namespace qwire::circuit;
using json = nlohmann::json;

TEST_SUITE("Circuit JSON") {
    TEST_CASE("circuit_from_json - gates and registers") {
        auto j = json::parse(R"({
            "instructions": [
                {"op": "DefinitionBit", "name": "ro", "length": 2},
                {"op": "RotateX", "qubit": 0, "theta": "theta/2"},
                {"op": "CNOT", "control": 0, "target": 1},
                {"op": "ControlledPhaseShift", "control": 1, "target": 0, "theta": 0.25},
                {"op": "PragmaRepeatedMeasurement", "readout": "ro", "number_measurements": 100,
                 "qubit_mapping": {"0": 1, "1": 0}}
            ]
        })");
        auto c = circuit_from_json(j);
        REQUIRE(c.size() == 5);

        const auto& def = std::get<Definition>(c[0]);
        CHECK(def.name == "ro");
        CHECK(def.length == 2);
        CHECK(def.kind == RegisterKind::Bit);
        CHECK(def.is_output);

        const auto& rx = std::get<GateOperation>(c[1]);
        CHECK(rx.kind == GateKind::RotateX);
        CHECK(rx.qubits == std::vector<std::size_t>{0});
        REQUIRE(rx.parameters.size() == 1);
        CHECK(rx.parameters[0].is_symbolic());
        CHECK(rx.parameters[0].expression() == "theta/2");

        const auto& cx = std::get<GateOperation>(c[2]);
        CHECK(cx.kind == GateKind::CNOT);
        CHECK(cx.qubits == std::vector<std::size_t>{0, 1});

        const auto& cp = std::get<GateOperation>(c[3]);
        CHECK(cp.qubits == std::vector<std::size_t>{1, 0});
        CHECK(cp.parameters[0].value() == 0.25);

        const auto& rep = std::get<PragmaRepeatedMeasurement>(c[4]);
        CHECK(rep.number_measurements == 100);
        REQUIRE(rep.qubit_mapping.has_value());
        CHECK(rep.qubit_mapping->at(0) == 1);
        CHECK(rep.qubit_mapping->at(1) == 0);
        CHECK(c.number_qubits() == 2);
    }

    TEST_CASE("circuit_from_json - plain array and other instructions") {
        auto j = json::parse(R"([
            {"op": "SingleQubitGate", "qubit": 2, "alpha_r": 1.0, "alpha_i": 0.0, "beta_r": 0.0, "beta_i": 0.0},
            {"op": "DefinitionComplex", "name": "psi", "length": 8, "is_output": false},
            {"op": "PragmaGetStateVector", "readout": "psi"},
            {"op": "PragmaSetStateVector", "statevector": [[1.0, 0.0], [0.0, 0.0]]},
            {"op": "InputSymbolic", "name": "theta", "value": 0.5},
            {"op": "PragmaDamping", "qubit": 0}
        ])");
        auto c = circuit_from_json(j);
        REQUIRE(c.size() == 6);
        CHECK(std::get<SingleQubitGate>(c[0]).qubit == 2);
        CHECK(std::get<SingleQubitGate>(c[0]).global_phase.value() == 0.0);
        CHECK(std::get<Definition>(c[1]).kind == RegisterKind::Complex);
        CHECK_FALSE(std::get<Definition>(c[1]).is_output);
        CHECK(std::get<PragmaGetStateVector>(c[2]).readout == "psi");
        CHECK(std::get<PragmaSetStateVector>(c[3]).amplitudes.size() == 2);
        CHECK(std::get<InputSymbolic>(c[4]).value == 0.5);
        CHECK(std::get<OpaqueOperation>(c[5]).name == "PragmaDamping");
        CHECK(name_of(c[5]) == "PragmaDamping");
    }

    TEST_CASE("circuit_from_json - malformed input") {
        CHECK_THROWS_AS(circuit_from_json(json::parse(R"({"gates": []})")), qwire::CircuitFormatError);
        CHECK_THROWS_AS(circuit_from_json(json::parse(R"({"instructions": 3})")), qwire::CircuitFormatError);

        auto bad_qubit = json::parse(R"({"instructions": [
            {"op": "Hadamard", "qubit": 0},
            {"op": "Hadamard", "qubit": "zero"}
        ]})");
        try {
            circuit_from_json(bad_qubit);
            FAIL("malformed instruction accepted");
        } catch (const qwire::CircuitFormatError& e) {
            CHECK(std::string(e.what()).find("Instruction 1") != std::string::npos);
        }

        auto same_qubits = json::parse(R"([{"op": "CNOT", "control": 1, "target": 1}])");
        CHECK_THROWS_AS(circuit_from_json(same_qubits), qwire::CircuitFormatError);

        auto empty_register = json::parse(R"([{"op": "DefinitionBit", "name": "ro", "length": 0}])");
        CHECK_THROWS_AS(circuit_from_json(empty_register), qwire::CircuitFormatError);

        auto missing_theta = json::parse(R"([{"op": "RotateZ", "qubit": 0}])");
        CHECK_THROWS_AS(circuit_from_json(missing_theta), qwire::CircuitFormatError);
    }

    TEST_CASE("circuit_to_json writes the loader's format") {
        Circuit c{ops::define_bit("ro", 2), ops::rotate_y(1, "phi"), ops::swap(0, 1),
                  ops::repeated_measurement("ro", 7, std::map<std::size_t, std::size_t>{{0, 1}})};
        auto j = circuit_to_json(c);
        REQUIRE(j.at("instructions").size() == 4);
        CHECK(j["instructions"][1] == json::parse(R"({"op": "RotateY", "qubit": 1, "theta": "phi"})"));
        CHECK(j["instructions"][2] == json::parse(R"({"op": "SWAP", "control": 0, "target": 1})"));
        CHECK(j["instructions"][3]["qubit_mapping"] == json::parse(R"({"0": 1})"));
        CHECK(circuit_to_json(circuit_from_json(j)) == j);
    }
}

TEST_SUITE("Simulator Result JSON") {
    using namespace qwire::sim;

    TEST_CASE("per-shot memory") {
        auto r = parse_simulator_result(json::parse(R"({"memory": ["01", "10", "11"]})"));
        CHECK(r.outcomes.mode == OutcomeMode::PerShot);
        CHECK(r.outcomes.shots.size() == 3);
        CHECK_FALSE(r.amplitudes.has_value());
    }

    TEST_CASE("histogram counts and state vector") {
        auto r = parse_simulator_result(json::parse(R"({
            "counts": {"00": 6, "11": 4},
            "statevector": [[0.7071067811865476, 0.0], [0.0, 0.0], [0.0, 0.0], [0.7071067811865476, 0.0]]
        })"));
        CHECK(r.outcomes.mode == OutcomeMode::Histogram);
        CHECK(r.outcomes.counts.at("00") == 6);
        CHECK(r.outcomes.counts.at("11") == 4);
        REQUIRE(r.amplitudes.has_value());
        CHECK(r.amplitudes->size() == 4);
    }

    TEST_CASE("malformed result") {
        CHECK_THROWS_AS(parse_simulator_result(json::parse(R"({"memory": [1, 2]})")), qwire::CircuitFormatError);
        CHECK_THROWS_AS(parse_simulator_result(json::parse(R"({"counts": {"0": "many"}})")),
                        qwire::CircuitFormatError);
    }

    TEST_CASE("counts must be non-negative integers") {
        CHECK_THROWS_AS(parse_simulator_result(json::parse(R"({"counts": {"01": -1}})")),
                        qwire::CircuitFormatError);
        CHECK_THROWS_AS(parse_simulator_result(json::parse(R"({"counts": {"01": 1.5}})")),
                        qwire::CircuitFormatError);
        CHECK_THROWS_AS(parse_simulator_result(json::parse(R"({"counts": ["01"]})")), qwire::CircuitFormatError);

        auto r = parse_simulator_result(json::parse(R"({"counts": {"01": 0}})"));
        CHECK(r.outcomes.counts.at("01") == 0);
    }

    TEST_CASE("decoded registers to JSON") {
        DecodedRegisters d;
        d.bits["ro"] = {{true, false}};
        d.floats["fl"] = {};
        d.complexes["psi"] = {{Complex(1.0, 0.0), Complex(0.0, -1.0)}};
        auto j = to_json(d);
        CHECK(j["bit_registers"]["ro"] == json::parse("[[true, false]]"));
        CHECK(j["float_registers"]["fl"] == json::array());
        CHECK(j["complex_registers"]["psi"] == json::parse("[[[1.0, 0.0], [0.0, -1.0]]]"));
    }
}
