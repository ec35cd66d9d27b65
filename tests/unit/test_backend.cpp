/*
 * Unit tests for the OpenQASM document backend
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include <qwire/errors.hpp>
#include <qwire/qasm/backend.hpp>
#include <qwire/sim/classifier.hpp>
#include <qwire/sim/decoder.hpp>

using namespace qwire::circuit;
using namespace qwire::qasm;
namespace fs = std::filesystem;

namespace {

const std::string kHeader = "OPENQASM 2.0;\ninclude \"qelib1.inc\";\n\n";

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Records every message so tests can look at what the backend logged.
class RecordingLogger : public qwire::logging::Logger {
public:
    void info(std::string_view msg) override { lines.emplace_back(msg); }
    void warn(std::string_view msg) override { lines.emplace_back(msg); }
    void error(std::string_view msg) override { lines.emplace_back(msg); }
    void debug(std::string_view msg) override { lines.emplace_back(msg); }
    std::vector<std::string> lines;
};

} // namespace

TEST_SUITE("QASM Backend") {
    TEST_CASE("bell circuit end to end") {
        Circuit c{ops::hadamard(0), ops::cnot(0, 1), ops::define_bit("ro", 2), ops::repeated_measurement("ro", 10)};
        auto classified = qwire::sim::classify(c);

        QasmBackend backend(BackendOptions{});
        CHECK(backend.circuit_to_qasm_str(classified.emittable) ==
              kHeader +
                  "qreg q[2];\n"
                  "creg ro[2];\n"
                  "h q[0];\n"
                  "cx q[0],q[1];\n"
                  "measure q -> ro;\n");

        std::vector<std::string> shots(classified.metadata.shots(), "00");
        auto decoded = qwire::sim::decode_shots(shots, classified.registers);
        CHECK(decoded.bits.at("ro") == std::vector<std::vector<bool>>(10, std::vector<bool>{false, false}));
    }

    TEST_CASE("register declarations are hoisted") {
        Circuit c{ops::rotate_x(0, 0.5), ops::define_bit("ro", 1), ops::measure_qubit(0, "ro", 0)};
        QasmBackend backend(BackendOptions{});
        auto lines = backend.circuit_to_qasm_lines(c);
        std::vector<std::string> expected{"OPENQASM 2.0;", "include \"qelib1.inc\";", "", "qreg q[1];",
                                          "creg ro[1];", "rx(0.5) q[0];", "measure q[0] -> ro[0];"};
        CHECK(lines == expected);
    }

    TEST_CASE("qubit count") {
        BackendOptions opt;
        SUBCASE("empty circuit still declares one qubit") {
            QasmBackend backend(opt);
            CHECK(backend.circuit_to_qasm_str(Circuit{}) == kHeader + "qreg q[1];\n");
        }
        SUBCASE("explicit size") {
            opt.number_qubits = 4;
            QasmBackend backend(opt);
            CHECK(backend.circuit_to_qasm_lines(Circuit{ops::hadamard(0)})[3] == "qreg q[4];");
        }
        SUBCASE("explicit size too small") {
            opt.number_qubits = 1;
            QasmBackend backend(opt);
            CHECK_THROWS_AS(backend.circuit_to_qasm_str(Circuit{ops::cnot(0, 1)}), qwire::ValidationError);
        }
    }

    TEST_CASE("custom register and qubit names") {
        BackendOptions opt;
        opt.qureg_name = "qr";
        QasmBackend backend(opt);
        auto lines = backend.circuit_to_qasm_lines(Circuit{ops::hadamard(1)});
        CHECK(lines[3] == "qreg qr[2];");
        CHECK(lines[4] == "h qr[1];");

        BackendOptions named;
        named.qubit_names = QubitNameMap{{0, "qr[1]"}, {1, "qr[0]"}};
        QasmBackend swapped(named);
        CHECK(swapped.circuit_to_qasm_lines(Circuit{ops::cnot(0, 1)})[4] == "cx qr[1],qr[0];");
    }

    TEST_CASE("symbol definitions seed the resolver") {
        Circuit c{ops::input_symbolic("theta", 0.5), ops::rotate_x(0, "theta*2")};
        {
            QasmBackend backend(BackendOptions{});
            CHECK(backend.circuit_to_qasm_lines(c).back() == "rx(1.0) q[0];");
        }
        {
            BackendOptions opt;
            opt.substitutions = {{"theta", 1.0}};
            QasmBackend backend(opt);
            CHECK(backend.circuit_to_qasm_lines(c).back() == "rx(2.0) q[0];");
        }
        QasmBackend backend(BackendOptions{});
        CHECK_THROWS_AS(backend.circuit_to_qasm_str(Circuit{ops::rotate_x(0, "phi")}), qwire::ParameterError);
    }

    TEST_CASE("symbolic mode and rebinding") {
        BackendOptions opt;
        opt.use_symbolic = true;
        RecordingLogger log;
        QasmBackend backend(opt, log);

        Circuit c{ops::rotate_z(0, "theta"), ops::hadamard(0), ops::rotate_x(1, "theta/2")};
        auto lines = backend.circuit_to_qasm_lines(c);
        CHECK(backend.symbolic_cache().size() == 2);
        auto token = SymbolicCache::token_for(SymbolicCache::hash("theta"));
        CHECK(lines[4] == "rz(" + token + ") q[0];");

        qwire::calculator::Calculator values;
        values.set("theta", 0.25);
        auto bound = backend.bind_symbols(lines, values);
        CHECK(bound[4] == "rz(0.25) q[0];");
        CHECK(bound[5] == "h q[0];");
        CHECK(bound[6] == "rx(0.125) q[1];");

        bool logged_placeholder = false;
        for (const auto& l : log.lines) {
            if (l.find(token) != std::string::npos) logged_placeholder = true;
        }
        CHECK(logged_placeholder);
    }

    TEST_CASE("metadata pragmas must be classified away first") {
        QasmBackend backend(BackendOptions{});
        Circuit c{ops::define_complex("psi", 2), ops::get_state_vector("psi")};
        CHECK_THROWS_AS(backend.circuit_to_qasm_str(c), qwire::UnsupportedOperationError);
        CHECK_NOTHROW(backend.circuit_to_qasm_str(qwire::sim::classify(c).emittable));
    }

    TEST_CASE("file output") {
        auto dir = fs::temp_directory_path() / "qwire_backend_test" / "nested";
        fs::remove_all(dir.parent_path());

        Circuit c{ops::define_bit("ro", 1), ops::hadamard(0), ops::measure_qubit(0, "ro", 0)};
        QasmBackend backend(BackendOptions{});
        auto path = backend.circuit_to_qasm_file(c, dir.string(), "bell", false);
        CHECK(fs::path(path) == dir / "bell.qasm");
        REQUIRE(fs::exists(path));
        CHECK(read_file(path) == backend.circuit_to_qasm_str(c));

        CHECK_THROWS_AS(backend.circuit_to_qasm_file(c, dir.string(), "bell", false), qwire::FileExistsError);

        Circuit other{ops::define_bit("ro", 1), ops::pauli_x(0), ops::measure_qubit(0, "ro", 0)};
        CHECK_NOTHROW(backend.circuit_to_qasm_file(other, dir.string(), "bell", true));
        CHECK(read_file(path).find("x q[0];") != std::string::npos);

        fs::remove_all(dir.parent_path());
    }
}
