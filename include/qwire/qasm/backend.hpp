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

#include <qwire/calculator/calculator.hpp>
#include <qwire/circuit/circuit.hpp>
#include <qwire/logging/logger.hpp>
#include <qwire/qasm/naming.hpp>
#include <qwire/qasm/symbolic_cache.hpp>

namespace qwire::qasm {

struct BackendOptions {
    std::size_t number_qubits{0};  // 0: highest qubit index used + 1
    std::string qureg_name{"q"};
    std::optional<QubitNameMap> qubit_names;
    bool use_symbolic{false};
    std::map<std::string, double> substitutions;
};

/**
 * Composes complete OpenQASM 2.0 documents:
 *
 *   OPENQASM 2.0;
 *   include "qelib1.inc";
 *
 *   qreg q[N];
 *   creg <register declarations>;
 *   <one statement per line>
 *
 * Register definitions are hoisted into the declaration block whatever
 * their position in the circuit. The circuit must already be stripped
 * of metadata pragmas (see sim::classify).
 */
class QasmBackend {
public:
    explicit QasmBackend(BackendOptions options);
    QasmBackend(BackendOptions options, logging::Logger& log);

    QasmBackend(const QasmBackend&) = delete;
    QasmBackend& operator=(const QasmBackend&) = delete;

    std::vector<std::string> circuit_to_qasm_lines(const circuit::Circuit& circuit);
    std::string circuit_to_qasm_str(const circuit::Circuit& circuit);

    // Writes <folder>/<filename>.qasm and returns the path. Throws
    // FileExistsError when the file exists and overwrite is false.
    std::string circuit_to_qasm_file(const circuit::Circuit& circuit, const std::string& folder,
                                     const std::string& filename, bool overwrite);

    // Placeholders staged by symbolic translations so far.
    const SymbolicCache& symbolic_cache() const { return cache_; }

    // Swaps placeholders for the values given by `values`.
    std::vector<std::string> bind_symbols(const std::vector<std::string>& lines,
                                          const calculator::Calculator& values) const;

    const BackendOptions& options() const { return opt_; }

private:
    calculator::Calculator make_calculator(const circuit::Circuit& circuit) const;

    BackendOptions opt_;
    logging::Logger& log_;
    SymbolicCache cache_;
};

} // namespace qwire::qasm
