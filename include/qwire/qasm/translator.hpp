/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <qwire/calculator/calculator.hpp>
#include <qwire/circuit/circuit.hpp>
#include <qwire/qasm/naming.hpp>
#include <qwire/qasm/symbolic_cache.hpp>

namespace qwire::qasm {

struct TranslationOptions {
    std::optional<QubitNameMap> qubit_names;            // default naming when absent
    const calculator::Calculator* calculator{nullptr};  // resolves symbolic parameters
    SymbolicCache* symbolic_cache{nullptr};             // symbolic mode when set
    std::string qureg_name{"q"};
};

/**
 * Translates one instruction into QASM statements without the trailing ';'.
 *
 * Most instructions give one line; a repeated measurement with a qubit
 * mapping gives one line per mapped qubit and InputSymbolic gives none.
 * Metadata pragmas and opaque instructions throw UnsupportedOperationError.
 */
std::vector<std::string> call_operation(const circuit::Instruction& instruction,
                                        const TranslationOptions& options = {});

// Whole circuit, in order, each statement terminated with ';'.
std::vector<std::string> call_circuit(const circuit::Circuit& circuit,
                                      const TranslationOptions& options = {});

} // namespace qwire::qasm
