/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <qwire/qasm/backend.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <fmt/format.h>

#include <qwire/errors.hpp>
#include <qwire/qasm/translator.hpp>

namespace qwire::qasm {

using namespace qwire::circuit;

static logging::Logger& null_logger() {
    static logging::NullLogger log;
    return log;
}

QasmBackend::QasmBackend(BackendOptions options)
    : QasmBackend(std::move(options), null_logger()) {}

QasmBackend::QasmBackend(BackendOptions options, logging::Logger& log)
    : opt_(std::move(options)), log_(log) {}

calculator::Calculator QasmBackend::make_calculator(const Circuit& circuit) const {
    calculator::Calculator calc(opt_.substitutions);
    for (const auto& instruction : circuit) {
        if (const auto* sym = std::get_if<InputSymbolic>(&instruction)) {
            if (!calc.contains(sym->name)) calc.set(sym->name, sym->value);
        }
    }
    return calc;
}

std::vector<std::string> QasmBackend::circuit_to_qasm_lines(const Circuit& circuit) {
    std::size_t used = circuit.number_qubits();
    std::size_t number_qubits = opt_.number_qubits > 0 ? opt_.number_qubits : std::max<std::size_t>(used, 1);
    if (used > number_qubits) {
        throw ValidationError(fmt::format("Circuit uses qubit {} but the register holds {} qubits",
                                          used - 1, number_qubits));
    }

    auto calc = make_calculator(circuit);
    TranslationOptions topt;
    topt.qubit_names = opt_.qubit_names;
    topt.calculator = &calc;
    topt.symbolic_cache = opt_.use_symbolic ? &cache_ : nullptr;
    topt.qureg_name = opt_.qureg_name;

    std::vector<std::string> declarations;
    std::vector<std::string> body;
    for (const auto& instruction : circuit) {
        auto& target = std::holds_alternative<Definition>(instruction) ? declarations : body;
        for (auto& line : call_operation(instruction, topt)) {
            line.push_back(';');
            target.push_back(std::move(line));
        }
    }

    std::vector<std::string> lines{
        "OPENQASM 2.0;",
        "include \"qelib1.inc\";",
        "",
        fmt::format("qreg {}[{}];", opt_.qureg_name, number_qubits),
    };
    lines.insert(lines.end(), declarations.begin(), declarations.end());
    lines.insert(lines.end(), body.begin(), body.end());

    log_.debug(fmt::format("Translated {} instruction(s) into {} QASM statement(s) on {} qubit(s)",
                           circuit.size(), declarations.size() + body.size(), number_qubits));
    if (opt_.use_symbolic) {
        for (const auto& [token, expression] : cache_.entries()) {
            log_.debug(fmt::format("Placeholder {} = {}", token, expression));
        }
    }
    return lines;
}

std::string QasmBackend::circuit_to_qasm_str(const Circuit& circuit) {
    std::string text;
    for (const auto& line : circuit_to_qasm_lines(circuit)) {
        text += line;
        text += '\n';
    }
    return text;
}

std::string QasmBackend::circuit_to_qasm_file(const Circuit& circuit, const std::string& folder,
                                              const std::string& filename, bool overwrite) {
    namespace fs = std::filesystem;
    fs::path dir = folder.empty() ? fs::path(".") : fs::path(folder);
    fs::path path = dir / (filename + ".qasm");
    if (fs::exists(path) && !overwrite) throw FileExistsError(path.string());

    std::string text = circuit_to_qasm_str(circuit);
    fs::create_directories(dir);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw Error("Cannot open output file: " + path.string());
    out << text;
    if (!out) throw Error("Failed writing output file: " + path.string());
    log_.info(fmt::format("Wrote {}", path.string()));
    return path.string();
}

std::vector<std::string> QasmBackend::bind_symbols(const std::vector<std::string>& lines,
                                                   const calculator::Calculator& values) const {
    return cache_.bind(lines, values);
}

} // namespace qwire::qasm
